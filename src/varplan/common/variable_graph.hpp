/**
 * @file variable_graph.hpp
 * @brief Dependency graph between variables and its stage-ordered build plan.
 */
#pragma once
#include "varplan/common/common.hpp"
#include "varplan/common/variable.hpp"
#include "varplan/common/variable_graph_diagnostics.hpp"
#include "varplan/common/variable_graph_exceptions.hpp"

namespace varplan
{

/**
 * @brief Directed graph of "variable depends on referenced variable" edges.
 *
 * @details
 * Nodes are the declared variable names; node `v` has an edge to `d` when
 * `v` references `d`, meaning `d` must be evaluated first. The graph is a
 * flat adjacency structure indexed by declaration position, with a
 * name-to-index map for lookup. It is built once from a declaration snapshot
 * and never mutated; a changed declaration set requires a new graph.
 *
 * @par Build order
 * `build_order()` assigns every variable a stage:
 * `stage(v) = 0` if `v` has no dependencies, otherwise
 * `stage(v) = 1 + max(stage(d))` over its dependencies. Stages are computed
 * by repeated passes over the unresolved variables: a pass resolves every
 * variable whose dependencies all lie in earlier stages. A pass that resolves
 * nothing while variables remain means the graph has a cycle.
 *
 * @par Thread safety
 * - No internal synchronization.
 * - All methods are const after construction; concurrent reads are safe.
 */
class VariableGraph
{
public:
    /**
     * @brief Construct and validate a graph.
     *
     * @param variables Declared names, in declaration order.
     * @param dependencies Referenced names per variable. Variables absent from
     *        the map have no dependencies. Entries for names that are not
     *        declared are ignored. Repeated names in a list collapse to one
     *        edge.
     *
     * @throw DuplicateVariableError if a name is empty or declared twice.
     * @throw UndefinedReferenceError for the first referenced name (in
     *        declaration order, then list order) with no declaration.
     */
    VariableGraph(std::vector<std::string> variables, const DependencyMap& dependencies);

    /**
     * @brief Get the number of declared variables.
     */
    size_t variable_count() const noexcept
    {
        return m_variables.size();
    }

    /**
     * @brief Get the declared names, in declaration order.
     */
    const std::vector<std::string>& variables() const noexcept
    {
        return m_variables;
    }

    /**
     * @brief Check whether a name is declared.
     */
    bool contains(const std::string& name) const;

    /**
     * @brief Get the distinct names a variable depends on.
     * @throw std::out_of_range if the name is not declared.
     */
    const std::vector<std::string>& dependencies_of(const std::string& name) const;

    /**
     * @brief Get the variables that depend directly on a variable.
     * @return Names in declaration order.
     * @throw std::out_of_range if the name is not declared.
     */
    std::vector<std::string> dependents_of(const std::string& name) const;

    /**
     * @brief Compute the stage index of every variable.
     * @return Stage per variable, indexed like `variables()`.
     * @throw CircularDependencyError if some variable cannot be staged.
     */
    std::vector<StageIdx> compute_stages() const;

    /**
     * @brief Compute the stage-ordered build plan.
     *
     * @return One group per stage. Every variable appears in exactly one
     *         group; members keep declaration order. An empty graph yields no
     *         groups.
     * @throw CircularDependencyError if the graph contains a cycle, including
     *        a variable that references itself.
     */
    std::vector<VariableGroup> build_order() const;

    /**
     * @brief Report cycles without throwing.
     * @return Diagnostics with one `CircularDependency` error naming every
     *         unresolved variable, or no errors if the graph is acyclic.
     */
    std::shared_ptr<VariableGraphDiagnostics> get_diagnostics() const;

    /// Stage value of a variable that could not be resolved.
    static constexpr StageIdx k_unresolved = std::numeric_limits<StageIdx>::max();

private:
    /// Fixed-point stage assignment; unresolved variables keep `k_unresolved`.
    std::vector<StageIdx> assign_stages() const;

    VarIdx index_of(const std::string& name) const;

    std::vector<std::string> m_variables;
    std::unordered_map<std::string, VarIdx> m_index;

    /// Distinct dependency names per variable, indexed by VarIdx.
    std::vector<std::vector<std::string>> m_dependency_names;

    /// Same edges as m_dependency_names, as indices.
    std::vector<std::vector<VarIdx>> m_dependencies;
};

// ============================================================================
// Operations on declarations
// ============================================================================

/**
 * @brief Derive the dependency map of a declaration list.
 *
 * @details
 * Computed variables are scanned with `extract_references()`; constant
 * variables contribute nothing. The result only contains variables with at
 * least one reference.
 *
 * @throw DuplicateVariableError if a name is empty or declared twice.
 * @throw UndefinedReferenceError for the first reference to an undeclared name.
 */
DependencyMap build_variable_dependencies(const std::vector<VariableDeclaration>& declarations);

/**
 * @brief Compute the build order of a declaration list.
 *
 * @details
 * Equivalent to `VariableGraph(names, build_variable_dependencies(...)).build_order()`.
 *
 * @throw DuplicateVariableError, UndefinedReferenceError, CircularDependencyError.
 */
std::vector<VariableGroup> build_variable_order(const std::vector<VariableDeclaration>& declarations);

} // namespace varplan
