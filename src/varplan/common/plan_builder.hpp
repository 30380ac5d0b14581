/**
 * @file plan_builder.hpp
 * @brief PlanBuilder turns variable declarations into a validated VariablePlan.
 */
#pragma once
#include "varplan/common/common.hpp"
#include "varplan/common/variable.hpp"
#include "varplan/common/variable_graph.hpp"
#include "varplan/execution/variable_plan.hpp"

namespace varplan
{

/**
 * @brief Exception thrown when plan validation fails at build().
 */
class PlanValidationError : public std::runtime_error
{
public:
    explicit PlanValidationError(const std::string& msg,
                                 std::shared_ptr<VariableGraphDiagnostics> diagnostics)
        : std::runtime_error(msg)
        , m_diagnostics(std::move(diagnostics))
    {}

    /**
     * @brief Get the diagnostics that caused the validation failure.
     */
    const std::shared_ptr<VariableGraphDiagnostics>& diagnostics() const noexcept
    {
        return m_diagnostics;
    }

private:
    std::shared_ptr<VariableGraphDiagnostics> m_diagnostics;
};

/**
 * @brief Collects variable declarations and produces a VariablePlan.
 *
 * @details
 * PlanBuilder is the entry point for callers that hold full declarations
 * rather than precomputed dependency maps. It extracts references from every
 * computed variable, validates the resulting graph and lays out the stages.
 *
 * @par Usage
 * 1. Create a PlanBuilder with eager or deferred validation.
 * 2. Add declarations via add_variable(), in dashboard order.
 * 3. Optionally inspect get_diagnostics() to report every problem at once.
 * 4. Call build() to validate and produce a VariablePlan.
 *
 * @par Validation
 * With eager validation, add_variable() rejects an empty or duplicated name
 * immediately. References are always checked at get_diagnostics() or
 * build() time, since a variable may reference one declared after it.
 *
 * @par Thread Safety
 * - No internal synchronization.
 * - Concurrent access requires external synchronization.
 */
class PlanBuilder
{
public:
    /**
     * @brief Construct a PlanBuilder.
     * @param eager_validation If true, validate names on each add_variable().
     */
    explicit PlanBuilder(bool eager_validation);

    /**
     * @brief Add a declaration.
     * @throw DuplicateVariableError in eager mode if the name is empty or
     *        already added.
     */
    void add_variable(VariableDeclaration declaration);

    /**
     * @brief Get the number of declarations added.
     */
    size_t variable_count() const noexcept { return m_variables.size(); }

    /**
     * @brief Collect every validation problem without building.
     *
     * @details
     * Reports, in order: invalid and duplicate names, every reference to an
     * undeclared name, then circular dependencies among the remaining edges.
     */
    std::shared_ptr<VariableGraphDiagnostics> get_diagnostics() const;

    /**
     * @brief Validate the declarations and produce a VariablePlan.
     *
     * @return Shared pointer to the plan.
     * @throws PlanValidationError if the declarations have validation errors.
     */
    std::shared_ptr<VariablePlan> build() const;

private:
    /**
     * @brief Extract references, keeping only edges to declared names.
     * @param diagnostics Receives one error per undefined reference.
     */
    DependencyMap collect_dependencies(VariableGraphDiagnostics& diagnostics) const;

    bool m_eager_validation{};
    std::vector<VariableDeclaration> m_variables{};

    /// First position of each name.
    std::unordered_map<std::string, VarIdx> m_index{};
};

} // namespace varplan
