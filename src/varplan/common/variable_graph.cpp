/**
 * @file variable_graph.cpp
 */
#include "varplan/common/variable_graph.hpp"
#include "varplan/common/reference_extractor.hpp"
#include <algorithm>

namespace varplan
{

namespace
{

void check_names(const std::vector<std::string>& names,
                 std::unordered_map<std::string, VarIdx>& index)
{
    index.reserve(names.size());
    for (VarIdx vidx = 0; vidx < names.size(); ++vidx)
    {
        const std::string& name = names[vidx];
        if (name.empty())
        {
            throw DuplicateVariableError(
                VariableGraphErrorCode::InvalidName, name,
                "variable at position " + std::to_string(vidx) + " has an empty name");
        }
        if (!index.emplace(name, vidx).second)
        {
            throw DuplicateVariableError(
                VariableGraphErrorCode::DuplicateVariable, name,
                "variable \"" + name + "\" is declared more than once");
        }
    }
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

VariableGraph::VariableGraph(std::vector<std::string> variables, const DependencyMap& dependencies)
    : m_variables{std::move(variables)}
{
    check_names(m_variables, m_index);

    const size_t count = m_variables.size();
    m_dependency_names.resize(count);
    m_dependencies.resize(count);

    for (VarIdx vidx = 0; vidx < count; ++vidx)
    {
        auto it = dependencies.find(m_variables[vidx]);
        if (it == dependencies.end())
        {
            continue;
        }

        std::unordered_set<VarIdx> seen;
        for (const auto& dep_name : it->second)
        {
            auto dep_it = m_index.find(dep_name);
            if (dep_it == m_index.end())
            {
                throw UndefinedReferenceError(dep_name, m_variables[vidx]);
            }
            if (seen.insert(dep_it->second).second)
            {
                m_dependency_names[vidx].push_back(dep_name);
                m_dependencies[vidx].push_back(dep_it->second);
            }
        }
    }
}

// ============================================================================
// Queries
// ============================================================================

bool VariableGraph::contains(const std::string& name) const
{
    return m_index.count(name) > 0;
}

VarIdx VariableGraph::index_of(const std::string& name) const
{
    auto it = m_index.find(name);
    if (it == m_index.end())
    {
        throw std::out_of_range("variable \"" + name + "\" is not declared");
    }
    return it->second;
}

const std::vector<std::string>& VariableGraph::dependencies_of(const std::string& name) const
{
    return m_dependency_names[index_of(name)];
}

std::vector<std::string> VariableGraph::dependents_of(const std::string& name) const
{
    const VarIdx target = index_of(name);
    std::vector<std::string> result;
    for (VarIdx vidx = 0; vidx < m_variables.size(); ++vidx)
    {
        for (VarIdx dep : m_dependencies[vidx])
        {
            if (dep == target)
            {
                result.push_back(m_variables[vidx]);
                break;
            }
        }
    }
    return result;
}

// ============================================================================
// Build order
// ============================================================================

std::vector<StageIdx> VariableGraph::assign_stages() const
{
    const size_t count = m_variables.size();
    std::vector<StageIdx> stages(count, k_unresolved);

    std::vector<VarIdx> pending(count);
    for (VarIdx vidx = 0; vidx < count; ++vidx)
    {
        pending[vidx] = vidx;
    }

    StageIdx current = 0;
    while (!pending.empty())
    {
        std::vector<VarIdx> ready;
        std::vector<VarIdx> blocked;

        // Only stages assigned by earlier passes count, so every variable
        // resolved in this pass lands in the same stage.
        for (VarIdx vidx : pending)
        {
            bool resolvable = true;
            for (VarIdx dep : m_dependencies[vidx])
            {
                if (stages[dep] == k_unresolved)
                {
                    resolvable = false;
                    break;
                }
            }
            (resolvable ? ready : blocked).push_back(vidx);
        }

        if (ready.empty())
        {
            break;
        }

        for (VarIdx vidx : ready)
        {
            stages[vidx] = current;
        }
        pending = std::move(blocked);
        ++current;
    }

    return stages;
}

std::vector<StageIdx> VariableGraph::compute_stages() const
{
    auto stages = assign_stages();
    for (StageIdx stage : stages)
    {
        if (stage == k_unresolved)
        {
            throw CircularDependencyError{};
        }
    }
    return stages;
}

std::vector<VariableGroup> VariableGraph::build_order() const
{
    const auto stages = compute_stages();

    StageIdx stage_count = 0;
    for (StageIdx stage : stages)
    {
        stage_count = std::max(stage_count, stage + 1);
    }

    std::vector<VariableGroup> groups(stage_count);
    for (VarIdx vidx = 0; vidx < m_variables.size(); ++vidx)
    {
        groups[stages[vidx]].variables.push_back(m_variables[vidx]);
    }
    return groups;
}

std::shared_ptr<VariableGraphDiagnostics> VariableGraph::get_diagnostics() const
{
    auto diagnostics = std::make_shared<VariableGraphDiagnostics>();

    const auto stages = assign_stages();
    std::vector<std::string> unresolved;
    for (VarIdx vidx = 0; vidx < m_variables.size(); ++vidx)
    {
        if (stages[vidx] == k_unresolved)
        {
            unresolved.push_back(m_variables[vidx]);
        }
    }

    if (!unresolved.empty())
    {
        std::string message = "circular dependency detected; unresolved variables:";
        for (const auto& name : unresolved)
        {
            message += " " + name;
        }
        diagnostics->add_error(DiagnosticCategory::CircularDependency,
                               std::move(message), std::move(unresolved));
    }

    return diagnostics;
}

// ============================================================================
// Operations on declarations
// ============================================================================

DependencyMap build_variable_dependencies(const std::vector<VariableDeclaration>& declarations)
{
    std::vector<std::string> names;
    names.reserve(declarations.size());
    for (const auto& decl : declarations)
    {
        names.push_back(decl.name);
    }

    std::unordered_map<std::string, VarIdx> index;
    check_names(names, index);

    DependencyMap result;
    for (const auto& decl : declarations)
    {
        if (decl.kind != VariableKind::Computed)
        {
            continue;
        }

        auto references = extract_references(decl.spec);
        for (const auto& ref : references)
        {
            if (index.count(ref) == 0)
            {
                throw UndefinedReferenceError(ref, decl.name);
            }
        }
        if (!references.empty())
        {
            result.emplace(decl.name, std::move(references));
        }
    }
    return result;
}

std::vector<VariableGroup> build_variable_order(const std::vector<VariableDeclaration>& declarations)
{
    auto dependencies = build_variable_dependencies(declarations);

    std::vector<std::string> names;
    names.reserve(declarations.size());
    for (const auto& decl : declarations)
    {
        names.push_back(decl.name);
    }

    VariableGraph graph{std::move(names), dependencies};
    return graph.build_order();
}

} // namespace varplan
