#include "varplan/common/plan_builder.hpp"
#include "varplan/common/reference_extractor.hpp"
#include <algorithm>
#include <sstream>

namespace varplan
{

PlanBuilder::PlanBuilder(bool eager_validation)
    : m_eager_validation{eager_validation}
    , m_variables{}
    , m_index{}
{}

void PlanBuilder::add_variable(VariableDeclaration declaration)
{
    const VarIdx vidx = m_variables.size();
    if (declaration.name.empty())
    {
        if (m_eager_validation)
        {
            throw DuplicateVariableError(
                VariableGraphErrorCode::InvalidName, declaration.name,
                "variable at position " + std::to_string(vidx) + " has an empty name");
        }
    }
    else if (!m_index.emplace(declaration.name, vidx).second && m_eager_validation)
    {
        throw DuplicateVariableError(
            VariableGraphErrorCode::DuplicateVariable, declaration.name,
            "variable \"" + declaration.name + "\" is declared more than once");
    }
    m_variables.push_back(std::move(declaration));
}

DependencyMap PlanBuilder::collect_dependencies(VariableGraphDiagnostics& diagnostics) const
{
    DependencyMap result;
    for (VarIdx vidx = 0; vidx < m_variables.size(); ++vidx)
    {
        const auto& decl = m_variables[vidx];
        if (decl.kind != VariableKind::Computed || decl.name.empty())
        {
            continue;
        }
        // A duplicated name keeps the edges of its first declaration.
        if (m_index.at(decl.name) != vidx)
        {
            continue;
        }

        std::vector<std::string> declared_refs;
        for (auto& ref : extract_references(decl.spec))
        {
            if (m_index.count(ref) == 0)
            {
                UndefinedReferenceError error{ref, decl.name};
                diagnostics.add_error(DiagnosticCategory::UndefinedReference,
                                      error.what(), {decl.name, ref});
                continue;
            }
            declared_refs.push_back(std::move(ref));
        }
        if (!declared_refs.empty())
        {
            result.emplace(decl.name, std::move(declared_refs));
        }
    }
    return result;
}

std::shared_ptr<VariableGraphDiagnostics> PlanBuilder::get_diagnostics() const
{
    auto diagnostics = std::make_shared<VariableGraphDiagnostics>();

    // Step 1: names
    std::vector<std::string> unique_names;
    unique_names.reserve(m_variables.size());
    for (VarIdx vidx = 0; vidx < m_variables.size(); ++vidx)
    {
        const std::string& name = m_variables[vidx].name;
        if (name.empty())
        {
            diagnostics->add_error(
                DiagnosticCategory::InvalidName,
                "variable at position " + std::to_string(vidx) + " has an empty name");
        }
        else if (m_index.at(name) != vidx)
        {
            diagnostics->add_error(
                DiagnosticCategory::DuplicateVariable,
                "variable \"" + name + "\" is declared more than once", {name});
        }
        else
        {
            unique_names.push_back(name);
        }
    }

    // Step 2: references
    auto dependencies = collect_dependencies(*diagnostics);

    // Step 3: cycles among the edges that survived
    VariableGraph graph{std::move(unique_names), dependencies};
    diagnostics->merge(*graph.get_diagnostics());

    return diagnostics;
}

std::shared_ptr<VariablePlan> PlanBuilder::build() const
{
    // Step 1: Validate everything up front so the caller sees all errors
    auto diagnostics = get_diagnostics();
    if (diagnostics->has_errors())
    {
        std::ostringstream oss;
        oss << "Plan validation failed with " << diagnostics->errors().size() << " error(s):\n";
        for (const auto& err : diagnostics->errors())
        {
            oss << "  - " << err.message << "\n";
        }
        throw PlanValidationError(oss.str(), diagnostics);
    }

    // Step 2: Build the graph and assign stages
    std::vector<std::string> names;
    names.reserve(m_variables.size());
    for (const auto& decl : m_variables)
    {
        names.push_back(decl.name);
    }
    VariableGraphDiagnostics unused;
    auto dependencies = collect_dependencies(unused);
    VariableGraph graph{names, dependencies};

    auto plan = std::make_shared<VariablePlan>();
    plan->variables = m_variables;
    plan->stage_of = graph.compute_stages();

    // Step 3: Group variables by stage, in declaration order
    StageIdx stage_count = 0;
    for (StageIdx stage : plan->stage_of)
    {
        stage_count = std::max(stage_count, stage + 1);
    }
    plan->stages.resize(stage_count);
    for (VarIdx vidx = 0; vidx < names.size(); ++vidx)
    {
        plan->stages[plan->stage_of[vidx]].push_back(vidx);
    }

    // Step 4: Dependency and dependent lists as indices
    plan->dependencies.resize(names.size());
    plan->dependents.resize(names.size());
    for (VarIdx vidx = 0; vidx < names.size(); ++vidx)
    {
        for (const auto& dep_name : graph.dependencies_of(names[vidx]))
        {
            VarIdx dep = m_index.at(dep_name);
            plan->dependencies[vidx].push_back(dep);
            plan->dependents[dep].push_back(vidx);
        }
    }

    return plan;
}

} // namespace varplan
