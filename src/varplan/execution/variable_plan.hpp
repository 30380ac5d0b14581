/**
 * @file variable_plan.hpp
 * @brief Definition of VariablePlan, the validated stage plan handed to executors.
 */
#pragma once
#include "varplan/common/common.hpp"
#include "varplan/common/variable.hpp"

namespace varplan
{

/**
 * @brief Immutable evaluation plan produced by PlanBuilder::build().
 *
 * @details
 * VariablePlan contains everything a scheduler needs to evaluate a validated
 * set of variables:
 * - The declarations, in declaration order (indexed by VarIdx)
 * - The stages, each a list of variables that may run concurrently
 * - Per-variable stage index, dependencies and dependents
 *
 * @par Thread Safety
 * - Once constructed, the structure is immutable.
 * - Concurrent reads are safe.
 * - Evaluation state is tracked by the executor, not here.
 */
struct VariablePlan
{
    /**
     * @brief Declarations indexed by VarIdx.
     */
    std::vector<VariableDeclaration> variables;

    /**
     * @brief Variable indices per stage.
     *
     * @details
     * Stage i must complete before stage i + 1 starts. Members of a stage
     * keep declaration order.
     */
    std::vector<std::vector<VarIdx>> stages;

    /**
     * @brief Stage index of each variable, indexed by VarIdx.
     */
    std::vector<StageIdx> stage_of;

    /**
     * @brief Distinct dependencies of each variable, indexed by VarIdx.
     */
    std::vector<std::vector<VarIdx>> dependencies;

    /**
     * @brief Variables depending directly on each variable, indexed by VarIdx.
     */
    std::vector<std::vector<VarIdx>> dependents;

    size_t variable_count() const noexcept
    {
        return variables.size();
    }

    size_t stage_count() const noexcept
    {
        return stages.size();
    }

    /**
     * @brief Find a variable by name.
     * @throw std::out_of_range if the name is not in the plan.
     */
    VarIdx index_of(const std::string& name) const
    {
        for (VarIdx vidx = 0; vidx < variables.size(); ++vidx)
        {
            if (variables[vidx].name == name)
            {
                return vidx;
            }
        }
        throw std::out_of_range("variable \"" + name + "\" is not in the plan");
    }

    /**
     * @brief Get the stages as groups of names.
     */
    std::vector<VariableGroup> stage_names() const
    {
        std::vector<VariableGroup> groups(stages.size());
        for (StageIdx s = 0; s < stages.size(); ++s)
        {
            groups[s].variables.reserve(stages[s].size());
            for (VarIdx vidx : stages[s])
            {
                groups[s].variables.push_back(variables[vidx].name);
            }
        }
        return groups;
    }
};

} // namespace varplan
