/**
 * @file execution_result.hpp
 * @brief Definition of ExecutionResult returned by IExecutor::execute().
 */
#pragma once
#include "varplan/common/common.hpp"
#include "varplan/common/variable.hpp"

namespace varplan
{

/**
 * @brief Result of evaluating a variable plan.
 *
 * @details
 * ExecutionResult captures the outcome of running a VariablePlan:
 * - Success/failure status
 * - Which variables failed and their errors
 * - Which variables were cancelled
 * - Timing information (if collected)
 *
 * Variable lists follow evaluation order: by stage, then declaration order.
 */
struct ExecutionResult
{
    /**
     * @brief Overall success status.
     * @details True if every variable was evaluated successfully.
     */
    bool success{true};

    /**
     * @brief Names of variables whose evaluation threw.
     */
    std::vector<std::string> failed_variables;

    /**
     * @brief Error messages for failed variables, parallel to failed_variables.
     */
    std::vector<std::string> error_messages;

    /**
     * @brief Names of variables that were never evaluated.
     */
    std::vector<std::string> cancelled_variables;

    /**
     * @brief Names of variables evaluated successfully.
     */
    std::vector<std::string> completed_variables;

    /**
     * @brief Number of stages that evaluated at least one variable.
     */
    size_t stages_run{0};

    /**
     * @brief Total execution duration (wall-clock time).
     */
    std::chrono::nanoseconds total_duration{0};

    /**
     * @brief Per-variable durations, indexed by VarIdx.
     * @details Only populated if timing collection is enabled.
     */
    std::vector<std::chrono::nanoseconds> durations;

    /**
     * @brief Check if execution was stopped by request.
     */
    bool stopped{false};

    /**
     * @brief Get a summary string for logging.
     */
    std::string summary() const
    {
        std::string result;
        if (success)
        {
            result = "Evaluation succeeded";
        }
        else if (stopped)
        {
            result = "Evaluation stopped by request";
        }
        else
        {
            result = "Evaluation failed";
        }
        result += " (stages=" + std::to_string(stages_run);
        result += ", completed=" + std::to_string(completed_variables.size());
        result += ", failed=" + std::to_string(failed_variables.size());
        result += ", cancelled=" + std::to_string(cancelled_variables.size()) + ")";
        return result;
    }
};

} // namespace varplan
