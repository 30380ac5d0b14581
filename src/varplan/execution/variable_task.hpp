/**
 * @file variable_task.hpp
 * @brief VariableTask wraps one variable evaluation with state and timing.
 */
#pragma once
#include "varplan/common/common.hpp"
#include "varplan/common/variable.hpp"

namespace varplan
{

/**
 * @brief Evaluation state of a variable during plan execution.
 */
enum class VariableState
{
    Pending,    ///< Not started yet.
    Running,    ///< evaluate() in progress.
    Succeeded,  ///< evaluate() returned normally.
    Failed,     ///< evaluate() threw.
    Cancelled   ///< Never evaluated (stop request or failed dependency).
};

/**
 * @brief User code that computes the value of a variable.
 *
 * @details
 * Implementations typically run the variable's plugin, e.g. execute its query
 * against a data source, and store the value where dependents can read it.
 * Failure is signalled by throwing; the exception is captured by the
 * executor and reported in ExecutionResult.
 *
 * @par Thread Safety
 * - ThreadedExecutor calls evaluate() concurrently for variables of the same
 *   stage. Implementations used with it must be safe for that.
 * - Calls for variables of different stages never overlap.
 */
class IVariableEvaluator
{
public:
    virtual ~IVariableEvaluator() = default;

    /**
     * @brief Evaluate one variable. All its dependencies have succeeded.
     * @throws Any exception to indicate failure.
     */
    virtual void evaluate(const VariableDeclaration& variable) = 0;
};

/**
 * @brief Wraps one variable for evaluation with pre/post bookkeeping.
 *
 * @details
 * VariableTask is the unit of work handed to executor workers. It handles:
 * - Pre-execution: stop check, state transition, timing start
 * - User code execution: calling evaluator.evaluate()
 * - Post-execution: state transition, timing, exception capture
 *
 * @par Thread Safety
 * - State uses an atomic.
 * - Exception and duration are written once by the thread running the task
 *   and read after the stage has been joined.
 */
class VariableTask
{
public:
    /**
     * @brief Construct a VariableTask.
     * @param variable The declaration to evaluate. Must outlive the task.
     * @param var_idx Index of this variable in the plan.
     */
    VariableTask(const VariableDeclaration& variable, VarIdx var_idx);

    // Non-copyable, non-movable
    VariableTask(const VariableTask&) = delete;
    VariableTask(VariableTask&&) = delete;
    VariableTask& operator=(const VariableTask&) = delete;
    VariableTask& operator=(VariableTask&&) = delete;

    /**
     * @brief Evaluate the variable.
     *
     * @details
     * 1. If a stop was requested, transition to Cancelled and return
     * 2. Transition Pending -> Running
     * 3. Call evaluator.evaluate()
     * 4. Capture any exception, transition to Succeeded/Failed
     *
     * @param evaluator User evaluation code.
     * @param stop_requested Executor stop flag.
     */
    void run(IVariableEvaluator& evaluator, const std::atomic<bool>& stop_requested);

    /**
     * @brief Mark this task as cancelled if it has not started.
     * @return True if the task is now Cancelled.
     */
    bool cancel();

    VariableState state() const noexcept
    {
        return m_state.load(std::memory_order_acquire);
    }

    /**
     * @brief Get the captured exception (if Failed).
     */
    std::exception_ptr exception() const noexcept
    {
        return m_exception;
    }

    /**
     * @brief Get the error message of the captured exception.
     * @return Empty string if not failed.
     */
    std::string error_message() const;

    /**
     * @brief Get evaluation duration, or zero if not run.
     */
    std::chrono::nanoseconds duration() const noexcept
    {
        return m_duration;
    }

    const VariableDeclaration& variable() const noexcept
    {
        return m_variable;
    }

    VarIdx var_idx() const noexcept
    {
        return m_var_idx;
    }

private:
    const VariableDeclaration& m_variable;
    VarIdx m_var_idx;

    std::atomic<VariableState> m_state{VariableState::Pending};

    // Results (written once after execution)
    std::exception_ptr m_exception{};
    std::chrono::nanoseconds m_duration{0};
};

using VariableTaskPtr = std::unique_ptr<VariableTask>;

} // namespace varplan
