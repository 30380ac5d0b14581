/**
 * @file executor.hpp
 * @brief IExecutor interface and ExecutorConfig.
 */
#pragma once
#include "varplan/common/common.hpp"
#include "varplan/execution/execution_result.hpp"
#include "varplan/execution/variable_plan.hpp"
#include "varplan/execution/variable_task.hpp"

namespace varplan
{

/**
 * @brief Configuration for executor behavior.
 */
struct ExecutorConfig
{
    /**
     * @brief Number of worker threads per stage.
     * @details 0 means use std::thread::hardware_concurrency().
     *          1 means sequential evaluation.
     *          Ignored by SingleThreadedExecutor.
     */
    size_t thread_count{1};

    /**
     * @brief Whether to collect per-variable timing.
     */
    bool collect_timing{false};

    /**
     * @brief Whether to abort on first failure.
     * @details If true, every variable in later stages is cancelled once a
     *          stage has a failure. If false, only variables that depend
     *          (directly or transitively) on a failed variable are cancelled;
     *          independent paths continue evaluation.
     */
    bool abort_on_failure{true};
};

/**
 * @brief Interface for variable plan executors.
 *
 * @details
 * IExecutor defines the contract for evaluating a VariablePlan. Stages run
 * in order; every variable of a stage finishes, successfully or not, before
 * the next stage starts.
 *
 * @par Thread Safety
 * - execute() may be called from any thread, one call at a time.
 * - request_stop() may be called from any thread during execution.
 * - stop_requested() may be called from any thread.
 */
class IExecutor
{
public:
    virtual ~IExecutor() = default;

    /**
     * @brief Evaluate a plan.
     * @param plan The plan to run.
     * @param evaluator User code evaluating each variable.
     * @return ExecutionResult with outcome details.
     */
    virtual ExecutionResult execute(std::shared_ptr<const VariablePlan> plan,
                                    IVariableEvaluator& evaluator) = 0;

    /**
     * @brief Request graceful stop of execution.
     *
     * @details
     * Sets a flag that workers check. In-progress evaluations complete
     * normally; variables not yet started are cancelled. This is
     * cooperative, not preemptive.
     */
    virtual void request_stop() = 0;

    /**
     * @brief Check if stop has been requested.
     */
    virtual bool stop_requested() const noexcept = 0;
};

/**
 * @brief Base class for Executor implementations.
 *
 * @details
 * Provides the stage loop shared by all executors:
 * - Stop request handling
 * - VariableTask creation
 * - Cancellation of variables behind a failure
 * - Result building
 *
 * Derived classes implement run_stage(), which evaluates the runnable
 * variables of one stage and returns once all of them have finished.
 */
class Executor : public IExecutor
{
public:
    explicit Executor(ExecutorConfig config);
    virtual ~Executor() = default;

    ExecutionResult execute(std::shared_ptr<const VariablePlan> plan,
                            IVariableEvaluator& evaluator) override;

    void request_stop() override;
    bool stop_requested() const noexcept override;

    const ExecutorConfig& config() const noexcept
    {
        return m_config;
    }

protected:
    /**
     * @brief Evaluate the runnable tasks of one stage.
     * @param tasks Tasks whose dependencies have all succeeded.
     * @param evaluator User evaluation code.
     * @post Every task is in a terminal state.
     */
    virtual void run_stage(const std::vector<VariableTask*>& tasks,
                           IVariableEvaluator& evaluator) = 0;

    ExecutorConfig m_config;
    std::atomic<bool> m_stop_requested{false};

private:
    ExecutionResult build_result(const VariablePlan& plan,
                                 const std::vector<VariableTaskPtr>& tasks) const;
};

} // namespace varplan
