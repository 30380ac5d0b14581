/**
 * @file threaded_executor.hpp
 * @brief ThreadedExecutor evaluating the variables of a stage concurrently.
 */
#pragma once
#include "varplan/execution/executor.hpp"

namespace varplan
{

/**
 * @brief Executor that evaluates each stage on a group of worker threads.
 *
 * @details
 * For every stage, up to `thread_count` workers are started (never more
 * than the stage has variables). Workers pull tasks from a shared atomic
 * cursor until the stage is drained, then the stage is joined before the
 * next one starts.
 *
 * @par Thread Safety
 * - execute() is not thread-safe; call from one thread only.
 * - The evaluator must tolerate concurrent evaluate() calls.
 * - request_stop() can be called from any thread.
 */
class ThreadedExecutor : public Executor
{
public:
    /**
     * @brief Construct a threaded executor.
     * @param config Configuration; thread_count 0 means hardware concurrency.
     */
    explicit ThreadedExecutor(ExecutorConfig config = {});

    /**
     * @brief Get the resolved number of worker threads per stage.
     */
    size_t worker_count() const noexcept
    {
        return m_worker_count;
    }

protected:
    void run_stage(const std::vector<VariableTask*>& tasks,
                   IVariableEvaluator& evaluator) override;

private:
    size_t m_worker_count{1};
};

/**
 * @brief Factory function to create a ThreadedExecutor.
 * @param config Configuration options.
 * @return Shared pointer to the executor.
 */
inline std::shared_ptr<ThreadedExecutor> make_threaded_executor(ExecutorConfig config = {})
{
    return std::make_shared<ThreadedExecutor>(std::move(config));
}

} // namespace varplan
