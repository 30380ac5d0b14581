/**
 * @file single_threaded_executor.hpp
 * @brief SingleThreadedExecutor for sequential variable evaluation.
 */
#pragma once
#include "varplan/execution/executor.hpp"

namespace varplan
{

/**
 * @brief Single-threaded executor for debugging and testing.
 *
 * @details
 * Evaluates the variables of each stage one after another, in declaration
 * order, on the calling thread. Useful for:
 * - Debugging evaluation issues without thread complexity
 * - Evaluators that are not thread-safe
 * - Reference behavior for verifying ThreadedExecutor
 *
 * @par Thread Safety
 * - execute() is not thread-safe; call from one thread only.
 * - request_stop() can be called from any thread, including from within
 *   an evaluator.
 */
class SingleThreadedExecutor : public Executor
{
public:
    /**
     * @brief Construct a single-threaded executor.
     * @param config Configuration (thread_count ignored, always 1).
     */
    explicit SingleThreadedExecutor(ExecutorConfig config = {});

protected:
    void run_stage(const std::vector<VariableTask*>& tasks,
                   IVariableEvaluator& evaluator) override;
};

/**
 * @brief Factory function to create a SingleThreadedExecutor.
 * @param config Configuration options.
 * @return Shared pointer to the executor.
 */
inline std::shared_ptr<SingleThreadedExecutor> make_single_threaded_executor(
    ExecutorConfig config = {})
{
    return std::make_shared<SingleThreadedExecutor>(std::move(config));
}

} // namespace varplan
