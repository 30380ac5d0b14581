#include "varplan/execution/single_threaded_executor.hpp"

namespace varplan
{

SingleThreadedExecutor::SingleThreadedExecutor(ExecutorConfig config)
    : Executor(std::move(config))
{
    m_config.thread_count = 1;
}

void SingleThreadedExecutor::run_stage(const std::vector<VariableTask*>& tasks,
                                       IVariableEvaluator& evaluator)
{
    for (VariableTask* task : tasks)
    {
        task->run(evaluator, m_stop_requested);
    }
}

} // namespace varplan
