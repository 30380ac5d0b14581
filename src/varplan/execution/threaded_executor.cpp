#include "varplan/execution/threaded_executor.hpp"
#include <algorithm>
#include <system_error>
#include <thread>

namespace varplan
{

ThreadedExecutor::ThreadedExecutor(ExecutorConfig config)
    : Executor(std::move(config))
{
    m_worker_count = m_config.thread_count;
    if (m_worker_count == 0)
    {
        m_worker_count = std::max<size_t>(1, std::thread::hardware_concurrency());
    }
}

void ThreadedExecutor::run_stage(const std::vector<VariableTask*>& tasks,
                                 IVariableEvaluator& evaluator)
{
    const size_t worker_count = std::min(m_worker_count, tasks.size());
    if (worker_count <= 1)
    {
        for (VariableTask* task : tasks)
        {
            task->run(evaluator, m_stop_requested);
        }
        return;
    }

    std::atomic<size_t> next{0};
    auto worker = [&]() {
        for (size_t i = next.fetch_add(1, std::memory_order_relaxed); i < tasks.size();
             i = next.fetch_add(1, std::memory_order_relaxed))
        {
            tasks[i]->run(evaluator, m_stop_requested);
        }
    };

    std::vector<std::thread> threads;
    threads.reserve(worker_count);
    try
    {
        for (size_t w = 0; w < worker_count; ++w)
        {
            threads.emplace_back(worker);
        }
    }
    catch (const std::system_error&)
    {
        // Could not start every worker: the ones running drain the stage.
        if (threads.empty())
        {
            worker();
        }
    }

    for (auto& thread : threads)
    {
        thread.join();
    }
}

} // namespace varplan
