#include "varplan/execution/executor.hpp"

namespace varplan
{

Executor::Executor(ExecutorConfig config)
    : m_config{std::move(config)}
{}

void Executor::request_stop()
{
    m_stop_requested.store(true, std::memory_order_release);
}

bool Executor::stop_requested() const noexcept
{
    return m_stop_requested.load(std::memory_order_acquire);
}

ExecutionResult Executor::execute(std::shared_ptr<const VariablePlan> plan,
                                  IVariableEvaluator& evaluator)
{
    auto start_time = std::chrono::steady_clock::now();

    // Create one task per variable, indexed by VarIdx
    std::vector<VariableTaskPtr> tasks;
    tasks.reserve(plan->variable_count());
    for (VarIdx vidx = 0; vidx < plan->variable_count(); ++vidx)
    {
        tasks.push_back(std::make_unique<VariableTask>(plan->variables[vidx], vidx));
    }

    size_t stages_run = 0;
    bool aborted = false;
    for (const auto& stage : plan->stages)
    {
        std::vector<VariableTask*> runnable;
        runnable.reserve(stage.size());

        for (VarIdx vidx : stage)
        {
            VariableTask& task = *tasks[vidx];
            if (aborted || stop_requested())
            {
                task.cancel();
                continue;
            }

            // Stages run in order, so every dependency is already terminal.
            bool dependencies_ok = true;
            for (VarIdx dep : plan->dependencies[vidx])
            {
                if (tasks[dep]->state() != VariableState::Succeeded)
                {
                    dependencies_ok = false;
                    break;
                }
            }
            if (!dependencies_ok)
            {
                task.cancel();
                continue;
            }
            runnable.push_back(&task);
        }

        if (runnable.empty())
        {
            continue;
        }

        run_stage(runnable, evaluator);
        ++stages_run;

        if (m_config.abort_on_failure)
        {
            for (const VariableTask* task : runnable)
            {
                if (task->state() == VariableState::Failed)
                {
                    aborted = true;
                    break;
                }
            }
        }
    }

    auto result = build_result(*plan, tasks);
    result.stages_run = stages_run;

    auto end_time = std::chrono::steady_clock::now();
    result.total_duration = std::chrono::duration_cast<std::chrono::nanoseconds>(
        end_time - start_time);
    return result;
}

ExecutionResult Executor::build_result(const VariablePlan& plan,
                                       const std::vector<VariableTaskPtr>& tasks) const
{
    ExecutionResult result;
    result.stopped = stop_requested();

    if (m_config.collect_timing)
    {
        result.durations.resize(plan.variable_count(), std::chrono::nanoseconds{0});
    }

    for (const auto& stage : plan.stages)
    {
        for (VarIdx vidx : stage)
        {
            const VariableTask& task = *tasks[vidx];
            const std::string& name = task.variable().name;

            switch (task.state())
            {
                case VariableState::Succeeded:
                    result.completed_variables.push_back(name);
                    if (m_config.collect_timing)
                    {
                        result.durations[vidx] = task.duration();
                    }
                    break;

                case VariableState::Failed:
                    result.success = false;
                    result.failed_variables.push_back(name);
                    result.error_messages.push_back(task.error_message());
                    if (m_config.collect_timing)
                    {
                        result.durations[vidx] = task.duration();
                    }
                    break;

                case VariableState::Cancelled:
                case VariableState::Pending:
                    result.success = false;
                    result.cancelled_variables.push_back(name);
                    break;

                case VariableState::Running:
                    // Should not happen: run_stage() returns after all tasks finish
                    result.success = false;
                    result.failed_variables.push_back(name);
                    result.error_messages.push_back("Variable stuck in Running state");
                    break;
            }
        }
    }

    return result;
}

} // namespace varplan
