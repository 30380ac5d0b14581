#include "varplan/execution/variable_task.hpp"

namespace varplan
{

VariableTask::VariableTask(const VariableDeclaration& variable, VarIdx var_idx)
    : m_variable{variable}
    , m_var_idx{var_idx}
{}

void VariableTask::run(IVariableEvaluator& evaluator, const std::atomic<bool>& stop_requested)
{
    // Check stop request before starting
    if (stop_requested.load(std::memory_order_acquire))
    {
        cancel();
        return;
    }

    VariableState expected = VariableState::Pending;
    if (!m_state.compare_exchange_strong(expected, VariableState::Running,
                                          std::memory_order_acq_rel))
    {
        // Already cancelled or run
        return;
    }

    auto start_time = std::chrono::steady_clock::now();

    try
    {
        evaluator.evaluate(m_variable);
        m_state.store(VariableState::Succeeded, std::memory_order_release);
    }
    catch (...)
    {
        m_exception = std::current_exception();
        m_state.store(VariableState::Failed, std::memory_order_release);
    }

    auto end_time = std::chrono::steady_clock::now();
    m_duration = std::chrono::duration_cast<std::chrono::nanoseconds>(end_time - start_time);
}

bool VariableTask::cancel()
{
    VariableState expected = VariableState::Pending;
    if (m_state.compare_exchange_strong(expected, VariableState::Cancelled,
                                         std::memory_order_acq_rel))
    {
        return true;
    }
    return expected == VariableState::Cancelled;
}

std::string VariableTask::error_message() const
{
    if (state() != VariableState::Failed)
    {
        return {};
    }
    if (!m_exception)
    {
        return "Unknown error";
    }
    try
    {
        std::rethrow_exception(m_exception);
    }
    catch (const std::exception& e)
    {
        return e.what();
    }
    catch (...)
    {
        return "Unknown exception";
    }
}

} // namespace varplan
