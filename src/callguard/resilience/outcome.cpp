#include "callguard/resilience/outcome.inline.hpp"
#include "callguard/resilience/fault_locator.hpp"
#include <fmt/format.h>
#include <ostream>

namespace callguard
{

std::optional<std::string> OutcomeBase::fault_message() const
{
    if (!m_fault)
    {
        return std::nullopt;
    }
    return m_fault->message;
}

std::optional<std::string> OutcomeBase::fault_kind() const
{
    if (!m_fault)
    {
        return std::nullopt;
    }
    return m_fault->kind;
}

void OutcomeBase::rethrow_if_fault() const
{
    if (m_exception)
    {
        std::rethrow_exception(m_exception);
    }
}

OutcomeInfo OutcomeBase::info() const
{
    OutcomeInfo result;
    result.success = m_succeeded;
    result.elapsed_ms = to_millis(m_elapsed);
    result.started_at = m_started_at;
    result.ended_at = m_ended_at;
    for (const auto& [key, value] : m_metadata)
    {
        result.metadata_keys.push_back(key);
    }
    if (m_fault)
    {
        result.error = m_fault->message;
        result.error_kind = m_fault->kind;
    }
    return result;
}

std::string OutcomeBase::summary() const
{
    if (m_succeeded)
    {
        auto result = describe_result();
        if (!result)
        {
            return fmt::format("Outcome[succeeded] - elapsed: {:.6f}ms", to_millis(m_elapsed));
        }
        return fmt::format("Outcome[succeeded] - elapsed: {:.6f}ms, result: {}", to_millis(m_elapsed), *result);
    }
    return fmt::format("Outcome[failed] - elapsed: {:.6f}ms, error: {}: {}",
                       to_millis(m_elapsed),
                       m_fault ? m_fault->kind : std::string{"unknown"},
                       m_fault ? m_fault->message : std::string{});
}

void OutcomeBase::record_timing(IClock::time_point start, IClock::time_point end) noexcept
{
    m_started_at = start;
    m_ended_at = end;
    auto elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start);
    m_elapsed = std::max(elapsed, kMinElapsed);
}

void OutcomeBase::record_fault(std::exception_ptr fault, const std::string& label, ILogSink& sink)
{
    // Skip the raise_traced frame so the location names the raising function.
    auto located = locate(fault, 1);

    FaultInfo info;
    info.kind = callguard::fault_kind(fault);
    info.message = callguard::fault_message(fault);
    info.location = located.location;
    info.trace = located.trace;

    while (!info.trace.empty() && info.trace.back() == '\n')
    {
        info.trace.pop_back();
    }

    sink.log(LogLevel::Error,
             fmt::format("[{}] execution of '{}' failed\n{}", info.location, label, info.trace));

    m_exception = std::move(fault);
    m_fault = std::move(info);
}

void OutcomeBase::clear_shared_state(ILogSink& sink) noexcept
{
    m_fault.reset();
    m_exception = nullptr;
    m_metadata.clear();
    sink.log(LogLevel::Debug, "outcome cleared: value, fault and metadata released");
}

std::ostream& operator<<(std::ostream& os, const OutcomeBase& outcome)
{
    return os << outcome.summary();
}

} // namespace callguard
