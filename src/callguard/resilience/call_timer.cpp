#include "callguard/resilience/call_timer.hpp"
#include <fmt/format.h>

namespace callguard
{

namespace detail
{

void log_call_started(ILogSink& sink, const std::string& label)
{
    sink.log(LogLevel::Info, fmt::format("starting '{}'", label));
}

void log_call_finished(ILogSink& sink, const std::string& label,
                       std::chrono::nanoseconds elapsed, bool faulted)
{
    try
    {
        sink.log(LogLevel::Info,
                 fmt::format("'{}' {} in {:.2f}ms ({:.4f}s)",
                             label, faulted ? "failed" : "finished",
                             to_millis(elapsed), to_millis(elapsed) / 1000.0));
    }
    catch (const std::exception&)
    {
        // Called during unwinding; a lost timing entry is acceptable.
    }
}

} // namespace detail

} // namespace callguard
