#include "callguard/resilience/timeout_guard.hpp"
#include "callguard/common/callguard_errors.hpp"
#include "callguard/resilience/fault_locator.hpp"
#include <algorithm>

namespace callguard
{

void validate(const TimeoutConfig& config)
{
    if (config.limit.count() < 0)
    {
        throw CallGuardError{CallGuardErrorCode::InvalidPolicy,
                             fmt::format("timeout limit must not be negative (got {}ms)",
                                         config.limit.count())};
    }
    if (config.poll_slice.count() < 0)
    {
        throw CallGuardError{CallGuardErrorCode::InvalidPolicy,
                             fmt::format("timeout poll_slice must not be negative (got {}ms)",
                                         config.poll_slice.count())};
    }
}

const char* to_string(TimedStatus status) noexcept
{
    switch (status)
    {
        case TimedStatus::Completed:
            return "Completed";
        case TimedStatus::Faulted:
            return "Faulted";
        case TimedStatus::TimedOut:
            return "TimedOut";
    }
    return "Unknown";
}

void AbandonedWorkers::adopt(std::shared_ptr<detail::WorkerSignal> worker)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_workers.erase(
        std::remove_if(m_workers.begin(), m_workers.end(),
                       [](const std::shared_ptr<detail::WorkerSignal>& w) {
                           std::lock_guard<std::mutex> worker_lock(w->mutex);
                           return w->done;
                       }),
        m_workers.end());
    m_workers.push_back(std::move(worker));
}

std::size_t AbandonedWorkers::pending() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::size_t count = 0;
    for (const auto& worker : m_workers)
    {
        std::lock_guard<std::mutex> worker_lock(worker->mutex);
        if (!worker->done)
        {
            ++count;
        }
    }
    return count;
}

void AbandonedWorkers::wait_all()
{
    std::vector<std::shared_ptr<detail::WorkerSignal>> workers;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        workers.swap(m_workers);
    }
    for (const auto& worker : workers)
    {
        std::unique_lock<std::mutex> worker_lock(worker->mutex);
        worker->done_cv.wait(worker_lock, [&worker] { return worker->done; });
    }
}

namespace detail
{

void log_worker_fault(ILogSink& sink, const std::string& label,
                      const std::exception_ptr& fault, bool abandoned)
{
    if (abandoned)
    {
        sink.log(LogLevel::Debug,
                 fmt::format("abandoned worker for '{}' finished with {}: {}",
                             label, fault_kind(fault), fault_message(fault)));
        return;
    }
    auto located = locate(fault, 1);
    sink.log(LogLevel::Error,
             fmt::format("[{}] worker for '{}' failed: {}: {}",
                         located.location, label, fault_kind(fault), fault_message(fault)));
}

void log_timed_out(ILogSink& sink, const std::string& label,
                   std::chrono::milliseconds limit, const std::string& fallback)
{
    sink.log(LogLevel::Warn,
             fmt::format("call to '{}' timed out after {}ms; worker abandoned, returning fallback {}",
                         label, limit.count(), fallback));
}

void throw_timeout_exceeded(const std::string& label, std::chrono::milliseconds limit)
{
    throw CallGuardError{CallGuardErrorCode::TimeoutExceeded,
                         fmt::format("call to '{}' timed out after {}ms with no fallback for its result type",
                                     label, limit.count())};
}

std::chrono::milliseconds effective_poll_slice(const TimeoutConfig& config) noexcept
{
    if (config.poll_slice.count() <= 0 || config.poll_slice > kMaxPollSlice)
    {
        return kMaxPollSlice;
    }
    return config.poll_slice;
}

} // namespace detail

} // namespace callguard
