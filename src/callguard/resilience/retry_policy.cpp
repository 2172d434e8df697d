#include "callguard/resilience/retry_policy.hpp"
#include "callguard/common/callguard_errors.hpp"
#include "callguard/common/clock.hpp"
#include <algorithm>

namespace callguard
{

void validate(const RetryConfig& config)
{
    if (config.initial_delay.count() < 0)
    {
        throw CallGuardError{CallGuardErrorCode::InvalidPolicy,
                             fmt::format("retry initial_delay must not be negative (got {}ms)",
                                         config.initial_delay.count())};
    }
    if (config.max_delay.count() < 0)
    {
        throw CallGuardError{CallGuardErrorCode::InvalidPolicy,
                             fmt::format("retry max_delay must not be negative (got {}ms)",
                                         config.max_delay.count())};
    }
    if (!(config.backoff_factor >= 1.0))
    {
        throw CallGuardError{CallGuardErrorCode::InvalidPolicy,
                             fmt::format("retry backoff_factor must be >= 1.0 (got {})",
                                         config.backoff_factor)};
    }
}

std::chrono::nanoseconds next_retry_delay(const RetryConfig& config, std::chrono::nanoseconds current)
{
    using std::chrono::nanoseconds;

    const double scaled = static_cast<double>(current.count()) * config.backoff_factor;
    double ceiling = static_cast<double>(nanoseconds::max().count());
    if (config.max_delay.count() > 0)
    {
        ceiling = std::min(ceiling, static_cast<double>(nanoseconds{config.max_delay}.count()));
    }
    if (scaled >= ceiling)
    {
        return config.max_delay.count() > 0 ? nanoseconds{config.max_delay} : nanoseconds::max();
    }
    return nanoseconds{static_cast<nanoseconds::rep>(scaled)};
}

Sleeper thread_sleeper()
{
    return [](std::chrono::nanoseconds delay) {
        std::this_thread::sleep_for(delay);
    };
}

namespace detail
{

void log_retry_scheduled(ILogSink& sink, const std::string& label, std::uint64_t attempt,
                         const RetryConfig& config, const std::exception_ptr& fault,
                         std::chrono::nanoseconds delay, const std::string& fallback)
{
    std::string limit = config.max_attempts < 1 ? std::string{"unbounded"}
                                                : std::to_string(config.max_attempts);
    sink.log(LogLevel::Warn,
             fmt::format("call to '{}' failed on attempt {}/{}: {}: {}; retrying in {:.1f}ms (fallback {})",
                         label, attempt, limit, fault_kind(fault), fault_message(fault),
                         to_millis(delay), fallback));
}

void log_retry_exhausted(ILogSink& sink, const std::string& label, std::uint64_t attempts,
                         const std::exception_ptr& fault, const std::string& fallback)
{
    sink.log(LogLevel::Error,
             fmt::format("call to '{}' failed on all {} attempts; last fault {}: {} (fallback {})",
                         label, attempts, fault_kind(fault), fault_message(fault), fallback));
}

} // namespace detail

} // namespace callguard
