/**
 * @file exception_handler.hpp
 * @brief Single-shot catch, log and fall back.
 */
#pragma once
#include "callguard/common/common.hpp"
#include "callguard/common/log_sink.hpp"
#include "callguard/resilience/describe_value.hpp"
#include "callguard/resilience/fault_filter.hpp"
#include "callguard/resilience/fault_locator.hpp"
#include "callguard/resilience/settlement.hpp"

namespace callguard
{

/**
 * @brief Configuration for ExceptionHandler.
 */
struct ExceptionHandlerConfig
{
    /**
     * @brief Prefix for the log entry written when a fault is handled.
     */
    std::string error_message{};

    /**
     * @brief Level of that log entry.
     */
    LogLevel log_level{LogLevel::Error};

    /**
     * @brief Faults handled by the decorator; others propagate untouched.
     */
    FaultFilter matched_faults{};

    /**
     * @brief Log the matched fault and then rethrow it anyway.
     */
    bool reraise{false};
};

/**
 * @brief Text of the entry ExceptionHandler logs for a handled fault.
 */
std::string handled_fault_message(const ExceptionHandlerConfig& config,
                                  const std::string& label,
                                  const std::exception_ptr& fault,
                                  const std::string& fallback);

/**
 * @brief Decorator that runs a callable once and recovers matched faults.
 *
 * @details
 * On a matched fault the handler logs one entry at the configured level and:
 * - rethrows it if `reraise` is set;
 * - otherwise returns the fallback if one is configured;
 * - otherwise, for `void` callables, returns normally (the fault is swallowed);
 * - otherwise rethrows it, since there is no value to return.
 *
 * Unmatched faults propagate unchanged and are not logged.
 *
 * @tparam R Return type of the decorated callables.
 *
 * @par Thread Safety
 * - Immutable after construction; run() may be called concurrently.
 */
template <typename R>
class ExceptionHandler
{
    static_assert(!std::is_reference_v<R>, "ExceptionHandler: reference results are not supported");

public:
    using value_type = value_t<R>;

    explicit ExceptionHandler(
        ExceptionHandlerConfig config = {},
        Fallback<R> fallback = std::nullopt,
        LogSinkPtr sink = {})
        : m_config{std::move(config)}
        , m_fallback{std::move(fallback)}
        , m_sink{resolve_sink(std::move(sink))}
    {}

    const ExceptionHandlerConfig& config() const noexcept
    {
        return m_config;
    }

    const Fallback<R>& fallback() const noexcept
    {
        return m_fallback;
    }

    template <typename F, typename... Args>
    Settlement<value_type> settle(const std::string& label, F& fn, Args&&... args) const
    {
        std::exception_ptr fault;
        try
        {
            return Recovered<value_type>{invoke_for_value(fn, std::forward<Args>(args)...), false};
        }
        catch (...)
        {
            fault = std::current_exception();
        }

        if (!m_config.matched_faults.matches(fault))
        {
            return Propagated{fault};
        }

        m_sink->log(m_config.log_level,
                    handled_fault_message(m_config, label, fault,
                                          detail::describe_fallback(m_fallback)));

        if (m_config.reraise)
        {
            return Propagated{fault};
        }
        if (m_fallback)
        {
            return Recovered<value_type>{*m_fallback, true};
        }
        if constexpr (std::is_void_v<R>)
        {
            return Recovered<value_type>{std::monostate{}, true};
        }
        else
        {
            return Propagated{fault};
        }
    }

    template <typename F, typename... Args>
    R run_labeled(const std::string& label, F& fn, Args&&... args) const
    {
        return resolve<R>(settle(label, fn, std::forward<Args>(args)...));
    }

    template <typename F, typename... Args>
    R run(F&& fn, Args&&... args) const
    {
        return run_labeled("callable", fn, std::forward<Args>(args)...);
    }

    /**
     * @brief Decorated copy of @p fn.
     * @param label Name used in log entries.
     */
    template <typename F>
    auto wrap(F fn, std::string label = "callable") const
    {
        return [handler = *this, fn = std::move(fn), label = std::move(label)](auto&&... args) mutable -> R {
            return handler.run_labeled(label, fn, std::forward<decltype(args)>(args)...);
        };
    }

private:
    ExceptionHandlerConfig m_config;
    Fallback<R> m_fallback;
    LogSinkPtr m_sink;
};

} // namespace callguard
