/**
 * @file decoration_policy.hpp
 * @brief DecorationPolicy: what the auto decoration engine wraps around each
 *        capability.
 */
#pragma once
#include "callguard/common/common.hpp"
#include "callguard/common/any_value.inline.hpp"
#include "callguard/common/log_sink.hpp"
#include "callguard/resilience/fault_filter.hpp"
#include "callguard/resilience/retry_policy.hpp"
#include "callguard/resilience/settlement.hpp"

namespace callguard
{

/**
 * @brief Configuration applied by AutoDecorationEngine to every capability.
 *
 * @details
 * Layers, innermost first:
 * 1. TimeoutGuard, if `timeout` is set (without a fallback of its own, so a
 *    timeout reaches the next layer as a CallGuardError).
 * 2. RetryPolicy if `retry_attempts > 1`, otherwise ExceptionHandler.
 * 3. CallTimer, if `time_calls` is set.
 *
 * Fallbacks are registered per result type. A capability returning `R`
 * recovers matched faults with the fallback registered for `R`; with none,
 * `void` capabilities swallow the fault and others rethrow it.
 */
struct DecorationPolicy
{
    /**
     * @brief Total attempts per call; retrying is enabled above 1.
     */
    int retry_attempts{1};

    std::chrono::milliseconds retry_delay{1000};

    double backoff_factor{1.0};

    /**
     * @brief Faults recovered by the policy; others propagate unchanged.
     */
    FaultFilter matched_faults{};

    /**
     * @brief Level of the entry logged by the single-shot handler.
     */
    LogLevel log_level{LogLevel::Error};

    /**
     * @brief Prefix of the entry logged by the single-shot handler.
     */
    std::string error_message{};

    /**
     * @brief Per-call deadline, if any.
     */
    std::optional<std::chrono::milliseconds> timeout{};

    /**
     * @brief Log the duration of every call.
     */
    bool time_calls{false};

    /**
     * @brief Predicate on capability names; empty accepts every name.
     */
    std::function<bool(const std::string&)> filter{};

    /**
     * @brief Sink for all decorator log entries; nullptr uses the default sink.
     */
    LogSinkPtr sink{};

    /**
     * @brief Sleep between retries; empty uses std::this_thread::sleep_for.
     */
    Sleeper sleeper{};

    /**
     * @brief Fallbacks keyed by result type.
     */
    std::map<std::type_index, AnyValue> fallbacks{};

    /**
     * @brief Register the fallback for capabilities returning T.
     */
    template <typename T>
    DecorationPolicy& with_fallback(T value)
    {
        fallbacks[std::type_index{typeid(T)}] = AnyValue::of(std::move(value));
        return *this;
    }

    /**
     * @brief Fallback for capabilities returning R.
     */
    template <typename R>
    Fallback<R> fallback_for() const
    {
        if constexpr (std::is_void_v<R>)
        {
            return std::monostate{};
        }
        else
        {
            auto it = fallbacks.find(std::type_index{typeid(value_t<R>)});
            if (it == fallbacks.end())
            {
                return std::nullopt;
            }
            if (const auto* value = it->second.try_as<value_t<R>>())
            {
                return *value;
            }
            return std::nullopt;
        }
    }

    [[nodiscard]] bool accepts(const std::string& name) const
    {
        return !filter || filter(name);
    }
};

} // namespace callguard
