/**
 * @file outcome.inline.hpp
 * @brief execute() and the templated members of Outcome.
 */
#pragma once
#include "callguard/resilience/outcome.hpp"
#include "callguard/common/any_value.inline.hpp"
#include "callguard/resilience/describe_value.hpp"

namespace callguard
{

namespace detail
{

template <typename T, typename = void>
struct has_empty_member : std::false_type
{};

template <typename T>
struct has_empty_member<T, std::void_t<decltype(std::declval<const T&>().empty())>>
    : std::true_type
{};

/**
 * @brief Truthiness of a value, as used by Outcome::operator bool.
 */
template <typename T>
bool is_truthy(const T& value)
{
    if constexpr (std::is_same_v<T, std::monostate>)
    {
        return false;
    }
    else if constexpr (std::is_constructible_v<bool, const T&>)
    {
        return static_cast<bool>(value);
    }
    else if constexpr (has_empty_member<T>::value)
    {
        return !value.empty();
    }
    else
    {
        return true;
    }
}

struct OutcomeAccess
{
    template <typename T>
    static void set_value(Outcome<T>& outcome, T value)
    {
        outcome.m_value = std::move(value);
        outcome.m_succeeded = true;
    }

    template <typename T>
    static void set_fault(Outcome<T>& outcome, std::exception_ptr fault,
                          const std::string& label, ILogSink& sink)
    {
        outcome.m_value.reset();
        outcome.m_succeeded = false;
        outcome.record_fault(std::move(fault), label, sink);
    }

    template <typename T>
    static void set_timing(Outcome<T>& outcome, IClock::time_point start, IClock::time_point end)
    {
        outcome.record_timing(start, end);
    }
};

} // namespace detail

template <typename T>
void OutcomeBase::put(std::string key, T&& value)
{
    m_metadata[std::move(key)] = AnyValue::of(std::forward<T>(value));
}

template <typename T>
T OutcomeBase::get(const std::string& key, T fallback) const
{
    auto it = m_metadata.find(key);
    if (it == m_metadata.end())
    {
        return fallback;
    }
    return it->second.value_or<T>(std::move(fallback));
}

template <typename T>
T Outcome<T>::value_or(T fallback) const
{
    if (m_succeeded && m_value.has_value())
    {
        return *m_value;
    }
    return fallback;
}

template <typename T>
void Outcome<T>::clear(LogSinkPtr sink)
{
    m_value.reset();
    auto resolved = resolve_sink(std::move(sink));
    clear_shared_state(*resolved);
}

template <typename T>
std::optional<std::string> Outcome<T>::describe_result() const
{
    if constexpr (std::is_same_v<T, std::monostate>)
    {
        return std::nullopt;
    }
    else
    {
        if (!m_value)
        {
            return std::nullopt;
        }
        return detail::describe_value(*m_value);
    }
}

template <typename T>
Outcome<T>::operator bool() const
{
    return m_value.has_value() && detail::is_truthy(*m_value);
}

template <typename F, typename... Args>
auto execute_with(const ExecuteOptions& options, F&& fn, Args&&... args)
    -> Outcome<value_t<std::invoke_result_t<F&, Args...>>>
{
    using R = std::invoke_result_t<F&, Args...>;
    static_assert(!std::is_reference_v<R>, "execute: callables returning references are not supported");
    using T = value_t<R>;

    const IClock& clock = options.clock ? *options.clock : default_clock();
    Outcome<T> outcome;

    auto start = clock.now();
    try
    {
        detail::OutcomeAccess::set_value(outcome, invoke_for_value(fn, std::forward<Args>(args)...));
    }
    catch (...)
    {
        auto sink = resolve_sink(options.sink);
        detail::OutcomeAccess::set_fault(outcome, std::current_exception(), options.label, *sink);
    }
    auto end = clock.now();
    detail::OutcomeAccess::set_timing(outcome, start, end);
    return outcome;
}

template <typename F, typename... Args>
auto execute(F&& fn, Args&&... args)
    -> Outcome<value_t<std::invoke_result_t<F&, Args...>>>
{
    static const ExecuteOptions defaults{};
    return execute_with(defaults, std::forward<F>(fn), std::forward<Args>(args)...);
}

} // namespace callguard
