/**
 * @file settlement.hpp
 * @brief Tagged result of a decorated call: Recovered(value) | Propagated(fault).
 */
#pragma once
#include "callguard/common/common.hpp"

namespace callguard
{

namespace detail
{

template <typename R>
struct value_of
{
    using type = std::decay_t<R>;
};

template <>
struct value_of<void>
{
    using type = std::monostate;
};

} // namespace detail

/**
 * @brief Storage type for a callable's result; `void` maps to std::monostate.
 */
template <typename R>
using value_t = typename detail::value_of<R>::type;

/**
 * @brief Fallback configured for a callable returning R.
 *
 * @details
 * For `void` callables a fallback of `std::monostate{}` means "swallow the
 * fault"; std::nullopt means "rethrow".
 */
template <typename R>
using Fallback = std::optional<value_t<R>>;

/**
 * @brief The call produced a value, either its own or a fallback.
 */
template <typename T>
struct Recovered
{
    T value;
    bool from_fallback{false};
};

/**
 * @brief The call ended with a fault the caller must see.
 */
struct Propagated
{
    std::exception_ptr fault;
};

template <typename T>
using Settlement = std::variant<Recovered<T>, Propagated>;

/**
 * @brief Invoke @p fn and store its result as value_t.
 */
template <typename F, typename... Args>
value_t<std::invoke_result_t<F&, Args...>> invoke_for_value(F& fn, Args&&... args)
{
    using R = std::invoke_result_t<F&, Args...>;
    if constexpr (std::is_void_v<R>)
    {
        std::invoke(fn, std::forward<Args>(args)...);
        return std::monostate{};
    }
    else
    {
        return std::invoke(fn, std::forward<Args>(args)...);
    }
}

/**
 * @brief Turn a settlement into a plain return, or rethrow its fault unchanged.
 */
template <typename R>
R resolve(Settlement<value_t<R>> settlement)
{
    if (auto* propagated = std::get_if<Propagated>(&settlement))
    {
        std::rethrow_exception(propagated->fault);
    }
    if constexpr (!std::is_void_v<R>)
    {
        return std::move(std::get<Recovered<value_t<R>>>(settlement).value);
    }
}

} // namespace callguard
