/**
 * @file any_value.inline.hpp
 * @brief Templated members of AnyValue.
 */
#pragma once
#include "callguard/common/any_value.hpp"

namespace callguard
{

namespace detail
{

/**
 * @brief Demangled, readable name of a type ("std::string" for std::string).
 */
std::string demangled_type_name(std::type_index ti);

[[noreturn]] void throw_any_value_mismatch(std::type_index requested, std::type_index held);
[[noreturn]] void throw_any_value_empty(std::type_index requested);

} // namespace detail

template <typename T>
AnyValue AnyValue::of(T&& value)
{
    using Held = std::decay_t<T>;
    static_assert(!std::is_void_v<Held> && !std::is_array_v<Held>,
                  "AnyValue: cannot hold void or array types");
    AnyValue result;
    result.m_payload = std::make_shared<detail::TypedPayload<Held>>(std::forward<T>(value));
    return result;
}

template <typename T>
const T* AnyValue::try_as() const noexcept
{
    if (!m_payload || m_payload->type != std::type_index{typeid(T)})
    {
        return nullptr;
    }
    return &static_cast<const detail::TypedPayload<T>*>(m_payload.get())->value;
}

template <typename T>
const T& AnyValue::as() const
{
    if (!m_payload)
    {
        detail::throw_any_value_empty(std::type_index{typeid(T)});
    }
    const T* held = try_as<T>();
    if (!held)
    {
        detail::throw_any_value_mismatch(std::type_index{typeid(T)}, m_payload->type);
    }
    return *held;
}

template <typename T>
T AnyValue::value_or(T fallback) const
{
    const T* held = try_as<T>();
    return held ? *held : std::move(fallback);
}

} // namespace callguard
