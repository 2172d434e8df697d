/**
 * @file describe_value.hpp
 * @brief Rendering of fallback values in log messages.
 */
#pragma once
#include "callguard/common/common.hpp"
#include "callguard/common/any_value.inline.hpp"
#include <fmt/format.h>

namespace callguard
{

namespace detail
{

/**
 * @brief Text for a value in a log line: fmt output when formattable,
 *        "none" for std::monostate, the type name in angle brackets otherwise.
 */
template <typename T>
std::string describe_value(const T& value)
{
    if constexpr (std::is_same_v<T, std::monostate>)
    {
        return "none";
    }
    else if constexpr (fmt::is_formattable<T>::value)
    {
        return fmt::format("{}", value);
    }
    else
    {
        return "<" + demangled_type_name(std::type_index{typeid(T)}) + ">";
    }
}

template <typename T>
std::string describe_fallback(const std::optional<T>& fallback)
{
    return fallback ? describe_value(*fallback) : std::string{"<unset>"};
}

} // namespace detail

} // namespace callguard
