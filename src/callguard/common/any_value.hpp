/**
 * @file any_value.hpp
 * @brief AnyValue: an immutable, shared, type-erased value used for outcome
 *        metadata, per-type fallbacks and registered capabilities.
 * @see any_value.inline.hpp for the templated members.
 */
#pragma once
#include "callguard/common/common.hpp"

namespace callguard
{

/**
 * @brief Thrown by AnyValue::as() when the held type is not the requested one.
 */
class AnyValueTypeError : public std::runtime_error
{
public:
    explicit AnyValueTypeError(const std::string& msg)
        : std::runtime_error(msg)
    {}
};

/**
 * @brief Thrown by AnyValue::as() on an empty AnyValue.
 */
class AnyValueEmptyError : public std::runtime_error
{
public:
    explicit AnyValueEmptyError(const std::string& msg)
        : std::runtime_error(msg)
    {}
};

namespace detail
{

/**
 * @brief Type-tagged payload behind an AnyValue.
 */
struct AnyPayload
{
    explicit AnyPayload(std::type_index held_type)
        : type{held_type}
    {}
    virtual ~AnyPayload() = default;

    const std::type_index type;
};

template <typename T>
struct TypedPayload final : AnyPayload
{
    template <typename U>
    explicit TypedPayload(U&& v)
        : AnyPayload{std::type_index{typeid(T)}}
        , value(std::forward<U>(v))
    {}

    const T value;
};

} // namespace detail

/**
 * @brief Read-only holder for one value of any copy-constructible type.
 *
 * @details
 * The value is fixed when the AnyValue is built with of(); a holder is
 * replaced by assigning another AnyValue. Copies share one payload, which is
 * never written after construction, so copies may be read from any thread.
 *
 * Lookups are exact: a holder built from `int` is not readable as `long`,
 * and a `std::function<int()>` is not readable as `std::function<long()>`.
 */
class AnyValue
{
public:
    AnyValue() = default;

    /**
     * @brief Hold a copy of @p value, stored as `std::decay_t<T>`.
     */
    template <typename T>
    [[nodiscard]] static AnyValue of(T&& value);

    [[nodiscard]] bool has_value() const noexcept
    {
        return m_payload != nullptr;
    }

    /**
     * @brief Demangled name of the held type, "void" when empty.
     */
    [[nodiscard]] std::string type_name() const;

    /**
     * @throws AnyValueEmptyError if nothing is held.
     * @throws AnyValueTypeError if the held type is not T.
     */
    template <typename T>
    [[nodiscard]] const T& as() const;

    /**
     * @return nullptr if nothing is held or the held type is not T.
     */
    template <typename T>
    [[nodiscard]] const T* try_as() const noexcept;

    template <typename T>
    [[nodiscard]] T value_or(T fallback) const;

private:
    std::shared_ptr<const detail::AnyPayload> m_payload;
};

} // namespace callguard
