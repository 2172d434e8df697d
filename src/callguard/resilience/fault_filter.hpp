/**
 * @file fault_filter.hpp
 * @brief FaultFilter: the set of fault kinds a policy recovers from.
 */
#pragma once
#include "callguard/common/common.hpp"
#include "callguard/common/any_value.inline.hpp"

namespace callguard
{

namespace detail
{

template <typename E>
bool fault_is(const std::exception_ptr& fault)
{
    try
    {
        std::rethrow_exception(fault);
    }
    catch (const E&)
    {
        return true;
    }
    catch (...)
    {
        return false;
    }
}

} // namespace detail

/**
 * @brief Set of fault kinds matched by a policy.
 *
 * @details
 * Kinds are C++ exception types and match the way a `catch` clause does:
 * a filter containing `std::runtime_error` also matches `std::range_error`
 * and any `Traced<std::runtime_error>`.
 *
 * A default-constructed filter is empty and matches every fault, including
 * non-std exceptions.
 *
 * @par Thread safety
 * - Immutable after construction; safe for concurrent reads.
 */
class FaultFilter
{
public:
    FaultFilter() = default;

    /**
     * @brief Filter matching every fault.
     */
    static FaultFilter any()
    {
        return FaultFilter{};
    }

    /**
     * @brief Filter matching faults of any of the listed types.
     */
    template <typename... Es>
    static FaultFilter of()
    {
        static_assert(sizeof...(Es) > 0, "FaultFilter::of requires at least one type");
        FaultFilter filter;
        (filter.add<Es>(), ...);
        return filter;
    }

    /**
     * @brief Add a fault type to the filter.
     */
    template <typename E>
    FaultFilter& add()
    {
        m_entries.push_back(Entry{
            detail::demangled_type_name(std::type_index{typeid(E)}),
            &detail::fault_is<E>});
        return *this;
    }

    [[nodiscard]] bool matches_all() const noexcept
    {
        return m_entries.empty();
    }

    /**
     * @brief Check whether @p fault is one of the matched kinds.
     * @return false for a null exception_ptr.
     */
    [[nodiscard]] bool matches(const std::exception_ptr& fault) const
    {
        if (!fault)
        {
            return false;
        }
        if (m_entries.empty())
        {
            return true;
        }
        for (const auto& entry : m_entries)
        {
            if (entry.test(fault))
            {
                return true;
            }
        }
        return false;
    }

    /**
     * @brief Human-readable list of matched kinds, "any" when unrestricted.
     */
    [[nodiscard]] std::string describe() const
    {
        if (m_entries.empty())
        {
            return "any";
        }
        std::string result;
        for (const auto& entry : m_entries)
        {
            if (!result.empty())
            {
                result += ", ";
            }
            result += entry.name;
        }
        return result;
    }

private:
    struct Entry
    {
        std::string name;
        bool (*test)(const std::exception_ptr&);
    };

    std::vector<Entry> m_entries;
};

} // namespace callguard
