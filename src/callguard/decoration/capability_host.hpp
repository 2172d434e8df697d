/**
 * @file capability_host.hpp
 * @brief Base class for objects whose operations can be auto-decorated.
 */
#pragma once
#include "callguard/common/common.hpp"
#include "callguard/decoration/capability_table.inline.hpp"

namespace callguard
{

/**
 * @brief Anything that owns a CapabilityTable.
 */
class ICapabilityProvider
{
public:
    virtual ~ICapabilityProvider() = default;

    virtual CapabilityTable& capabilities() = 0;
    virtual const CapabilityTable& capabilities() const = 0;
};

/**
 * @brief Convenience base that binds member functions into a CapabilityTable.
 *
 * @details
 * A derived class exposes its implementation members in its constructor and
 * routes its public entry points through call(), so that whatever binding the
 * table currently holds (original or decorated) is what runs:
 *
 * @code
 * class Inventory : public CapabilityHost
 * {
 * public:
 *     Inventory() { expose("count", &Inventory::count_impl); }
 *     int count(const std::string& sku) { return call<int(const std::string&)>("count", sku); }
 * private:
 *     int count_impl(const std::string& sku);
 * };
 * @endcode
 *
 * Bindings capture `this`, so hosts are neither copyable nor movable.
 *
 * A timed-out call leaves its worker running inside the host. The destructor
 * blocks until every such worker has finished. A derived class whose own
 * members need non-trivial destruction should call
 * `capabilities().wait_for_abandoned_calls()` first in its destructor, since
 * those members are gone by the time this base destructor runs.
 */
class CapabilityHost : public ICapabilityProvider
{
public:
    CapabilityHost(const CapabilityHost&) = delete;
    CapabilityHost& operator=(const CapabilityHost&) = delete;

    CapabilityTable& capabilities() override
    {
        return m_capabilities;
    }

    const CapabilityTable& capabilities() const override
    {
        return m_capabilities;
    }

protected:
    CapabilityHost() = default;
    ~CapabilityHost() override
    {
        m_capabilities.wait_for_abandoned_calls();
    }

    template <typename C, typename R, typename... Args>
    void expose(std::string name, R (C::*method)(Args...), CapabilityOptions options = {})
    {
        static_assert(std::is_base_of_v<CapabilityHost, C>, "expose: C must derive from CapabilityHost");
        C* self = static_cast<C*>(this);
        m_capabilities.declare<R(Args...)>(
            std::move(name),
            std::function<R(Args...)>{[self, method](Args... args) -> R {
                return (self->*method)(std::forward<Args>(args)...);
            }},
            options);
    }

    template <typename C, typename R, typename... Args>
    void expose(std::string name, R (C::*method)(Args...) const, CapabilityOptions options = {})
    {
        static_assert(std::is_base_of_v<CapabilityHost, C>, "expose: C must derive from CapabilityHost");
        const C* self = static_cast<const C*>(this);
        m_capabilities.declare<R(Args...)>(
            std::move(name),
            std::function<R(Args...)>{[self, method](Args... args) -> R {
                return (self->*method)(std::forward<Args>(args)...);
            }},
            options);
    }

    template <typename C, typename T>
    void expose_property(std::string name, T (C::*getter)() const)
    {
        static_assert(std::is_base_of_v<CapabilityHost, C>, "expose_property: C must derive from CapabilityHost");
        const C* self = static_cast<const C*>(this);
        m_capabilities.declare_property<T>(
            std::move(name),
            std::function<T()>{[self, getter]() -> T { return (self->*getter)(); }});
    }

    /**
     * @brief Invoke the current binding of @p name.
     */
    template <typename Sig, typename... A>
    typename detail::signature_traits<Sig>::result_type call(std::string_view name, A&&... args) const
    {
        return m_capabilities.invoke<Sig>(name, std::forward<A>(args)...);
    }

private:
    CapabilityTable m_capabilities;
};

} // namespace callguard
