/**
 * @file capability_table.inline.hpp
 * @brief Implementations for the templated members of CapabilityTable.
 */
#pragma once
#include "callguard/decoration/capability_table.hpp"
#include "callguard/common/any_value.inline.hpp"
#include "callguard/common/callguard_errors.hpp"
#include "callguard/decoration/decorated_function.hpp"

namespace callguard
{

namespace detail
{

[[noreturn]] void throw_signature_mismatch(std::string_view name,
                                           std::type_index registered,
                                           std::type_index requested);

template <typename R, typename... Args>
AnyValue decorate_erased(const AnyValue& original, const std::string& name,
                         const DecorationPolicy& policy, const AbandonedWorkersPtr& abandoned)
{
    using Fn = std::function<R(Args...)>;
    return AnyValue::of(decorate_function<R, Args...>(original.as<Fn>(), name, policy, abandoned));
}

template <typename Sig>
struct erased_decorator;

template <typename R, typename... Args>
struct erased_decorator<R(Args...)>
{
    static constexpr auto value = &decorate_erased<R, Args...>;
};

} // namespace detail

template <typename Sig>
const std::function<Sig>& CapabilityDescriptor::function() const
{
    return invoke.as<std::function<Sig>>();
}

template <typename Sig>
void CapabilityTable::declare(std::string name, std::function<Sig> fn, CapabilityOptions options)
{
    Entry entry;
    entry.kind = CapabilityKind::Operation;
    entry.signature = std::type_index{typeid(Sig)};
    entry.read_only = options.read_only;
    entry.original = AnyValue::of(std::move(fn));
    entry.current = entry.original;
    entry.decorator = detail::erased_decorator<Sig>::value;
    insert(std::move(name), std::move(entry));
}

template <typename T>
void CapabilityTable::declare_property(std::string name, std::function<T()> getter)
{
    Entry entry;
    entry.kind = CapabilityKind::Property;
    entry.signature = std::type_index{typeid(T())};
    entry.read_only = true;
    entry.original = AnyValue::of(std::move(getter));
    entry.current = entry.original;
    insert(std::move(name), std::move(entry));
}

template <typename Sig, typename... A>
typename detail::signature_traits<Sig>::result_type
CapabilityTable::invoke(std::string_view name, A&&... args) const
{
    using Fn = typename detail::signature_traits<Sig>::function_type;

    const Entry& entry = find(name);
    const auto* fn = entry.current.try_as<Fn>();
    if (!fn)
    {
        detail::throw_signature_mismatch(name, entry.signature, std::type_index{typeid(Sig)});
    }
    return (*fn)(std::forward<A>(args)...);
}

} // namespace callguard
