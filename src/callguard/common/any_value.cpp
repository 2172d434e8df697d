#include "callguard/common/any_value.inline.hpp"
#include <boost/core/demangle.hpp>
#include <fmt/format.h>

namespace callguard
{

namespace detail
{

std::string demangled_type_name(std::type_index ti)
{
    if (ti == std::type_index{typeid(std::string)})
    {
        return "std::string";
    }
    return boost::core::demangle(ti.name());
}

void throw_any_value_mismatch(std::type_index requested, std::type_index held)
{
    throw AnyValueTypeError{fmt::format("AnyValue holds {}, not {}",
                                        demangled_type_name(held), demangled_type_name(requested))};
}

void throw_any_value_empty(std::type_index requested)
{
    throw AnyValueEmptyError{fmt::format("AnyValue is empty, {} requested",
                                         demangled_type_name(requested))};
}

} // namespace detail

std::string AnyValue::type_name() const
{
    return detail::demangled_type_name(m_payload ? m_payload->type : std::type_index{typeid(void)});
}

} // namespace callguard
