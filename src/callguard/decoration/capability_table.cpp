#include "callguard/decoration/capability_table.inline.hpp"
#include <fmt/format.h>

namespace callguard
{

namespace detail
{

void throw_signature_mismatch(std::string_view name,
                              std::type_index registered,
                              std::type_index requested)
{
    throw CallGuardError{
        CallGuardErrorCode::SignatureMismatch,
        fmt::format("capability '{}' has signature {}, requested as {}",
                    name, demangled_type_name(registered), demangled_type_name(requested))
    };
}

} // namespace detail

const char* to_string(CapabilityKind kind) noexcept
{
    switch (kind)
    {
        case CapabilityKind::Operation:
            return "Operation";
        case CapabilityKind::Property:
            return "Property";
    }
    return "Unknown";
}

void CapabilityTable::insert(std::string name, Entry entry)
{
    if (name.empty())
    {
        throw CallGuardError{CallGuardErrorCode::InvalidPolicy, "capability name must not be empty"};
    }
    if (m_entries.find(name) != m_entries.end())
    {
        throw CallGuardError{
            CallGuardErrorCode::DuplicateCapability,
            fmt::format("capability '{}' is already declared", name)
        };
    }
    m_entries.emplace(std::move(name), std::move(entry));
}

const CapabilityTable::Entry& CapabilityTable::find(std::string_view name) const
{
    auto it = m_entries.find(name);
    if (it == m_entries.end())
    {
        throw CallGuardError{
            CallGuardErrorCode::CapabilityNotFound,
            fmt::format("no capability named '{}'", name)
        };
    }
    return it->second;
}

CapabilityTable::Entry& CapabilityTable::find(std::string_view name)
{
    const auto& self = *this;
    return const_cast<Entry&>(self.find(name));
}

bool CapabilityTable::contains(std::string_view name) const
{
    return m_entries.find(name) != m_entries.end();
}

CapabilityDescriptor CapabilityTable::snapshot(const std::string& name, const Entry& entry) const
{
    CapabilityDescriptor desc;
    desc.name = name;
    desc.kind = entry.kind;
    desc.signature = entry.signature;
    desc.signature_name = detail::demangled_type_name(entry.signature);
    desc.read_only = entry.read_only;
    desc.decorated = entry.decorated;
    desc.invoke = entry.current;
    return desc;
}

std::vector<CapabilityDescriptor> CapabilityTable::entries() const
{
    std::vector<CapabilityDescriptor> result;
    result.reserve(m_entries.size());
    for (const auto& kv : m_entries)
    {
        result.push_back(snapshot(kv.first, kv.second));
    }
    return result;
}

CapabilityDescriptor CapabilityTable::describe(std::string_view name) const
{
    const Entry& entry = find(name);
    return snapshot(std::string{name}, entry);
}

bool CapabilityTable::decorate(std::string_view name, const DecorationPolicy& policy)
{
    Entry& entry = find(name);
    if (entry.kind == CapabilityKind::Property || !entry.decorator)
    {
        throw CallGuardError{
            CallGuardErrorCode::ReadOnlyCapability,
            fmt::format("capability '{}' is a property and cannot be decorated", name)
        };
    }
    if (entry.read_only)
    {
        throw CallGuardError{
            CallGuardErrorCode::ReadOnlyCapability,
            fmt::format("capability '{}' is read-only", name)
        };
    }

    // Build before rebinding so a policy error leaves the entry untouched.
    AnyValue rebound = entry.decorator(entry.original, std::string{name}, policy, m_abandoned);
    const bool replaced = entry.decorated;
    entry.current = std::move(rebound);
    entry.decorated = true;
    return replaced;
}

void CapabilityTable::restore(std::string_view name)
{
    Entry& entry = find(name);
    entry.current = entry.original;
    entry.decorated = false;
}

} // namespace callguard
