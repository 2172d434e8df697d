/**
 * @file capability_table.hpp
 * @brief CapabilityTable: the operations an object declares as eligible for
 *        automatic decoration.
 * @see capability_table.inline.hpp for the templated members.
 */
#pragma once
#include "callguard/common/common.hpp"
#include "callguard/common/any_value.hpp"
#include "callguard/resilience/timeout_guard.hpp"

namespace callguard
{

struct DecorationPolicy;

/**
 * @brief What a registered name stands for.
 */
enum class CapabilityKind
{
    Operation,  ///< A public operation; eligible for decoration.
    Property    ///< A computed accessor; callable but never decorated.
};

const char* to_string(CapabilityKind kind) noexcept;

/**
 * @brief Options for CapabilityTable::declare().
 */
struct CapabilityOptions
{
    /**
     * @brief Refuse rebinding; decoration of this capability fails.
     */
    bool read_only{false};
};

/**
 * @brief Snapshot of one registered capability.
 *
 * @details
 * `invoke` holds the current binding as a `std::function<Sig>`; retrieve it
 * with `function<Sig>()`.
 */
struct CapabilityDescriptor
{
    std::string name;
    CapabilityKind kind{CapabilityKind::Operation};
    std::type_index signature{typeid(void)};
    std::string signature_name;
    bool read_only{false};
    bool decorated{false};
    AnyValue invoke;

    /**
     * @brief The bound operation.
     * @throws AnyValueTypeError if Sig is not the registered signature.
     */
    template <typename Sig>
    const std::function<Sig>& function() const;
};

namespace detail
{

template <typename Sig>
struct signature_traits;

template <typename R, typename... Args>
struct signature_traits<R(Args...)>
{
    using result_type = R;
    using function_type = std::function<R(Args...)>;
};

} // namespace detail

/**
 * @brief Registry of the named operations an object exposes.
 *
 * @details
 * Each entry keeps its original operation and its current binding. Decoration
 * always builds the new binding from the original, so applying a policy twice
 * replaces the first decoration instead of nesting it.
 *
 * Entries are kept in name order.
 *
 * Timeout layers installed by decorate() hand the workers they abandon to the
 * table; wait_for_abandoned_calls() blocks until those have finished. Copies
 * of a table share this collection.
 *
 * @par Thread Safety
 * - Not synchronized. invoke() may run concurrently with other invoke() calls
 *   once registration and decoration are finished; declare(), decorate() and
 *   restore() need exclusive access.
 */
class CapabilityTable
{
public:
    CapabilityTable() = default;

    /**
     * @brief Register an operation.
     * @throws CallGuardError (DuplicateCapability) if @p name is taken.
     */
    template <typename Sig>
    void declare(std::string name, std::function<Sig> fn, CapabilityOptions options = {});

    /**
     * @brief Register a computed accessor.
     * @details Properties can be invoked but are never enumerated or decorated.
     * @throws CallGuardError (DuplicateCapability) if @p name is taken.
     */
    template <typename T>
    void declare_property(std::string name, std::function<T()> getter);

    /**
     * @brief Call the current binding of @p name.
     * @tparam Sig The registered signature, e.g. `int(int, int)`.
     * @throws CallGuardError (CapabilityNotFound) for an unknown name.
     * @throws CallGuardError (SignatureMismatch) if Sig differs from the
     *         registered signature.
     */
    template <typename Sig, typename... A>
    typename detail::signature_traits<Sig>::result_type invoke(std::string_view name, A&&... args) const;

    [[nodiscard]] bool contains(std::string_view name) const;

    [[nodiscard]] std::size_t size() const noexcept
    {
        return m_entries.size();
    }

    /**
     * @brief Snapshot of every entry, properties and private names included.
     */
    [[nodiscard]] std::vector<CapabilityDescriptor> entries() const;

    /**
     * @brief Snapshot of one entry.
     * @throws CallGuardError (CapabilityNotFound) for an unknown name.
     */
    [[nodiscard]] CapabilityDescriptor describe(std::string_view name) const;

    /**
     * @brief Rebind @p name to its original operation decorated by @p policy.
     * @return true if a previous decoration was replaced.
     * @throws CallGuardError (CapabilityNotFound), (ReadOnlyCapability), or
     *         (InvalidPolicy) when the policy cannot be built.
     */
    bool decorate(std::string_view name, const DecorationPolicy& policy);

    /**
     * @brief Rebind @p name to its original operation.
     * @throws CallGuardError (CapabilityNotFound) for an unknown name.
     */
    void restore(std::string_view name);

    /**
     * @brief Number of timed-out calls whose workers are still running.
     */
    [[nodiscard]] std::size_t abandoned_calls() const
    {
        return m_abandoned->pending();
    }

    /**
     * @brief Block until every timed-out call's worker has finished.
     */
    void wait_for_abandoned_calls() const
    {
        m_abandoned->wait_all();
    }

private:
    using Decorator = std::function<AnyValue(const AnyValue& original,
                                             const std::string& name,
                                             const DecorationPolicy& policy,
                                             const AbandonedWorkersPtr& abandoned)>;

    struct Entry
    {
        CapabilityKind kind{CapabilityKind::Operation};
        std::type_index signature{typeid(void)};
        bool read_only{false};
        bool decorated{false};
        AnyValue original;
        AnyValue current;
        Decorator decorator;
    };

    void insert(std::string name, Entry entry);
    const Entry& find(std::string_view name) const;
    Entry& find(std::string_view name);
    CapabilityDescriptor snapshot(const std::string& name, const Entry& entry) const;

    std::map<std::string, Entry, std::less<>> m_entries;
    AbandonedWorkersPtr m_abandoned{std::make_shared<AbandonedWorkers>()};
};

} // namespace callguard
