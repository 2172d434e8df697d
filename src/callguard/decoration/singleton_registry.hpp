/**
 * @file singleton_registry.hpp
 * @brief SingletonRegistry: at most one instance per type.
 */
#pragma once
#include "callguard/common/common.hpp"

namespace callguard
{

/**
 * @brief Map from type to its single shared instance.
 *
 * @details
 * The first instance<T>() call for a type constructs it; later calls return
 * the same object. Entries are never removed, so references stay valid for
 * the registry's lifetime.
 *
 * @par Thread Safety
 * - All members are thread-safe. The lock is held across the factory call,
 *   so two threads racing on the same type construct it exactly once. The
 *   lock is re-entrant: a factory may request other singletons.
 */
class SingletonRegistry
{
public:
    /**
     * @param lock Guards the registry; nullptr creates a private lock.
     */
    explicit SingletonRegistry(std::shared_ptr<std::recursive_mutex> lock = {});

    SingletonRegistry(const SingletonRegistry&) = delete;
    SingletonRegistry& operator=(const SingletonRegistry&) = delete;

    /**
     * @brief The process-wide registry, guarded by process_lock().
     * @note Created on first use and never destroyed.
     */
    static SingletonRegistry& global();

    /**
     * @brief The instance of T, constructing it with @p factory on first use.
     * @details @p factory must return something convertible to
     *          std::shared_ptr<T>. A throwing factory registers nothing.
     */
    template <typename T, typename Factory>
    std::shared_ptr<T> instance(Factory&& factory)
    {
        std::lock_guard<std::recursive_mutex> guard(*m_lock);
        const std::type_index key{typeid(T)};
        auto it = m_instances.find(key);
        if (it != m_instances.end())
        {
            return std::static_pointer_cast<T>(it->second);
        }
        std::shared_ptr<T> created = std::forward<Factory>(factory)();
        m_instances.emplace(key, created);
        return created;
    }

    /**
     * @brief The instance of T, default-constructing it on first use.
     */
    template <typename T>
    std::shared_ptr<T> instance()
    {
        return instance<T>([] { return std::make_shared<T>(); });
    }

    template <typename T>
    [[nodiscard]] bool contains() const
    {
        std::lock_guard<std::recursive_mutex> guard(*m_lock);
        return m_instances.find(std::type_index{typeid(T)}) != m_instances.end();
    }

    [[nodiscard]] std::size_t size() const;

    [[nodiscard]] const std::shared_ptr<std::recursive_mutex>& lock() const noexcept
    {
        return m_lock;
    }

private:
    std::shared_ptr<std::recursive_mutex> m_lock;
    std::map<std::type_index, std::shared_ptr<void>> m_instances;
};

} // namespace callguard
