#include "callguard/decoration/singleton_registry.hpp"
#include "callguard/decoration/synchronized.hpp"

namespace callguard
{

SingletonRegistry::SingletonRegistry(std::shared_ptr<std::recursive_mutex> lock)
    : m_lock{lock ? std::move(lock) : std::make_shared<std::recursive_mutex>()}
{
}

SingletonRegistry& SingletonRegistry::global()
{
    static SingletonRegistry registry{process_lock()};
    return registry;
}

std::size_t SingletonRegistry::size() const
{
    std::lock_guard<std::recursive_mutex> guard(*m_lock);
    return m_instances.size();
}

} // namespace callguard
