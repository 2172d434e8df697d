/**
 * @file synchronized.hpp
 * @brief Serialize calls through a re-entrant lock.
 */
#pragma once
#include "callguard/common/common.hpp"

namespace callguard
{

/**
 * @brief The process-wide re-entrant lock.
 * @details Shared with SingletonRegistry::global(). Wrappers built on it hold
 * their own reference, so the mutex outlives any wrapper still in use.
 */
const std::shared_ptr<std::recursive_mutex>& process_lock();

/**
 * @brief Wrap @p op so each call holds @p lock for its whole duration.
 *
 * @details
 * The lock is released when the call returns or propagates a fault. A
 * synchronized operation may call itself, or another operation sharing the
 * lock, from the same thread.
 */
template <typename F>
auto synchronized(std::shared_ptr<std::recursive_mutex> lock, F op)
{
    return [lock = std::move(lock), op = std::move(op)](auto&&... args) -> decltype(auto) {
        std::lock_guard<std::recursive_mutex> guard(*lock);
        return op(std::forward<decltype(args)>(args)...);
    };
}

/**
 * @brief Wrap @p op under process_lock().
 */
template <typename F>
auto synchronized(F op)
{
    return synchronized(process_lock(), std::move(op));
}

} // namespace callguard
