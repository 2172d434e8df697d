/**
 * @file fault_locator.hpp
 * @brief Stack-carrying faults and the locator that renders their origin.
 */
#pragma once
#include "callguard/common/common.hpp"
#include <boost/config.hpp>
#include <boost/stacktrace.hpp>

namespace callguard
{

using StackTrace = boost::stacktrace::stacktrace;

/**
 * @brief Sentinel location returned when no frame can be identified.
 */
inline constexpr const char* kUnknownLocation = "unknown location";

/**
 * @brief Mixin carried by every fault thrown through raise_traced().
 *
 * @details
 * Holds the call stack captured at the throw site and the type the fault was
 * raised as, so that locators and outcome records can report the kind the
 * caller wrote (`std::runtime_error`) rather than the wrapper type.
 */
class TracedFault
{
public:
    virtual ~TracedFault() = default;

    const StackTrace& stack_trace() const noexcept
    {
        return m_trace;
    }

    std::type_index origin_type() const noexcept
    {
        return m_origin;
    }

protected:
    TracedFault(StackTrace trace, std::type_index origin)
        : m_trace{std::move(trace)}
        , m_origin{origin}
    {}

private:
    StackTrace m_trace;
    std::type_index m_origin;
};

/**
 * @brief Fault of type E with a captured stack.
 *
 * @details
 * `catch (const E&)` matches a `Traced<E>`, so decorators and callers see the
 * original fault type.
 */
template <typename E>
class Traced : public E, public TracedFault
{
public:
    template <typename... Args>
    explicit Traced(StackTrace trace, Args&&... args)
        : E(std::forward<Args>(args)...)
        , TracedFault(std::move(trace), std::type_index{typeid(E)})
    {}
};

/**
 * @brief Capture the current stack, dropping this function and @p skip callers.
 */
BOOST_NOINLINE StackTrace capture_stack_trace(std::size_t skip = 0);

/**
 * @brief Construct an E from @p args and throw it with the current stack.
 *
 * @details
 * The first frame of the captured chain is raise_traced itself; the second is
 * the function that raised the fault.
 */
template <typename E, typename... Args>
[[noreturn]] BOOST_NOINLINE void raise_traced(Args&&... args)
{
    throw Traced<E>(capture_stack_trace(), std::forward<Args>(args)...);
}

/**
 * @brief Throw a copy of @p fault with the current stack.
 */
template <typename E>
[[noreturn]] BOOST_NOINLINE void throw_traced(const E& fault)
{
    throw Traced<E>(capture_stack_trace(), fault);
}

/**
 * @brief Result of locating a fault's origin.
 */
struct FaultLocation
{
    /// `"source:line in function"`, or kUnknownLocation.
    std::string location;

    /// Header line `"<kind>: <message>"` followed by the formatted frames.
    std::string trace;
};

/**
 * @brief Locate the originating frame of a fault.
 *
 * @details
 * Walks the captured chain from its first frame, skipping @p skip_frames
 * entries. Faults thrown without a stack (plain `throw`) yield
 * kUnknownLocation; so does a chain shorter than the skip count. The trace is
 * rendered in full regardless of the skip count.
 */
FaultLocation locate(const std::exception& fault, std::size_t skip_frames = 1) noexcept;

/**
 * @brief Locate a fault held in an exception_ptr.
 * @details Faults not derived from std::exception report kind "unknown".
 */
FaultLocation locate(std::exception_ptr fault, std::size_t skip_frames = 1) noexcept;

/**
 * @brief Demangled kind name of a fault (the raised type for Traced faults).
 */
std::string fault_kind(const std::exception& fault);

/**
 * @brief Kind name of the fault in @p fault, "unknown" for non-std exceptions.
 */
std::string fault_kind(std::exception_ptr fault);

/**
 * @brief what() of the fault in @p fault, empty for non-std exceptions.
 */
std::string fault_message(std::exception_ptr fault);

} // namespace callguard
