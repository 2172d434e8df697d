#include "callguard/decoration/synchronized.hpp"

namespace callguard
{

const std::shared_ptr<std::recursive_mutex>& process_lock()
{
    static const auto lock = std::make_shared<std::recursive_mutex>();
    return lock;
}

} // namespace callguard
