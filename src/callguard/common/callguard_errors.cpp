#include "callguard/common/callguard_errors.hpp"

namespace callguard
{

const char* to_string(CallGuardErrorCode code) noexcept
{
    switch (code)
    {
        case CallGuardErrorCode::InvalidPolicy:
            return "InvalidPolicy";
        case CallGuardErrorCode::CapabilityNotFound:
            return "CapabilityNotFound";
        case CallGuardErrorCode::DuplicateCapability:
            return "DuplicateCapability";
        case CallGuardErrorCode::SignatureMismatch:
            return "SignatureMismatch";
        case CallGuardErrorCode::ReadOnlyCapability:
            return "ReadOnlyCapability";
        case CallGuardErrorCode::TimeoutExceeded:
            return "TimeoutExceeded";
    }
    return "Unknown";
}

} // namespace callguard
