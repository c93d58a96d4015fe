// cppcheck-suppress-file missingIncludeSystem
#include "result.hpp"

namespace capkern {

const char* error_code_name(ErrorCode code)
{
    switch (code) {
        case ErrorCode::Unauthorized:
            return "Unauthorized";
        case ErrorCode::Expired:
            return "Expired";
        case ErrorCode::RateLimited:
            return "RateLimited";
        case ErrorCode::Exhausted:
            return "Exhausted";
        case ErrorCode::PolicyDenied:
            return "PolicyDenied";
        case ErrorCode::WouldBlock:
            return "WouldBlock";
        case ErrorCode::GraphViolation:
            return "GraphViolation";
        case ErrorCode::Internal:
            return "Internal";
        case ErrorCode::DelegationDepthExceeded:
            return "DelegationDepthExceeded";
        case ErrorCode::DelegationRightsExceeded:
            return "DelegationRightsExceeded";
        case ErrorCode::MessageMalformed:
            return "MessageMalformed";
        case ErrorCode::MessageTooLarge:
            return "MessageTooLarge";
        case ErrorCode::EndpointClosed:
            return "EndpointClosed";
        case ErrorCode::CapsuleSuspended:
            return "CapsuleSuspended";
        case ErrorCode::AlreadyExists:
            return "AlreadyExists";
        case ErrorCode::ResourceNotFound:
            return "ResourceNotFound";
        case ErrorCode::InvalidArgument:
            return "InvalidArgument";
        case ErrorCode::ConfigParseFailed:
            return "ConfigParseFailed";
        case ErrorCode::AuditChainBroken:
            return "AuditChainBroken";
        case ErrorCode::IoError:
            return "IoError";
        case ErrorCode::Unknown:
            return "Unknown";
    }
    return "Unknown";
}

} // namespace capkern
