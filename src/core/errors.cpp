#include "rangecat/core/errors.hpp"

namespace rangecat::core {

    const char* status_code_name(StatusCode code) noexcept {
        switch (code) {
        case StatusCode::Ok: return "Ok";
        case StatusCode::Unknown: return "Unknown";
        case StatusCode::Invalid: return "Invalid";
        case StatusCode::NotFound: return "NotFound";
        case StatusCode::PermissionDenied: return "PermissionDenied";
        case StatusCode::Corrupt: return "Corrupt";
        case StatusCode::Io: return "Io";
        case StatusCode::Network: return "Network";
        case StatusCode::Protocol: return "Protocol";
        case StatusCode::Unsupported: return "Unsupported";
        case StatusCode::Unavailable: return "Unavailable";
        case StatusCode::Cancelled: return "Cancelled";
        case StatusCode::OutOfMemory: return "OutOfMemory";
        }
        return "Unknown";
    }

    const char* status_domain_name(StatusDomain domain) noexcept {
        switch (domain) {
        case StatusDomain::Core: return "Core";
        case StatusDomain::Plan: return "Plan";
        case StatusDomain::Storage: return "Storage";
        case StatusDomain::Net: return "Net";
        case StatusDomain::Stream: return "Stream";
        case StatusDomain::Archive: return "Archive";
        case StatusDomain::Config: return "Config";
        case StatusDomain::Cli: return "Cli";
        case StatusDomain::Bindings: return "Bindings";
        }
        return "Unknown";
    }

} // namespace rangecat::core
