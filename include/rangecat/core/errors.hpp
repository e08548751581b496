#pragma once
#include <cstdint>
#include <type_traits>

namespace rangecat::core {
    using u16 = std::uint16_t;
    using u32 = std::uint32_t;

    enum class StatusCode : u16 {
        Ok = 0,
        Unknown,
        Invalid,
        NotFound,
        PermissionDenied,
        Corrupt,
        Io,
        Network,
        Protocol,
        Unsupported,
        Unavailable,
        Cancelled,
        OutOfMemory,
    };

    enum class StatusDomain : u16 {
        Core = 0,
        Plan,
        Storage,
        Net,
        Stream,
        Archive,
        Config,
        Cli,
        Bindings,
    };

    // aux carries an errno value or an HTTP status code, depending on the domain.
    struct Status {
        StatusCode code{StatusCode::Ok};
        StatusDomain domain{StatusDomain::Core};
        u32 aux{0};
    };

    [[nodiscard]] constexpr Status make_status(StatusDomain domain, StatusCode code, u32 aux = 0) noexcept {
        return Status{code, domain, aux};
    }

    [[nodiscard]] constexpr bool is_ok(Status s) noexcept {
        return s.code == StatusCode::Ok;
    }

    [[nodiscard]] constexpr Status ok_status() noexcept {
        return Status{};
    }

    // The storage client could not be built from the configured endpoint.
    [[nodiscard]] constexpr bool is_configuration_error(Status s) noexcept {
        return !is_ok(s) && s.domain == StatusDomain::Config;
    }

    // A ranged read could not be issued or its response broke mid-read.
    // Stream/Protocol is a body that ran past its requested range.
    [[nodiscard]] constexpr bool is_transport_error(Status s) noexcept {
        if (is_ok(s)) {
            return false;
        }
        if (s.domain == StatusDomain::Stream) {
            return s.code == StatusCode::Protocol;
        }
        if (s.domain != StatusDomain::Storage && s.domain != StatusDomain::Net) {
            return false;
        }
        switch (s.code) {
        case StatusCode::Io:
        case StatusCode::Network:
        case StatusCode::Protocol:
        case StatusCode::NotFound:
        case StatusCode::PermissionDenied:
            return true;
        default:
            return false;
        }
    }

    [[nodiscard]] const char* status_code_name(StatusCode code) noexcept;
    [[nodiscard]] const char* status_domain_name(StatusDomain domain) noexcept;

    static_assert(std::is_trivially_copyable_v<Status>);
    static_assert(std::is_standard_layout_v<Status>);
} // namespace rangecat::core
