#pragma once

#include <memory>
#include <string>
#include <string_view>

#include "rangecat/core/errors.hpp"
#include "rangecat/core/models.hpp"
#include "rangecat/core/types.hpp"
#include "rangecat/storage/buffer.hpp"

namespace rangecat::storage {
    using u16 = rangecat::core::u16;
    using u32 = rangecat::core::u32;
    using u64 = rangecat::core::u64;

    // Body of one ranged read. Not restartable; a new open_range() is needed to retry.
    class RangeBody {
    public:
        virtual ~RangeBody() = default;

        // Copies up to out.len bytes into out.data. *n == 0 means end of data.
        // The amount returned per call is unrelated to any caller buffer size.
        [[nodiscard]] virtual rangecat::core::Status read(BufferMut out, u32* n) noexcept = 0;
    };

    // Storage client. Methods can be invoked concurrently.
    // The configuration is fixed at construction.
    class ObjectClient {
    public:
        virtual ~ObjectClient() = default;

        // Issues one ranged read for [range.start, range.end] of one object.
        [[nodiscard]] virtual rangecat::core::Status open_range(const rangecat::core::FetchRange& range,
            std::unique_ptr<RangeBody>* out) const noexcept = 0;

        // Size of the whole object.
        [[nodiscard]] virtual rangecat::core::Status object_size(std::string_view container_id,
            std::string_view object_key,
            u64* out) const noexcept = 0;
    };

    using ObjectClientPtr = std::shared_ptr<const ObjectClient>;

    enum class EndpointKind : rangecat::core::u8 {
        Local = 0,
        S3 = 1,
    };

    struct Endpoint {
        EndpointKind kind{EndpointKind::Local};
        std::string root;   // Local: directory holding one subdirectory per container
        std::string region; // S3: empty = ClientOptions::region, then the SDK default chain
        std::string host;   // S3: custom endpoint host; empty = AWS
        u16 port{0};        // S3: custom endpoint port; 0 = scheme default
        bool tls{true};     // S3: https for a custom endpoint

        // "host[:port]" with IPv6 literals bracketed; empty for AWS.
        [[nodiscard]] std::string authority() const;
    };

    // Accepts "file:///abs/dir", "http(s)://host[:port][/]" (S3-compatible
    // service, path-style addressing) and bare region names such as
    // "eu-west-1". Pure, no I/O.
    [[nodiscard]] rangecat::core::Status parse_endpoint(std::string_view spec, Endpoint* out) noexcept;

    struct ClientOptions {
        u32 io_timeout_ms{30000};
        u32 connect_timeout_ms{5000};
        u32 max_retries{3};
        std::string region;     // region for custom endpoints
        bool anonymous{false};  // unsigned requests, no credential lookup
    };

    // Builds the client for 'spec'. Every failure here, including a missing
    // directory, is reported in StatusDomain::Config. S3 clients do no I/O
    // until the first request.
    [[nodiscard]] rangecat::core::Status make_object_client(std::string_view spec,
        const ClientOptions& options,
        ObjectClientPtr* out) noexcept;

} // namespace rangecat::storage
