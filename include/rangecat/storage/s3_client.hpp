#pragma once

#include <memory>
#include <string>
#include <string_view>

#include "rangecat/core/errors.hpp"
#include "rangecat/core/models.hpp"
#include "rangecat/storage/object_client.hpp"

namespace Aws::S3 {
    class S3Client;
} // namespace Aws::S3

namespace rangecat::storage {

    // Process-wide Aws::InitAPI/ShutdownAPI pair, held by every S3 client and body.
    class AwsApi;

    // Object store reached through the AWS SDK: Amazon S3 for a region, or an
    // S3-compatible service (path-style addressing) for a custom endpoint.
    // Requests are signed with the SDK's default credential chain unless
    // ClientOptions::anonymous is set.
    class S3ObjectClient final : public ObjectClient {
    public:
        // No request is made here; DNS and credential problems surface on the
        // first ranged read.
        [[nodiscard]] static rangecat::core::Status create(const Endpoint& endpoint,
            const ClientOptions& options,
            ObjectClientPtr* out) noexcept;

        // GetObject with "Range: bytes=start-end". The response body is read
        // through RangeBody::read.
        [[nodiscard]] rangecat::core::Status open_range(const rangecat::core::FetchRange& range,
            std::unique_ptr<RangeBody>* out) const noexcept override;

        // HeadObject; the size is the response Content-Length.
        [[nodiscard]] rangecat::core::Status object_size(std::string_view container_id,
            std::string_view object_key,
            u64* out) const noexcept override;

        S3ObjectClient(std::shared_ptr<AwsApi> api, std::shared_ptr<Aws::S3::S3Client> client) noexcept;
        ~S3ObjectClient() override;

    private:
        std::shared_ptr<AwsApi> api_;
        std::shared_ptr<Aws::S3::S3Client> client_;
    };

    // Net status for a failed S3 call. http_status <= 0 means no response
    // arrived. 404 is NotFound, 401/403 PermissionDenied, 416 Protocol, the
    // rest Network; aux carries the HTTP status.
    [[nodiscard]] rangecat::core::Status s3_error_status(int http_status) noexcept;

    // "bytes=start-end".
    [[nodiscard]] std::string s3_range_header(const rangecat::core::FetchRange& range);

    // Checks a successful GetObject response against the requested range.
    // content_range is the Content-Range header ("bytes A-B/total"), empty when
    // the server sent the whole object. Mismatches are Net/Protocol.
    [[nodiscard]] rangecat::core::Status s3_check_range_response(const rangecat::core::FetchRange& range,
        u64 content_length,
        std::string_view content_range) noexcept;

} // namespace rangecat::storage
