#include "rangecat/storage/s3_client.hpp"

#include <algorithm>
#include <charconv>
#include <ios>
#include <mutex>
#include <new>
#include <utility>

#include <aws/core/Aws.h>
#include <aws/core/auth/AWSAuthSigner.h>
#include <aws/core/auth/AWSCredentials.h>
#include <aws/core/client/ClientConfiguration.h>
#include <aws/core/client/DefaultRetryStrategy.h>
#include <aws/core/http/Scheme.h>
#include <aws/s3/S3Client.h>
#include <aws/s3/model/GetObjectRequest.h>
#include <aws/s3/model/HeadObjectRequest.h>

#include <boost/log/trivial.hpp>

namespace rangecat::storage {

using namespace rangecat::core;

class AwsApi {
public:
    AwsApi() { Aws::InitAPI(options_); }
    ~AwsApi() { Aws::ShutdownAPI(options_); }
    AwsApi(const AwsApi&) = delete;
    AwsApi& operator=(const AwsApi&) = delete;

private:
    Aws::SDKOptions options_;
};

// ========================================================================
// Internal Helpers
// ========================================================================

namespace {

constexpr const char* kAllocTag = "rangecat";

[[nodiscard]] Status net_status(StatusCode code, u32 aux = 0) noexcept {
    return make_status(StatusDomain::Net, code, aux);
}

// InitAPI once for all live clients; the last holder shuts the SDK down.
[[nodiscard]] std::shared_ptr<AwsApi> acquire_aws_api() {
    static std::mutex mu;
    static std::weak_ptr<AwsApi> current;
    std::lock_guard<std::mutex> lock(mu);
    std::shared_ptr<AwsApi> api = current.lock();
    if (!api) {
        api = std::make_shared<AwsApi>();
        current = api;
    }
    return api;
}

[[nodiscard]] bool parse_u64(std::string_view s, u64* out) noexcept {
    if (s.empty()) {
        return false;
    }
    const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), *out);
    return ec == std::errc() && ptr == s.data() + s.size();
}

template <typename Outcome>
[[nodiscard]] Status outcome_status(const Outcome& outcome) noexcept {
    return s3_error_status(static_cast<int>(outcome.GetError().GetResponseCode()));
}

class S3RangeBody final : public RangeBody {
public:
    S3RangeBody(std::shared_ptr<AwsApi> api, Aws::S3::Model::GetObjectResult result, u64 remaining) noexcept
        : api_(std::move(api)), result_(std::move(result)), remaining_(remaining) {}

    Status read(BufferMut out, u32* n) noexcept override {
        if (n == nullptr || (out.data == nullptr && out.len > 0)) {
            return net_status(StatusCode::Invalid);
        }
        *n = 0;
        if (remaining_ == 0 || out.len == 0) {
            return ok_status();
        }

        const std::streamsize want = static_cast<std::streamsize>(std::min<u64>(out.len, remaining_));
        Aws::IOStream& body = result_.GetBody();
        body.read(reinterpret_cast<char*>(out.data), want);
        const std::streamsize got = body.gcount();
        if (got <= 0) {
            // Connection ended before Content-Length bytes arrived.
            return net_status(StatusCode::Network);
        }
        remaining_ -= static_cast<u64>(got);
        *n = static_cast<u32>(got);
        return ok_status();
    }

private:
    std::shared_ptr<AwsApi> api_;
    Aws::S3::Model::GetObjectResult result_;
    u64 remaining_{0};
};

} // namespace

// ========================================================================
// Response checks
// ========================================================================

Status s3_error_status(int http_status) noexcept {
    const u32 aux = http_status > 0 ? static_cast<u32>(http_status) : 0;
    switch (http_status) {
    case 404:
        return net_status(StatusCode::NotFound, aux);
    case 401:
    case 403:
        return net_status(StatusCode::PermissionDenied, aux);
    case 416:
        return net_status(StatusCode::Protocol, aux);
    default:
        return net_status(StatusCode::Network, aux);
    }
}

std::string s3_range_header(const FetchRange& range) {
    std::string out = "bytes=";
    out += std::to_string(range.start);
    out += '-';
    out += std::to_string(range.end);
    return out;
}

Status s3_check_range_response(const FetchRange& range, u64 content_length,
    std::string_view content_range) noexcept {
    if (content_range.empty()) {
        // Whole object: only acceptable when it is the requested range, clipped.
        if (range.start != 0 || content_length > range.length()) {
            return net_status(StatusCode::Protocol);
        }
        return ok_status();
    }

    constexpr std::string_view kUnit = "bytes ";
    if (content_range.substr(0, kUnit.size()) != kUnit) {
        return net_status(StatusCode::Protocol);
    }
    content_range.remove_prefix(kUnit.size());
    const std::size_t dash = content_range.find('-');
    const std::size_t slash = content_range.find('/');
    if (dash == std::string_view::npos || slash == std::string_view::npos || slash < dash) {
        return net_status(StatusCode::Protocol);
    }

    u64 first = 0;
    u64 last = 0;
    if (!parse_u64(content_range.substr(0, dash), &first) ||
        !parse_u64(content_range.substr(dash + 1, slash - dash - 1), &last)) {
        return net_status(StatusCode::Protocol);
    }
    if (first != range.start || last < first || last > range.end || content_length != last - first + 1) {
        return net_status(StatusCode::Protocol);
    }
    return ok_status();
}

// ========================================================================
// S3ObjectClient
// ========================================================================

S3ObjectClient::S3ObjectClient(std::shared_ptr<AwsApi> api, std::shared_ptr<Aws::S3::S3Client> client) noexcept
    : api_(std::move(api)), client_(std::move(client)) {}

// client_ goes before api_ so the SDK is still up while the client is torn down.
S3ObjectClient::~S3ObjectClient() {
    client_.reset();
}

Status S3ObjectClient::create(const Endpoint& endpoint, const ClientOptions& options,
    ObjectClientPtr* out) noexcept {
    if (out == nullptr || endpoint.kind != EndpointKind::S3) {
        return make_status(StatusDomain::Config, StatusCode::Invalid);
    }

    try {
        std::shared_ptr<AwsApi> api = acquire_aws_api();

        Aws::Client::ClientConfiguration cfg;
        if (!endpoint.region.empty()) {
            cfg.region = endpoint.region.c_str();
        } else if (!options.region.empty()) {
            cfg.region = options.region.c_str();
        }
        cfg.requestTimeoutMs = static_cast<long>(options.io_timeout_ms);
        cfg.connectTimeoutMs = static_cast<long>(options.connect_timeout_ms);
        cfg.retryStrategy = Aws::MakeShared<Aws::Client::DefaultRetryStrategy>(
            kAllocTag, static_cast<long>(options.max_retries));

        const bool custom = !endpoint.host.empty();
        if (custom) {
            cfg.endpointOverride = endpoint.authority().c_str();
            cfg.scheme = endpoint.tls ? Aws::Http::Scheme::HTTPS : Aws::Http::Scheme::HTTP;
            cfg.verifySSL = endpoint.tls;
        }

        // Path-style addressing for custom endpoints, virtual-hosted for AWS.
        const bool virtual_addressing = !custom;
        std::shared_ptr<Aws::S3::S3Client> client;
        if (options.anonymous) {
            client = std::make_shared<Aws::S3::S3Client>(Aws::Auth::AWSCredentials(), cfg,
                Aws::Client::AWSAuthV4Signer::PayloadSigningPolicy::Never, virtual_addressing);
        } else {
            client = std::make_shared<Aws::S3::S3Client>(cfg,
                Aws::Client::AWSAuthV4Signer::PayloadSigningPolicy::Never, virtual_addressing);
        }

        BOOST_LOG_TRIVIAL(debug) << "s3 object store region=" << cfg.region
                                 << (custom ? " endpoint=" : "") << (custom ? endpoint.authority() : "");
        *out = std::make_shared<S3ObjectClient>(std::move(api), std::move(client));
    } catch (const std::bad_alloc&) {
        return make_status(StatusDomain::Config, StatusCode::OutOfMemory);
    }
    return ok_status();
}

Status S3ObjectClient::open_range(const FetchRange& range, std::unique_ptr<RangeBody>* out) const noexcept {
    if (out == nullptr || range.end < range.start) {
        return net_status(StatusCode::Invalid);
    }

    try {
        Aws::S3::Model::GetObjectRequest req;
        req.SetBucket(range.container_id.c_str());
        req.SetKey(range.object_key.c_str());
        req.SetRange(s3_range_header(range).c_str());

        BOOST_LOG_TRIVIAL(debug) << "GetObject " << range.container_id << "/" << range.object_key
                                 << " bytes=" << range.start << "-" << range.end;
        Aws::S3::Model::GetObjectOutcome outcome = client_->GetObject(req);
        if (!outcome.IsSuccess()) {
            const Status s = outcome_status(outcome);
            BOOST_LOG_TRIVIAL(warning) << "GetObject " << range.container_id << "/" << range.object_key
                                       << " failed: HTTP " << static_cast<int>(outcome.GetError().GetResponseCode())
                                       << " " << outcome.GetError().GetMessage();
            return s;
        }

        Aws::S3::Model::GetObjectResult result = outcome.GetResultWithOwnership();
        const long long length = result.GetContentLength();
        if (length < 0) {
            return net_status(StatusCode::Protocol);
        }
        const Status s = s3_check_range_response(range, static_cast<u64>(length),
            std::string_view(result.GetContentRange().data(), result.GetContentRange().size()));
        if (!is_ok(s)) {
            BOOST_LOG_TRIVIAL(warning) << "GetObject " << range.container_id << "/" << range.object_key
                                       << " answered Content-Range '" << result.GetContentRange()
                                       << "' length " << length;
            return s;
        }

        *out = std::make_unique<S3RangeBody>(api_, std::move(result), static_cast<u64>(length));
    } catch (const std::bad_alloc&) {
        return net_status(StatusCode::OutOfMemory);
    }
    return ok_status();
}

Status S3ObjectClient::object_size(std::string_view container_id, std::string_view object_key,
    u64* out) const noexcept {
    if (out == nullptr) {
        return net_status(StatusCode::Invalid);
    }

    try {
        Aws::S3::Model::HeadObjectRequest req;
        req.WithBucket(Aws::String(container_id.data(), container_id.size()))
            .WithKey(Aws::String(object_key.data(), object_key.size()));

        Aws::S3::Model::HeadObjectOutcome outcome = client_->HeadObject(req);
        if (!outcome.IsSuccess()) {
            BOOST_LOG_TRIVIAL(warning) << "HeadObject " << container_id << "/" << object_key
                                       << " failed: HTTP " << static_cast<int>(outcome.GetError().GetResponseCode());
            return outcome_status(outcome);
        }
        const long long length = outcome.GetResult().GetContentLength();
        if (length < 0) {
            return net_status(StatusCode::Protocol);
        }
        *out = static_cast<u64>(length);
    } catch (const std::bad_alloc&) {
        return net_status(StatusCode::OutOfMemory);
    }
    return ok_status();
}

} // namespace rangecat::storage
