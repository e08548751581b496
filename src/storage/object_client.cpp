#include "rangecat/storage/object_client.hpp"

#include <charconv>
#include <new>
#include <string>

#include <boost/log/trivial.hpp>

#include "rangecat/storage/local_client.hpp"
#include "rangecat/storage/s3_client.hpp"

namespace rangecat::storage {

using namespace rangecat::core;

namespace {

constexpr std::string_view kFileScheme = "file://";
constexpr std::string_view kHttpScheme = "http://";
constexpr std::string_view kHttpsScheme = "https://";

[[nodiscard]] Status config_status(StatusCode code, u32 aux = 0) noexcept {
    return make_status(StatusDomain::Config, code, aux);
}

[[nodiscard]] bool starts_with(std::string_view s, std::string_view prefix) noexcept {
    return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

[[nodiscard]] bool is_region_char(char c) noexcept {
    return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-';
}

[[nodiscard]] bool parse_port(std::string_view s, u16* out) noexcept {
    if (s.empty() || s.size() > 5) {
        return false;
    }
    u32 v = 0;
    const auto r = std::from_chars(s.data(), s.data() + s.size(), v, 10);
    if (r.ec != std::errc() || r.ptr != s.data() + s.size() || v == 0 || v > 65535) {
        return false;
    }
    *out = static_cast<u16>(v);
    return true;
}

[[nodiscard]] Status parse_http_authority(std::string_view rest, Endpoint* ep) {
    const std::size_t slash = rest.find('/');
    if (slash != std::string_view::npos) {
        // Only a bare trailing slash is accepted; objects are addressed from the root.
        if (rest.substr(slash) != "/") {
            return config_status(StatusCode::Invalid);
        }
        rest = rest.substr(0, slash);
    }
    if (rest.empty()) {
        return config_status(StatusCode::Invalid);
    }

    std::string_view host = rest;
    std::string_view port;
    if (rest.front() == '[') {
        const std::size_t close = rest.find(']');
        if (close == std::string_view::npos || close == 1) {
            return config_status(StatusCode::Invalid);
        }
        host = rest.substr(1, close - 1);
        const std::string_view tail = rest.substr(close + 1);
        if (!tail.empty()) {
            if (tail.front() != ':') {
                return config_status(StatusCode::Invalid);
            }
            port = tail.substr(1);
            if (port.empty()) {
                return config_status(StatusCode::Invalid);
            }
        }
    } else {
        const std::size_t colon = rest.rfind(':');
        if (colon != std::string_view::npos) {
            host = rest.substr(0, colon);
            port = rest.substr(colon + 1);
            if (port.empty()) {
                return config_status(StatusCode::Invalid);
            }
        }
    }
    if (host.empty() || host.find('@') != std::string_view::npos) {
        return config_status(StatusCode::Invalid);
    }

    ep->kind = EndpointKind::S3;
    ep->host.assign(host);
    ep->port = 0;
    if (!port.empty() && !parse_port(port, &ep->port)) {
        return config_status(StatusCode::Invalid);
    }
    return ok_status();
}

} // namespace

std::string Endpoint::authority() const {
    if (host.empty()) {
        return {};
    }
    std::string out;
    if (host.find(':') != std::string::npos) {
        out = "[" + host + "]";
    } else {
        out = host;
    }
    if (port != 0) {
        out += ":" + std::to_string(port);
    }
    return out;
}

// ========================================================================
// Endpoint parsing
// ========================================================================

Status parse_endpoint(std::string_view spec, Endpoint* out) noexcept {
    if (out == nullptr || spec.empty()) {
        return config_status(StatusCode::Invalid);
    }

    Endpoint ep{};
    try {
        if (starts_with(spec, kFileScheme)) {
            std::string_view root = spec.substr(kFileScheme.size());
            if (root.empty() || root.front() != '/') {
                return config_status(StatusCode::Invalid);
            }
            while (root.size() > 1 && root.back() == '/') {
                root.remove_suffix(1);
            }
            ep.kind = EndpointKind::Local;
            ep.root.assign(root);
        } else if (starts_with(spec, kHttpsScheme)) {
            Status s = parse_http_authority(spec.substr(kHttpsScheme.size()), &ep);
            if (!is_ok(s)) {
                return s;
            }
            ep.tls = true;
        } else if (starts_with(spec, kHttpScheme)) {
            Status s = parse_http_authority(spec.substr(kHttpScheme.size()), &ep);
            if (!is_ok(s)) {
                return s;
            }
            ep.tls = false;
        } else {
            // Region name such as "eu-west-1".
            for (const char c : spec) {
                if (!is_region_char(c)) {
                    return config_status(StatusCode::Invalid);
                }
            }
            if (spec.front() == '-' || spec.back() == '-') {
                return config_status(StatusCode::Invalid);
            }
            ep.kind = EndpointKind::S3;
            ep.region.assign(spec);
        }
    } catch (const std::bad_alloc&) {
        return config_status(StatusCode::OutOfMemory);
    }

    *out = std::move(ep);
    return ok_status();
}

// ========================================================================
// Client factory
// ========================================================================

Status make_object_client(std::string_view spec, const ClientOptions& options, ObjectClientPtr* out) noexcept {
    if (out == nullptr) {
        return config_status(StatusCode::Invalid);
    }

    Endpoint ep{};
    Status s = parse_endpoint(spec, &ep);
    if (!is_ok(s)) {
        BOOST_LOG_TRIVIAL(error) << "invalid endpoint '" << spec << "'";
        return s;
    }

    switch (ep.kind) {
    case EndpointKind::Local:
        return LocalObjectClient::create(ep.root, out);
    case EndpointKind::S3:
        return S3ObjectClient::create(ep, options, out);
    }
    return config_status(StatusCode::Invalid);
}

} // namespace rangecat::storage
