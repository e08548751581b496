#include "rangecat/cli/config.hpp"

#include <charconv>
#include <cstring>
#include <limits>
#include <new>

namespace rangecat::cli {
    namespace {
        [[nodiscard]] constexpr rangecat::core::Status config_invalid() noexcept {
            return rangecat::core::make_status(rangecat::core::StatusDomain::Config, rangecat::core::StatusCode::Invalid);
        }

        [[nodiscard]] bool parse_u64(const char* s, u64* out) noexcept {
            const char* end = s + std::strlen(s);
            u64 v{};
            auto r = std::from_chars(s, end, v, 10);
            if (s == end || r.ec != std::errc() || r.ptr != end) {
                return false;
            }
            *out = v;
            return true;
        }

        [[nodiscard]] bool positive_u32(i64 v, u32* out) noexcept {
            if (v <= 0 || static_cast<u64>(v) > std::numeric_limits<u32>::max()) {
                return false;
            }
            *out = static_cast<u32>(v);
            return true;
        }

        [[nodiscard]] bool env_u32(const char* s, u32* out) noexcept {
            u64 v = 0;
            if (!parse_u64(s, &v) || v == 0 || v > std::numeric_limits<u32>::max()) {
                return false;
            }
            *out = static_cast<u32>(v);
            return true;
        }
    } // namespace

    rangecat::core::Status apply_environment(CliConfig* cfg, EnvLookup lookup) noexcept {
        if (cfg == nullptr || lookup == nullptr) {
            return config_invalid();
        }

        try {
            if (const char* v = lookup("RANGECAT_ENDPOINT"); v != nullptr && *v != '\0') {
                cfg->endpoint = v;
            }
            if (const char* v = lookup("RANGECAT_LOG_LEVEL"); v != nullptr && *v != '\0') {
                cfg->log_level = v;
            }
        } catch (const std::bad_alloc&) {
            return rangecat::core::make_status(rangecat::core::StatusDomain::Config,
                rangecat::core::StatusCode::OutOfMemory);
        }

        if (const char* v = lookup("RANGECAT_CHUNK_SIZE"); v != nullptr && *v != '\0') {
            u64 n = 0;
            if (!parse_u64(v, &n) || n == 0) {
                return config_invalid();
            }
            cfg->chunk_size = n;
        }
        if (const char* v = lookup("RANGECAT_SUB_CHUNK_SIZE"); v != nullptr && *v != '\0') {
            if (!env_u32(v, &cfg->sub_chunk_size)) {
                return config_invalid();
            }
        }
        if (const char* v = lookup("RANGECAT_MAX_IN_FLIGHT"); v != nullptr && *v != '\0') {
            if (!env_u32(v, &cfg->max_in_flight)) {
                return config_invalid();
            }
        }
        return rangecat::core::ok_status();
    }

    rangecat::core::Status apply_options(CliConfig* cfg, const ParsedOptions& opts) noexcept {
        if (cfg == nullptr || (opts.len > 0 && opts.data == nullptr)) {
            return config_invalid();
        }

        try {
            for (u32 i = 0; i < opts.len; ++i) {
                const ParsedOption& o = opts.data[i];
                switch (o.id) {
                case OptionId::Endpoint:
                    cfg->endpoint = o.value.str;
                    break;
                case OptionId::Range:
                    cfg->range = o.value.str;
                    break;
                case OptionId::Output:
                    cfg->output = o.value.str;
                    break;
                case OptionId::LogLevel:
                    cfg->log_level = o.value.str;
                    break;
                case OptionId::ChunkSize:
                    if (o.value.i64v <= 0) {
                        return config_invalid();
                    }
                    cfg->chunk_size = static_cast<u64>(o.value.i64v);
                    break;
                case OptionId::SubChunkSize:
                    if (!positive_u32(o.value.i64v, &cfg->sub_chunk_size)) {
                        return config_invalid();
                    }
                    break;
                case OptionId::MaxInFlight:
                    if (!positive_u32(o.value.i64v, &cfg->max_in_flight)) {
                        return config_invalid();
                    }
                    break;
                case OptionId::Help:
                case OptionId::None:
                    break;
                }
            }
        } catch (const std::bad_alloc&) {
            return rangecat::core::make_status(rangecat::core::StatusDomain::Config,
                rangecat::core::StatusCode::OutOfMemory);
        }
        return rangecat::core::ok_status();
    }

    rangecat::core::Status stream_options_from_config(const CliConfig& cfg,
        rangecat::stream::StreamOptions* out) noexcept {
        if (out == nullptr) {
            return config_invalid();
        }
        if (cfg.chunk_size == 0 || cfg.sub_chunk_size == 0 || cfg.max_in_flight == 0 ||
            cfg.max_in_flight > kMaxInFlightLimit) {
            return config_invalid();
        }
        rangecat::stream::StreamOptions o{};
        o.chunk_size = cfg.chunk_size;
        o.sub_chunk_size = cfg.sub_chunk_size;
        o.max_in_flight = cfg.max_in_flight;
        *out = o;
        return rangecat::core::ok_status();
    }
} // namespace rangecat::cli
