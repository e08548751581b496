#include "rangecat/cli/options.hpp"

#include <charconv>
#include <cstring>

namespace rangecat::cli {
    namespace {
        constexpr OptionSpec kRangecatOptions[] = {
            {OptionId::Endpoint, OptionType::String, "endpoint", 'e'},
            {OptionId::ChunkSize, OptionType::I64, "chunk-size", 'c'},
            {OptionId::SubChunkSize, OptionType::I64, "sub-chunk-size", 's'},
            {OptionId::MaxInFlight, OptionType::I64, "max-in-flight", 'j'},
            {OptionId::Range, OptionType::String, "range", 'r'},
            {OptionId::Output, OptionType::String, "output", 'o'},
            {OptionId::LogLevel, OptionType::String, "log-level", 'l'},
            {OptionId::Help, OptionType::Flag, "help", 'h'},
        };

        [[nodiscard]] constexpr rangecat::core::Status cli_invalid() noexcept {
            return rangecat::core::make_status(rangecat::core::StatusDomain::Cli, rangecat::core::StatusCode::Invalid);
        }

        [[nodiscard]] const OptionSpec* find_long(const OptionSpec* specs, u32 spec_count, const char* name) noexcept {
            if (name == nullptr) {
                return nullptr;
            }
            for (u32 i = 0; i < spec_count; ++i) {
                const OptionSpec& s = specs[i];
                if (s.long_name != nullptr && std::strcmp(s.long_name, name) == 0) {
                    return &s;
                }
            }
            return nullptr;
        }

        [[nodiscard]] const OptionSpec* find_short(const OptionSpec* specs, u32 spec_count, char c) noexcept {
            if (c == '\0') {
                return nullptr;
            }
            for (u32 i = 0; i < spec_count; ++i) {
                const OptionSpec& s = specs[i];
                if (s.short_name == c) {
                    return &s;
                }
            }
            return nullptr;
        }

        [[nodiscard]] bool parse_i64(const char* s, i64* out) noexcept {
            if (out == nullptr || s == nullptr) {
                return false;
            }
            const char* end = s + std::strlen(s);
            i64 v{};
            auto r = std::from_chars(s, end, v, 10);
            if (r.ec != std::errc() || r.ptr != end) {
                return false;
            }
            *out = v;
            return true;
        }

        [[nodiscard]] rangecat::core::Status push_option(ParsedOptions* out, const ParsedOption& opt) noexcept {
            if (out == nullptr || out->cap == 0 || out->data == nullptr) {
                return cli_invalid();
            }
            if (out->len >= out->cap) {
                return cli_invalid();
            }
            out->data[out->len++] = opt;
            return rangecat::core::ok_status();
        }

        // Converts 'value' per the spec type and appends the option.
        [[nodiscard]] rangecat::core::Status push_valued(ParsedOptions* out, const OptionSpec& spec,
            const char* value) noexcept {
            ParsedOption opt{};
            opt.id = spec.id;
            opt.type = spec.type;
            switch (spec.type) {
            case OptionType::String:
                opt.value.str = value;
                break;
            case OptionType::I64: {
                i64 v{};
                if (!parse_i64(value, &v)) {
                    return cli_invalid();
                }
                opt.value.i64v = v;
                break;
            }
            default:
                return cli_invalid();
            }
            return push_option(out, opt);
        }

        [[nodiscard]] rangecat::core::Status push_flag(ParsedOptions* out, const OptionSpec& spec) noexcept {
            ParsedOption opt{};
            opt.id = spec.id;
            opt.type = spec.type;
            opt.value.boolv = 1;
            return push_option(out, opt);
        }
    } // namespace

    const OptionSpec* rangecat_option_specs(u32* count) noexcept {
        if (count != nullptr) {
            *count = static_cast<u32>(sizeof(kRangecatOptions) / sizeof(kRangecatOptions[0]));
        }
        return kRangecatOptions;
    }

    rangecat::core::Status parse_options(const CliArgs& args,
        const OptionSpec* specs,
        u32 spec_count,
        ParsedOptions* out,
        u32* consumed) noexcept {
        if (out == nullptr || consumed == nullptr) {
            return cli_invalid();
        }
        *consumed = 0;
        out->len = 0;

        if (args.argc > 0 && args.argv == nullptr) {
            return cli_invalid();
        }
        if (spec_count > 0 && specs == nullptr) {
            return cli_invalid();
        }

        u32 i = 0;
        while (i < args.argc) {
            const char* tok = args.argv[i];
            if (tok == nullptr) {
                break;
            }
            if (tok[0] != '-' || tok[1] == '\0') {
                break;
            }
            if (std::strcmp(tok, "--") == 0) {
                ++i;
                break;
            }

            if (tok[1] == '-') {
                const char* name = tok + 2;
                const char* value = nullptr;
                char name_buf[128]{};
                const char* eq = std::strchr(name, '=');
                if (eq != nullptr) {
                    const size_t name_len = static_cast<size_t>(eq - name);
                    if (name_len == 0 || name_len >= sizeof(name_buf)) {
                        return cli_invalid();
                    }
                    std::memcpy(name_buf, name, name_len);
                    name_buf[name_len] = '\0';
                    name = name_buf;
                    value = eq + 1;
                }

                const OptionSpec* spec = find_long(specs, spec_count, name);
                if (spec == nullptr) {
                    return cli_invalid();
                }

                if (spec->type == OptionType::Flag) {
                    if (value != nullptr) {
                        return cli_invalid();
                    }
                    const rangecat::core::Status s = push_flag(out, *spec);
                    if (!rangecat::core::is_ok(s)) {
                        return s;
                    }
                    ++i;
                    continue;
                }

                if (value == nullptr) {
                    if (i + 1 >= args.argc || args.argv[i + 1] == nullptr) {
                        return cli_invalid();
                    }
                    value = args.argv[i + 1];
                    i += 2;
                } else {
                    ++i;
                }

                const rangecat::core::Status s = push_valued(out, *spec, value);
                if (!rangecat::core::is_ok(s)) {
                    return s;
                }
                continue;
            }

            const OptionSpec* spec = find_short(specs, spec_count, tok[1]);
            if (spec == nullptr) {
                return cli_invalid();
            }

            if (spec->type == OptionType::Flag) {
                if (tok[2] != '\0') {
                    return cli_invalid();
                }
                const rangecat::core::Status s = push_flag(out, *spec);
                if (!rangecat::core::is_ok(s)) {
                    return s;
                }
                ++i;
                continue;
            }

            const char* value = nullptr;
            if (tok[2] != '\0') {
                value = tok + 2;
                ++i;
            } else {
                if (i + 1 >= args.argc || args.argv[i + 1] == nullptr) {
                    return cli_invalid();
                }
                value = args.argv[i + 1];
                i += 2;
            }

            const rangecat::core::Status s = push_valued(out, *spec, value);
            if (!rangecat::core::is_ok(s)) {
                return s;
            }
        }

        *consumed = i;
        return rangecat::core::ok_status();
    }

    const ParsedOption* find_option(const ParsedOptions& opts, OptionId id) noexcept {
        const ParsedOption* found = nullptr;
        for (u32 i = 0; i < opts.len; ++i) {
            if (opts.data[i].id == id) {
                found = &opts.data[i];
            }
        }
        return found;
    }
} // namespace rangecat::cli
