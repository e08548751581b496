#pragma once

#include <string>

#include "rangecat/cli/options.hpp"
#include "rangecat/core/errors.hpp"
#include "rangecat/stream/assembler.hpp"

namespace rangecat::cli {
    using u64 = rangecat::core::u64;

    inline constexpr u32 kMaxInFlightLimit = 64;

    // Effective settings of one invocation: defaults, then environment, then flags.
    struct CliConfig {
        std::string endpoint;
        u64 chunk_size{rangecat::stream::kDefaultChunkSize};
        u32 sub_chunk_size{rangecat::stream::kDefaultSubChunkSize};
        u32 max_in_flight{1};
        std::string range;  // "bytes=A-B" and friends; empty = everything
        std::string output; // empty = stdout
        std::string log_level{"warning"};
    };

    // getenv-compatible lookup, so tests can supply their own environment.
    using EnvLookup = const char* (*)(const char* name);

    // Reads RANGECAT_ENDPOINT, RANGECAT_CHUNK_SIZE, RANGECAT_SUB_CHUNK_SIZE,
    // RANGECAT_MAX_IN_FLIGHT and RANGECAT_LOG_LEVEL. Unset or empty variables
    // leave the field alone; malformed numbers are Config/Invalid.
    [[nodiscard]] rangecat::core::Status apply_environment(CliConfig* cfg, EnvLookup lookup) noexcept;

    // Applies parsed command-line options on top of 'cfg'.
    [[nodiscard]] rangecat::core::Status apply_options(CliConfig* cfg, const ParsedOptions& opts) noexcept;

    // Range checks the sizes and converts them for the assembler.
    [[nodiscard]] rangecat::core::Status stream_options_from_config(const CliConfig& cfg,
        rangecat::stream::StreamOptions* out) noexcept;

} // namespace rangecat::cli
