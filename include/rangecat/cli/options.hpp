#pragma once

#include <type_traits>

#include "rangecat/core/errors.hpp"
#include "rangecat/core/types.hpp"

namespace rangecat::cli {
    using u8 = rangecat::core::u8;
    using u32 = rangecat::core::u32;
    using i64 = rangecat::core::i64;

    struct CliArgs {
        const char* const* argv{nullptr};
        u32 argc{0};
    };

    enum class OptionType : u8 {
        Flag = 0,
        String = 1,
        I64 = 2,
    };

    enum class OptionId : u32 {
        None = 0,
        Endpoint = 1,
        ChunkSize = 2,
        SubChunkSize = 3,
        MaxInFlight = 4,
        Range = 5,
        Output = 6,
        LogLevel = 7,
        Help = 8,
    };

    struct OptionSpec {
        OptionId id{OptionId::None};
        OptionType type{OptionType::Flag};
        const char* long_name{nullptr};
        char short_name{'\0'};
    };

    union OptionValue {
        const char* str;
        i64 i64v;
        u8 boolv;
    };

    struct ParsedOption {
        OptionId id{OptionId::None};
        OptionType type{OptionType::Flag};
        OptionValue value{};
    };

    // Caller-owned storage; parse_options() fails once 'cap' is reached.
    struct ParsedOptions {
        ParsedOption* data{nullptr};
        u32 len{0};
        u32 cap{0};
    };

    // The options of the rangecat tool.
    [[nodiscard]] const OptionSpec* rangecat_option_specs(u32* count) noexcept;

    // Parses leading options ("--name value", "--name=value", "-x value", "-xvalue")
    // and stops at the first positional argument or after "--".
    // *consumed is the number of argv entries taken.
    [[nodiscard]] rangecat::core::Status parse_options(const CliArgs& args,
        const OptionSpec* specs,
        u32 spec_count,
        ParsedOptions* out,
        u32* consumed) noexcept;

    // Last occurrence of 'id', or nullptr.
    [[nodiscard]] const ParsedOption* find_option(const ParsedOptions& opts, OptionId id) noexcept;

    static_assert(std::is_trivially_copyable_v<CliArgs>);
    static_assert(std::is_trivially_copyable_v<OptionSpec>);
    static_assert(std::is_trivially_copyable_v<ParsedOption>);
    static_assert(std::is_trivially_copyable_v<ParsedOptions>);
    static_assert(std::is_standard_layout_v<CliArgs>);
    static_assert(std::is_standard_layout_v<OptionSpec>);
    static_assert(std::is_standard_layout_v<ParsedOption>);
    static_assert(std::is_standard_layout_v<ParsedOptions>);

} // namespace rangecat::cli
