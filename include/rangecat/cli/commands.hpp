#pragma once

#include <type_traits>

#include "rangecat/cli/options.hpp"
#include "rangecat/core/errors.hpp"

namespace rangecat::cli {
    using u32 = rangecat::core::u32;

    enum class CommandId : u32 {
        None = 0,
        Help = 1,
        Cat = 2,
        Plan = 3,
        LsZip = 4,
    };

    struct CommandSpec {
        CommandId id{CommandId::None};
        const char* name{nullptr};
    };

    struct CommandInvocation {
        CommandId id{CommandId::None};
        CliArgs args{};
    };

    // cat, plan, ls-zip, help.
    [[nodiscard]] const CommandSpec* rangecat_command_specs(u32* count) noexcept;

    // Matches argv[0] against 'specs'; out->args holds the remaining arguments.
    [[nodiscard]] rangecat::core::Status parse_command(const CliArgs& args,
        const CommandSpec* specs,
        u32 spec_count,
        CommandInvocation* out,
        u32* consumed) noexcept;

    static_assert(std::is_trivially_copyable_v<CommandSpec>);
    static_assert(std::is_trivially_copyable_v<CommandInvocation>);
    static_assert(std::is_standard_layout_v<CommandSpec>);
    static_assert(std::is_standard_layout_v<CommandInvocation>);

} // namespace rangecat::cli
