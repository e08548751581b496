#include "rangecat/cli/commands.hpp"

#include <cstring>

namespace rangecat::cli {
    namespace {
        constexpr CommandSpec kRangecatCommands[] = {
            {CommandId::Help, "help"},
            {CommandId::Cat, "cat"},
            {CommandId::Plan, "plan"},
            {CommandId::LsZip, "ls-zip"},
        };

        [[nodiscard]] constexpr rangecat::core::Status cli_invalid() noexcept {
            return rangecat::core::make_status(rangecat::core::StatusDomain::Cli, rangecat::core::StatusCode::Invalid);
        }
    } // namespace

    const CommandSpec* rangecat_command_specs(u32* count) noexcept {
        if (count != nullptr) {
            *count = static_cast<u32>(sizeof(kRangecatCommands) / sizeof(kRangecatCommands[0]));
        }
        return kRangecatCommands;
    }

    rangecat::core::Status parse_command(const CliArgs& args,
        const CommandSpec* specs,
        u32 spec_count,
        CommandInvocation* out,
        u32* consumed) noexcept {
        if (out == nullptr || consumed == nullptr) {
            return cli_invalid();
        }
        *consumed = 0;
        out->id = CommandId::None;
        out->args = CliArgs{};

        if (args.argc == 0 || args.argv == nullptr || args.argv[0] == nullptr) {
            return cli_invalid();
        }
        if (spec_count > 0 && specs == nullptr) {
            return cli_invalid();
        }

        const char* cmd = args.argv[0];
        if (cmd[0] == '-') {
            return cli_invalid();
        }

        const CommandSpec* match = nullptr;
        for (u32 i = 0; i < spec_count; ++i) {
            const CommandSpec& s = specs[i];
            if (s.name != nullptr && std::strcmp(s.name, cmd) == 0) {
                match = &s;
                break;
            }
        }
        if (match == nullptr) {
            return rangecat::core::make_status(rangecat::core::StatusDomain::Cli, rangecat::core::StatusCode::NotFound);
        }

        out->id = match->id;
        out->args.argv = args.argv + 1;
        out->args.argc = args.argc - 1;
        *consumed = 1;
        return rangecat::core::ok_status();
    }
} // namespace rangecat::cli
