#include <array>

#include <gtest/gtest.h>

#include "rangecat/cli/commands.hpp"

TEST(CliCommands, ParsesKnownCommandAndReturnsRemainingArgs) {
    const std::array<rangecat::cli::CommandSpec, 3> specs = {{
        {rangecat::cli::CommandId::Help, "help"},
        {rangecat::cli::CommandId::Cat, "cat"},
        {rangecat::cli::CommandId::Plan, "plan"},
    }};

    const char* argv[] = {"cat", "--range", "bytes=0-9", "bucket/a"};
    const rangecat::cli::CliArgs args{argv, 4};

    rangecat::cli::CommandInvocation out{};
    rangecat::cli::u32 consumed = 0;
    const rangecat::core::Status s = rangecat::cli::parse_command(args, specs.data(), specs.size(), &out, &consumed);
    ASSERT_EQ(s.code, rangecat::core::StatusCode::Ok);
    EXPECT_EQ(consumed, 1u);
    EXPECT_EQ(out.id, rangecat::cli::CommandId::Cat);
    ASSERT_EQ(out.args.argc, 3u);
    EXPECT_STREQ(out.args.argv[0], "--range");
}

TEST(CliCommands, NotFoundOnUnknownCommand) {
    const std::array<rangecat::cli::CommandSpec, 1> specs = {{{rangecat::cli::CommandId::Help, "help"}}};
    const char* argv[] = {"nope"};
    rangecat::cli::CommandInvocation out{};
    rangecat::cli::u32 consumed = 0;
    const rangecat::core::Status s =
        rangecat::cli::parse_command({argv, 1}, specs.data(), specs.size(), &out, &consumed);
    EXPECT_EQ(s.code, rangecat::core::StatusCode::NotFound);
    EXPECT_EQ(s.domain, rangecat::core::StatusDomain::Cli);
    EXPECT_EQ(out.id, rangecat::cli::CommandId::None);
}

TEST(CliCommands, InvalidOnOptionOrEmptyInput) {
    const std::array<rangecat::cli::CommandSpec, 1> specs = {{{rangecat::cli::CommandId::Help, "help"}}};
    rangecat::cli::CommandInvocation out{};
    rangecat::cli::u32 consumed = 0;

    const char* argv[] = {"--help"};
    EXPECT_EQ(rangecat::cli::parse_command({argv, 1}, specs.data(), specs.size(), &out, &consumed).code,
        rangecat::core::StatusCode::Invalid);
    EXPECT_EQ(rangecat::cli::parse_command({argv, 0}, specs.data(), specs.size(), &out, &consumed).code,
        rangecat::core::StatusCode::Invalid);
}

TEST(CliCommands, ToolCommandTable) {
    rangecat::cli::u32 count = 0;
    const rangecat::cli::CommandSpec* specs = rangecat::cli::rangecat_command_specs(&count);
    ASSERT_EQ(count, 4u);

    const char* names[] = {"help", "cat", "plan", "ls-zip"};
    const rangecat::cli::CommandId ids[] = {
        rangecat::cli::CommandId::Help,
        rangecat::cli::CommandId::Cat,
        rangecat::cli::CommandId::Plan,
        rangecat::cli::CommandId::LsZip,
    };
    for (int i = 0; i < 4; ++i) {
        const char* argv[] = {names[i], "x"};
        rangecat::cli::CommandInvocation out{};
        rangecat::cli::u32 consumed = 0;
        ASSERT_EQ(rangecat::cli::parse_command({argv, 2}, specs, count, &out, &consumed).code,
            rangecat::core::StatusCode::Ok)
            << names[i];
        EXPECT_EQ(out.id, ids[i]);
        EXPECT_EQ(out.args.argc, 1u);
    }
}
