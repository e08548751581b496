#include <array>

#include <gtest/gtest.h>

#include "rangecat/cli/options.hpp"

TEST(CliOptions, ParsesLongAndShortAndStopsAtFirstRef) {
    const std::array<rangecat::cli::OptionSpec, 4> specs = {{
        {rangecat::cli::OptionId::Endpoint, rangecat::cli::OptionType::String, "endpoint", 'e'},
        {rangecat::cli::OptionId::Output, rangecat::cli::OptionType::String, "output", 'o'},
        {rangecat::cli::OptionId::MaxInFlight, rangecat::cli::OptionType::I64, "max-in-flight", 'j'},
        {rangecat::cli::OptionId::Help, rangecat::cli::OptionType::Flag, "help", 'h'},
    }};

    const char* argv[] = {"--help", "--endpoint", "file:///srv", "-o", "out.bin", "-j", "4", "bucket/a", "bucket/b"};
    const rangecat::cli::CliArgs args{argv, 9};

    rangecat::cli::ParsedOption buf[8]{};
    rangecat::cli::ParsedOptions out{buf, 0, 8};
    rangecat::cli::u32 consumed = 0;
    const rangecat::core::Status s = rangecat::cli::parse_options(args, specs.data(), specs.size(), &out, &consumed);
    ASSERT_EQ(s.code, rangecat::core::StatusCode::Ok);
    EXPECT_EQ(consumed, 7u);
    ASSERT_EQ(out.len, 4u);

    EXPECT_EQ(out.data[0].type, rangecat::cli::OptionType::Flag);
    EXPECT_EQ(out.data[0].value.boolv, 1);

    EXPECT_EQ(out.data[1].id, rangecat::cli::OptionId::Endpoint);
    EXPECT_STREQ(out.data[1].value.str, "file:///srv");

    EXPECT_EQ(out.data[2].id, rangecat::cli::OptionId::Output);
    EXPECT_STREQ(out.data[2].value.str, "out.bin");

    EXPECT_EQ(out.data[3].id, rangecat::cli::OptionId::MaxInFlight);
    EXPECT_EQ(out.data[3].value.i64v, 4);
}

TEST(CliOptions, SupportsEqualsAndAttachedValue) {
    const std::array<rangecat::cli::OptionSpec, 2> specs = {{
        {rangecat::cli::OptionId::Range, rangecat::cli::OptionType::String, "range", 'r'},
        {rangecat::cli::OptionId::ChunkSize, rangecat::cli::OptionType::I64, "chunk-size", 'c'},
    }};

    const char* argv[] = {"--range=bytes=0-99", "-c1048576"};
    const rangecat::cli::CliArgs args{argv, 2};

    rangecat::cli::ParsedOption buf[8]{};
    rangecat::cli::ParsedOptions out{buf, 0, 8};
    rangecat::cli::u32 consumed = 0;
    const rangecat::core::Status s = rangecat::cli::parse_options(args, specs.data(), specs.size(), &out, &consumed);
    ASSERT_EQ(s.code, rangecat::core::StatusCode::Ok);
    EXPECT_EQ(consumed, 2u);
    ASSERT_EQ(out.len, 2u);
    EXPECT_STREQ(out.data[0].value.str, "bytes=0-99");
    EXPECT_EQ(out.data[1].value.i64v, 1048576);
}

TEST(CliOptions, StopsAtDoubleDash) {
    const std::array<rangecat::cli::OptionSpec, 2> specs = {{
        {rangecat::cli::OptionId::Endpoint, rangecat::cli::OptionType::String, "endpoint", 'e'},
        {rangecat::cli::OptionId::Help, rangecat::cli::OptionType::Flag, "help", 'h'},
    }};

    const char* argv[] = {"--endpoint", "eu-west-1", "--", "--help"};
    const rangecat::cli::CliArgs args{argv, 4};

    rangecat::cli::ParsedOption buf[8]{};
    rangecat::cli::ParsedOptions out{buf, 0, 8};
    rangecat::cli::u32 consumed = 0;
    const rangecat::core::Status s = rangecat::cli::parse_options(args, specs.data(), specs.size(), &out, &consumed);
    ASSERT_EQ(s.code, rangecat::core::StatusCode::Ok);
    EXPECT_EQ(consumed, 3u);
    ASSERT_EQ(out.len, 1u);
    EXPECT_STREQ(out.data[0].value.str, "eu-west-1");
}

TEST(CliOptions, InvalidOnUnknownOrMissingValue) {
    const std::array<rangecat::cli::OptionSpec, 2> specs = {{
        {rangecat::cli::OptionId::Endpoint, rangecat::cli::OptionType::String, "endpoint", 'e'},
        {rangecat::cli::OptionId::ChunkSize, rangecat::cli::OptionType::I64, "chunk-size", 'c'},
    }};

    const char* cases[][2] = {
        {"--nope", nullptr},
        {"--endpoint", nullptr},
        {"-x", nullptr},
        {"--chunk-size", "12MB"},
        {"-c", "-"},
    };
    for (const auto& c : cases) {
        const rangecat::cli::u32 argc = c[1] == nullptr ? 1 : 2;
        rangecat::cli::ParsedOption buf[2]{};
        rangecat::cli::ParsedOptions out{buf, 0, 2};
        rangecat::cli::u32 consumed = 0;
        const rangecat::core::Status s =
            rangecat::cli::parse_options({c, argc}, specs.data(), specs.size(), &out, &consumed);
        EXPECT_EQ(s.code, rangecat::core::StatusCode::Invalid) << c[0];
        EXPECT_EQ(s.domain, rangecat::core::StatusDomain::Cli) << c[0];
    }
}

TEST(CliOptions, FlagRejectsValue) {
    const std::array<rangecat::cli::OptionSpec, 1> specs = {{
        {rangecat::cli::OptionId::Help, rangecat::cli::OptionType::Flag, "help", 'h'},
    }};
    const char* argv[] = {"--help=yes"};
    rangecat::cli::ParsedOption buf[2]{};
    rangecat::cli::ParsedOptions out{buf, 0, 2};
    rangecat::cli::u32 consumed = 0;
    const rangecat::core::Status s =
        rangecat::cli::parse_options({argv, 1}, specs.data(), specs.size(), &out, &consumed);
    EXPECT_EQ(s.code, rangecat::core::StatusCode::Invalid);
}

TEST(CliOptions, FailsWhenStorageIsFull) {
    rangecat::cli::u32 count = 0;
    const rangecat::cli::OptionSpec* specs = rangecat::cli::rangecat_option_specs(&count);
    const char* argv[] = {"-h", "-h", "-h"};
    rangecat::cli::ParsedOption buf[2]{};
    rangecat::cli::ParsedOptions out{buf, 0, 2};
    rangecat::cli::u32 consumed = 0;
    const rangecat::core::Status s = rangecat::cli::parse_options({argv, 3}, specs, count, &out, &consumed);
    EXPECT_EQ(s.code, rangecat::core::StatusCode::Invalid);
}

TEST(CliOptions, ToolSpecsAndLastOccurrenceWins) {
    rangecat::cli::u32 count = 0;
    const rangecat::cli::OptionSpec* specs = rangecat::cli::rangecat_option_specs(&count);
    ASSERT_NE(specs, nullptr);
    EXPECT_EQ(count, 8u);

    const char* argv[] = {"-s", "4096", "--log-level", "debug", "--sub-chunk-size=8192", "cat"};
    rangecat::cli::ParsedOption buf[8]{};
    rangecat::cli::ParsedOptions out{buf, 0, 8};
    rangecat::cli::u32 consumed = 0;
    ASSERT_EQ(rangecat::cli::parse_options({argv, 6}, specs, count, &out, &consumed).code,
        rangecat::core::StatusCode::Ok);
    EXPECT_EQ(consumed, 5u);

    const rangecat::cli::ParsedOption* sub = rangecat::cli::find_option(out, rangecat::cli::OptionId::SubChunkSize);
    ASSERT_NE(sub, nullptr);
    EXPECT_EQ(sub->value.i64v, 8192);

    const rangecat::cli::ParsedOption* level = rangecat::cli::find_option(out, rangecat::cli::OptionId::LogLevel);
    ASSERT_NE(level, nullptr);
    EXPECT_STREQ(level->value.str, "debug");

    EXPECT_EQ(rangecat::cli::find_option(out, rangecat::cli::OptionId::Output), nullptr);
}
