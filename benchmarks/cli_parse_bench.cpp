#include <benchmark/benchmark.h>

#include "rangecat/cli/commands.hpp"
#include "rangecat/cli/options.hpp"

static void BM_CliParseOptions(benchmark::State& state) {
    rangecat::cli::u32 spec_count = 0;
    const rangecat::cli::OptionSpec* specs = rangecat::cli::rangecat_option_specs(&spec_count);

    const char* argv[] = {"--endpoint", "eu-west-1", "-j4", "--chunk-size=1048576", "-rbytes=0-99", "--",
        "bucket/key"};
    const rangecat::cli::CliArgs args{argv, 7};
    for (auto _ : state) {
        rangecat::cli::ParsedOption buf[8]{};
        rangecat::cli::ParsedOptions out{buf, 0, 8};
        rangecat::cli::u32 consumed = 0;
        const rangecat::core::Status s = rangecat::cli::parse_options(args, specs, spec_count, &out, &consumed);
        benchmark::DoNotOptimize(s.code);
        benchmark::DoNotOptimize(out.len);
        benchmark::DoNotOptimize(consumed);
    }
}
BENCHMARK(BM_CliParseOptions);

static void BM_CliParseCommand(benchmark::State& state) {
    rangecat::cli::u32 spec_count = 0;
    const rangecat::cli::CommandSpec* specs = rangecat::cli::rangecat_command_specs(&spec_count);

    const char* argv[] = {"ls-zip", "bucket/archive.zip"};
    const rangecat::cli::CliArgs args{argv, 2};
    for (auto _ : state) {
        rangecat::cli::CommandInvocation out{};
        rangecat::cli::u32 consumed = 0;
        const rangecat::core::Status s = rangecat::cli::parse_command(args, specs, spec_count, &out, &consumed);
        benchmark::DoNotOptimize(s.code);
        benchmark::DoNotOptimize(out.id);
        benchmark::DoNotOptimize(consumed);
    }
}
BENCHMARK(BM_CliParseCommand);
