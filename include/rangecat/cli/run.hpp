#pragma once

#include <csignal>
#include <cstdio>

#include "rangecat/cli/config.hpp"

namespace rangecat::cli {

    // Where one invocation reads its environment and writes its output.
    struct RunContext {
        std::FILE* out{stdout}; // help, plan listings and object bytes without --output
        std::FILE* err{stderr}; // "error: ..." lines
        EnvLookup env{nullptr}; // nullptr = no environment
        // 'cat' cancels the stream once this drops to 0. May be null.
        const volatile std::sig_atomic_t* running{nullptr};
    };

    // Runs the rangecat tool. argv[0] is the program name, argv[1] the
    // command. Returns the process exit status.
    [[nodiscard]] int run(int argc, const char* const* argv, const RunContext& ctx);

} // namespace rangecat::cli
