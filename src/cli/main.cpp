#include <csignal>
#include <cstdlib>

#include "rangecat/cli/run.hpp"

// ========================================================================
// Global State
// ========================================================================

volatile sig_atomic_t g_running = 1;

// ========================================================================
// Signal Handler
// ========================================================================

void sigint_handler(int sig) {
    (void)sig;
    g_running = 0;
}

int main(int argc, char** argv) {
    signal(SIGINT, sigint_handler);

    rangecat::cli::RunContext ctx;
    ctx.env = [](const char* name) -> const char* { return std::getenv(name); };
    ctx.running = &g_running;
    return rangecat::cli::run(argc, argv, ctx);
}
