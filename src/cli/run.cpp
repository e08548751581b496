#include "rangecat/cli/run.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <string>
#include <vector>

#include <boost/log/trivial.hpp>

#include "rangecat/archive/zip_locator.hpp"
#include "rangecat/bindings/stream.hpp"
#include "rangecat/cli/commands.hpp"
#include "rangecat/cli/options.hpp"
#include "rangecat/core/errors.hpp"
#include "rangecat/core/logging.hpp"
#include "rangecat/plan/manifest.hpp"
#include "rangecat/plan/range_planner.hpp"

namespace rangecat::cli {

namespace {

// ========================================================================
// Error Reporting
// ========================================================================

void print_error(const RunContext& ctx, const char* msg) {
    std::fprintf(ctx.err, "error: %s\n", msg);
}

void print_status_error_detailed(const RunContext& ctx, const char* context, rangecat::core::Status s) {
    std::fprintf(ctx.err,
                 "error: %s failed (code=%s/%u, domain=%s/%u, aux=%u)\n",
                 context,
                 rangecat::core::status_code_name(s.code),
                 static_cast<unsigned>(s.code),
                 rangecat::core::status_domain_name(s.domain),
                 static_cast<unsigned>(s.domain),
                 s.aux);
    if ((s.code == rangecat::core::StatusCode::Io || s.code == rangecat::core::StatusCode::Network) && s.aux != 0 &&
        s.domain != rangecat::core::StatusDomain::Net) {
        std::fprintf(ctx.err, "error: %s: %s\n", context, std::strerror(static_cast<int>(s.aux)));
    }
    if (s.domain == rangecat::core::StatusDomain::Net && s.aux >= 100 && s.aux < 600) {
        std::fprintf(ctx.err, "error: %s: HTTP status %u\n", context, s.aux);
    }
}

// ========================================================================
// Manifest Helpers
// ========================================================================

bool parse_refs(const RunContext& ctx, int argc, const char* const* argv,
                std::vector<rangecat::plan::ObjectRef>* out) {
    out->clear();
    for (int i = 0; i < argc; ++i) {
        rangecat::plan::ObjectRef ref;
        rangecat::core::Status s = rangecat::plan::parse_object_ref(argv[i], &ref);
        if (!rangecat::core::is_ok(s)) {
            std::fprintf(ctx.err, "error: bad object reference '%s' (expected container/key[!member])\n", argv[i]);
            return false;
        }
        out->push_back(std::move(ref));
    }
    return true;
}

bool build_client(const RunContext& ctx, const CliConfig& cfg, rangecat::storage::ObjectClientPtr* client) {
    if (cfg.endpoint.empty()) {
        print_error(ctx, "no endpoint (use --endpoint or RANGECAT_ENDPOINT)");
        return false;
    }
    rangecat::core::Status s =
        rangecat::storage::make_object_client(cfg.endpoint, rangecat::storage::ClientOptions{}, client);
    if (!rangecat::core::is_ok(s)) {
        print_status_error_detailed(ctx, "endpoint", s);
        return false;
    }
    return true;
}

// Resolves the references and the --range window.
bool load_manifest(const RunContext& ctx,
                   const CliConfig& cfg,
                   const rangecat::storage::ObjectClient& client,
                   int argc,
                   const char* const* argv,
                   std::vector<rangecat::core::FileEntry>* files,
                   rangecat::core::LogicalRange* range) {
    if (argc == 0) {
        print_error(ctx, "no object references given");
        return false;
    }
    std::vector<rangecat::plan::ObjectRef> refs;
    if (!parse_refs(ctx, argc, argv, &refs)) {
        return false;
    }

    rangecat::core::Status s = rangecat::plan::resolve_manifest(client, refs, files);
    if (!rangecat::core::is_ok(s)) {
        print_status_error_detailed(ctx, "manifest", s);
        return false;
    }

    *range = rangecat::core::LogicalRange::all();
    if (!cfg.range.empty()) {
        rangecat::core::u64 extent = 0;
        s = rangecat::plan::manifest_extent(*files, &extent);
        if (rangecat::core::is_ok(s)) {
            s = rangecat::plan::parse_byte_range(cfg.range, extent, range);
        }
        if (!rangecat::core::is_ok(s)) {
            std::fprintf(ctx.err, "error: bad range '%s'\n", cfg.range.c_str());
            return false;
        }
    }
    return true;
}

// ========================================================================
// Command Handlers
// ========================================================================

void handle_help(const RunContext& ctx) {
    std::FILE* out = ctx.out;
    std::fprintf(out, "Usage: rangecat <command> [options] <refs..>\n");
    std::fprintf(out, "Commands:\n");
    std::fprintf(out, "  cat <refs..>      Stream the concatenation of the referenced objects\n");
    std::fprintf(out, "  plan <refs..>     Print the ranged reads 'cat' would issue\n");
    std::fprintf(out, "  ls-zip <ref>      List the entries of a zip object\n");
    std::fprintf(out, "  help              Show this help\n");
    std::fprintf(out, "Options (before the references):\n");
    std::fprintf(out, "  -e, --endpoint <spec>        file:///dir, http(s)://host[:port] or a region name\n");
    std::fprintf(out, "  -c, --chunk-size <bytes>     Ranged read size (default 8 MiB)\n");
    std::fprintf(out, "  -s, --sub-chunk-size <bytes> Output buffer size (default 64 KiB)\n");
    std::fprintf(out, "  -j, --max-in-flight <n>      Concurrent ranged reads (default 1)\n");
    std::fprintf(out, "  -r, --range <bytes=A-B>      Logical byte window (A-B, A-, -N)\n");
    std::fprintf(out, "  -o, --output <path>          Write to a file instead of stdout\n");
    std::fprintf(out, "  -l, --log-level <level>      debug, info, warning or error\n");
    std::fprintf(out, "\n");
    std::fprintf(out, "Reference format: container/key, s3://container/key, zip+s3://container/archive.zip!member\n");
    std::fprintf(out, "Environment: RANGECAT_ENDPOINT, RANGECAT_CHUNK_SIZE, RANGECAT_SUB_CHUNK_SIZE,\n");
    std::fprintf(out, "             RANGECAT_MAX_IN_FLIGHT, RANGECAT_LOG_LEVEL\n");
}

int handle_cat(const RunContext& ctx, const CliConfig& cfg, int argc, const char* const* argv) {
    rangecat::stream::StreamOptions options;
    rangecat::core::Status s = stream_options_from_config(cfg, &options);
    if (!rangecat::core::is_ok(s)) {
        print_status_error_detailed(ctx, "options", s);
        return EXIT_FAILURE;
    }

    rangecat::storage::ObjectClientPtr client;
    if (!build_client(ctx, cfg, &client)) {
        return EXIT_FAILURE;
    }

    std::vector<rangecat::core::FileEntry> files;
    rangecat::core::LogicalRange range;
    if (!load_manifest(ctx, cfg, *client, argc, argv, &files, &range)) {
        return EXIT_FAILURE;
    }

    std::unique_ptr<rangecat::stream::MultiFileStreamAssembler> stream;
    s = rangecat::bindings::open_stream_with_client(client, files, range, options, &stream);
    if (!rangecat::core::is_ok(s)) {
        print_status_error_detailed(ctx, "plan", s);
        return EXIT_FAILURE;
    }

    std::FILE* out = ctx.out;
    if (!cfg.output.empty()) {
        out = std::fopen(cfg.output.c_str(), "wb");
        if (!out) {
            std::fprintf(ctx.err, "error: cannot open %s: %s\n", cfg.output.c_str(), std::strerror(errno));
            return EXIT_FAILURE;
        }
    }

    int rc = EXIT_SUCCESS;
    rangecat::core::OutputChunk chunk;
    for (;;) {
        if (ctx.running != nullptr && *ctx.running == 0) {
            stream->cancel();
        }
        bool done = false;
        s = stream->next(&chunk, &done);
        if (!rangecat::core::is_ok(s)) {
            print_status_error_detailed(ctx, "cat", s);
            rc = EXIT_FAILURE;
            break;
        }
        if (done) {
            break;
        }
        if (std::fwrite(chunk.bytes.data(), 1, chunk.size(), out) != chunk.size()) {
            std::fprintf(ctx.err, "error: write failed: %s\n", std::strerror(errno));
            stream->cancel();
            rc = EXIT_FAILURE;
            break;
        }
    }

    if (std::fflush(out) != 0) {
        rc = EXIT_FAILURE;
    }
    if (out != ctx.out && std::fclose(out) != 0) {
        rc = EXIT_FAILURE;
    }
    BOOST_LOG_TRIVIAL(info) << "wrote " << stream->bytes_emitted() << " of " << stream->total_bytes() << " bytes";
    return rc;
}

int handle_plan(const RunContext& ctx, const CliConfig& cfg, int argc, const char* const* argv) {
    rangecat::stream::StreamOptions options;
    rangecat::core::Status s = stream_options_from_config(cfg, &options);
    if (!rangecat::core::is_ok(s)) {
        print_status_error_detailed(ctx, "options", s);
        return EXIT_FAILURE;
    }

    rangecat::storage::ObjectClientPtr client;
    if (!build_client(ctx, cfg, &client)) {
        return EXIT_FAILURE;
    }

    std::vector<rangecat::core::FileEntry> files;
    rangecat::core::LogicalRange range;
    if (!load_manifest(ctx, cfg, *client, argc, argv, &files, &range)) {
        return EXIT_FAILURE;
    }

    std::vector<rangecat::core::FilePlan> plan;
    s = rangecat::plan::plan_ranges(files, range, options.chunk_size, &plan);
    if (!rangecat::core::is_ok(s)) {
        print_status_error_detailed(ctx, "plan", s);
        return EXIT_FAILURE;
    }

    for (const auto& fp : plan) {
        std::fprintf(ctx.out,
                     "file %zu %s/%s%s%s size=%llu offset=%llu data_offset=%llu\n",
                     fp.file_index,
                     fp.file.container_id.c_str(),
                     fp.file.object_key.c_str(),
                     fp.file.nested_path ? "!" : "",
                     fp.file.nested_path ? fp.file.nested_path->c_str() : "",
                     static_cast<unsigned long long>(fp.file.size),
                     static_cast<unsigned long long>(fp.file.logical_offset),
                     static_cast<unsigned long long>(fp.file.data_offset));
        for (const auto& r : fp.ranges) {
            std::fprintf(ctx.out,
                         "  %s/%s %llu-%llu\n",
                         r.container_id.c_str(),
                         r.object_key.c_str(),
                         static_cast<unsigned long long>(r.start),
                         static_cast<unsigned long long>(r.end));
        }
    }
    std::fprintf(ctx.out,
                 "%zu files, %zu fetches, %llu bytes\n",
                 plan.size(),
                 rangecat::plan::plan_fetch_count(plan),
                 static_cast<unsigned long long>(rangecat::plan::plan_total_bytes(plan)));
    return EXIT_SUCCESS;
}

const char* zip_method_name(rangecat::core::u16 method) {
    switch (method) {
        case 0: return "stored";
        case 8: return "deflate";
        case 12: return "bzip2";
        case 14: return "lzma";
        case 93: return "zstd";
        default: return "other";
    }
}

int handle_ls_zip(const RunContext& ctx, const CliConfig& cfg, int argc, const char* const* argv) {
    if (argc != 1) {
        print_error(ctx, "ls-zip takes exactly one object reference");
        return EXIT_FAILURE;
    }
    rangecat::plan::ObjectRef ref;
    rangecat::core::Status s = rangecat::plan::parse_object_ref(argv[0], &ref);
    if (!rangecat::core::is_ok(s) || ref.nested_path) {
        std::fprintf(ctx.err, "error: bad archive reference '%s' (expected container/key)\n", argv[0]);
        return EXIT_FAILURE;
    }

    rangecat::storage::ObjectClientPtr client;
    if (!build_client(ctx, cfg, &client)) {
        return EXIT_FAILURE;
    }

    std::vector<rangecat::archive::ZipEntry> entries;
    s = rangecat::archive::zip_list_entries(*client, ref.container_id, ref.object_key, &entries);
    if (!rangecat::core::is_ok(s)) {
        print_status_error_detailed(ctx, "ls-zip", s);
        return EXIT_FAILURE;
    }

    for (const auto& e : entries) {
        std::fprintf(ctx.out, "%12u  %-8s  %s\n", e.uncompressed_size, zip_method_name(e.method), e.name.c_str());
    }
    return EXIT_SUCCESS;
}

} // namespace

// ========================================================================
// Dispatch
// ========================================================================

int run(int argc, const char* const* argv, const RunContext& ctx) {
    if (argc < 2) {
        handle_help(ctx);
        return EXIT_FAILURE;
    }

    // Parse command
    u32 command_count = 0;
    const CommandSpec* commands = rangecat_command_specs(&command_count);
    CommandInvocation cmd;
    u32 consumed = 0;
    const CliArgs args{argv + 1, static_cast<u32>(argc - 1)};
    rangecat::core::Status s = parse_command(args, commands, command_count, &cmd, &consumed);
    if (!rangecat::core::is_ok(s)) {
        std::fprintf(ctx.err, "error: unknown command '%s'\n", argv[1]);
        handle_help(ctx);
        return EXIT_FAILURE;
    }

    // Parse options
    u32 option_count = 0;
    const OptionSpec* option_specs = rangecat_option_specs(&option_count);
    ParsedOption storage[32];
    ParsedOptions opts{storage, 0, 32};
    s = parse_options(cmd.args, option_specs, option_count, &opts, &consumed);
    if (!rangecat::core::is_ok(s)) {
        print_status_error_detailed(ctx, "option parsing", s);
        return EXIT_FAILURE;
    }
    if (find_option(opts, OptionId::Help) != nullptr) {
        handle_help(ctx);
        return EXIT_SUCCESS;
    }

    // Configuration
    CliConfig cfg;
    s = rangecat::core::ok_status();
    if (ctx.env != nullptr) {
        s = apply_environment(&cfg, ctx.env);
    }
    if (rangecat::core::is_ok(s)) {
        s = apply_options(&cfg, opts);
    }
    if (!rangecat::core::is_ok(s)) {
        print_status_error_detailed(ctx, "configuration", s);
        return EXIT_FAILURE;
    }
    rangecat::core::init_logging(cfg.log_level);

    const int rest_argc = static_cast<int>(cmd.args.argc - consumed);
    const char* const* rest_argv = cmd.args.argv + consumed;

    switch (cmd.id) {
        case CommandId::Help:
            handle_help(ctx);
            return EXIT_SUCCESS;
        case CommandId::Cat:
            return handle_cat(ctx, cfg, rest_argc, rest_argv);
        case CommandId::Plan:
            return handle_plan(ctx, cfg, rest_argc, rest_argv);
        case CommandId::LsZip:
            return handle_ls_zip(ctx, cfg, rest_argc, rest_argv);
        default:
            print_error(ctx, "unknown command");
            return EXIT_FAILURE;
    }
}

} // namespace rangecat::cli
