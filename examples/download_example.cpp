/**
 * @file download_example.cpp
 * @brief Download an object from a local object store
 *
 * This example demonstrates:
 * - Downloading into a directory or to an explicit file path
 * - Per-chunk and whole-object verification against remote checksums
 * - Running a job directly on a transfer_orchestrator with a cancellation token
 */

#include <dx/transfer/transfer.h>
#include <dx/transfer/engine/transfer_orchestrator.h>
#include <dx/transfer/transport/local_object_store.h>

#include "example_support.h"

#include <csignal>
#include <filesystem>
#include <iostream>
#include <string>

using namespace dx::transfer;
using namespace dx::transfer::examples;

namespace {

cancellation_token* g_token = nullptr;

void on_signal(int /*sig*/) {
    if (g_token) {
        g_token->cancel();
    }
}

}  // namespace

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options] <object_id> <destination>\n\n"
              << "Downloads into <destination>, or into <destination>/<object name> when it\n"
              << "is a directory. Bytes land in <file>.part, renamed once verified.\n\n"
              << "  -s, --store <dir>     Object store directory (default: ./object_store)\n"
              << "  -p, --parallel <n>    Concurrent chunks (default: 4)\n"
              << "  --no-verify           Skip the whole-object checksum comparison\n"
              << "  --cleanup             Delete partial data if the download fails\n"
              << "  --help                Show this help message\n\n"
              << "Ctrl+C stops the download; the same command resumes it.\n";
}

auto main(int argc, char* argv[]) -> int {
    std::filesystem::path store_dir = "object_store";
    size_t parallelism = 4;
    bool verify = true;
    bool cleanup = false;
    std::string object_id;
    std::string destination;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if ((arg == "-s" || arg == "--store") && i + 1 < argc) {
            store_dir = argv[++i];
        } else if ((arg == "-p" || arg == "--parallel") && i + 1 < argc) {
            auto n = parse_count(argv[++i]);
            if (!n) {
                std::cerr << "Invalid parallelism: " << argv[i] << std::endl;
                return 1;
            }
            parallelism = *n;
        } else if (arg == "--no-verify") {
            verify = false;
        } else if (arg == "--cleanup") {
            cleanup = true;
        } else if (object_id.empty()) {
            object_id = arg;
        } else if (destination.empty()) {
            destination = arg;
        } else {
            std::cerr << "Unexpected argument: " << arg << std::endl;
            return 1;
        }
    }

    if (object_id.empty() || destination.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    auto store = local_object_store::create(store_dir);
    if (!store) {
        std::cerr << "Cannot open object store at " << store_dir << std::endl;
        return 1;
    }
    if (!store->object_exists(object_id)) {
        std::cerr << "No such object: " << object_id << std::endl;
        return 1;
    }

    // Objects in a local store may use chunks below the platform minimum
    auto config = transfer_config::builder()
                      .with_policy(chunk_policy::unbounded())
                      .with_parallelism(parallelism)
                      .with_whole_object_verification(verify)
                      .with_cleanup_on_abort(cleanup)
                      .build();
    if (!config) {
        std::cerr << "Invalid configuration: " << config.error().message << std::endl;
        return 1;
    }

    transfer_context ctx;
    ctx.service = store;

    auto source = transfer_endpoint::remote(object_id);
    auto target = transfer_endpoint::local(destination);
    transfer_orchestrator job(ctx, job_id::derive(source.describe(), target.describe()), source,
                              target, config.value());

    cancellation_token token;
    g_token = &token;
    std::signal(SIGINT, on_signal);

    std::cout << "Downloading " << object_id << " -> " << destination << std::endl;
    auto outcome = job.run(token);
    g_token = nullptr;

    auto p = job.progress();
    if (!outcome.succeeded()) {
        std::cerr << "Download " << to_string(outcome.status) << " at " << p.chunks_done << "/"
                  << p.total_chunks << " chunks: " << outcome.message << std::endl;
        return outcome.status == job_state::cancelled ? 130 : 1;
    }

    std::cout << "Downloaded " << format_bytes(p.bytes_total) << " in " << p.total_chunks
              << " chunks";
    if (p.retries > 0) {
        std::cout << " (" << p.retries << " retries)";
    }
    std::cout << std::endl;
    std::cout << "Object checksum: " << outcome.message << std::endl;
    return 0;
}
