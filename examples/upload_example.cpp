/**
 * @file upload_example.cpp
 * @brief Upload a local file to an object store with progress reporting
 *
 * This example demonstrates:
 * - Building a transfer_config on top of DX_TRANSFER_* environment settings
 * - Starting a job through transfer_engine and polling its progress
 * - Reading the outcome of a finished or failed job
 */

#include <dx/transfer/transfer.h>
#include <dx/transfer/transport/local_object_store.h>

#include "example_support.h"

#include <chrono>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>

using namespace dx::transfer;
using namespace dx::transfer::examples;

namespace {

void print_progress(const transfer_progress& p) {
    std::cout << "\r[" << std::setw(6) << std::fixed << std::setprecision(2)
              << p.completion_percentage() << "%] " << format_bytes(p.bytes_done) << " / "
              << format_bytes(p.bytes_total) << "  chunks " << p.chunks_done << "/"
              << p.total_chunks << "  " << format_rate(p.rate) << "  retries " << p.retries
              << "        " << std::flush;
}

void print_usage(const char* program) {
    std::cout << "Upload a local file to a directory-backed object store\n\n"
              << "Usage: " << program << " [options] <local_file> <object_id>\n\n"
              << "Options:\n"
              << "  -s, --store <dir>        Object store directory (default: ./object_store)\n"
              << "  -c, --chunk-size <size>  Chunk size, e.g. 8M (default: policy choice)\n"
              << "  -p, --parallel <n>       Concurrent chunks (default: hardware threads)\n"
              << "  --sha256                 Use SHA-256 digests instead of MD5\n"
              << "  --create-test <size>     Write a sample file of the given size first\n"
              << "  --help                   Show this help message\n\n"
              << "Settings not given here come from DX_TRANSFER_CHUNK_SIZE,\n"
              << "DX_TRANSFER_PARALLELISM, DX_TRANSFER_MAX_RETRIES, DX_TRANSFER_TIMEOUT_MS,\n"
              << "DX_TRANSFER_STATE_DIR and DX_TRANSFER_CHECKSUM.\n\n"
              << "  " << program << " reads.bam project/reads.bam\n"
              << "  " << program << " -c 16M -p 8 --sha256 genome.fa refs/genome.fa\n"
              << "  " << program << " --create-test 100M test.bin scratch/test.bin\n";
}

}  // namespace

auto main(int argc, char* argv[]) -> int {
    std::filesystem::path store_dir = "object_store";
    std::optional<uint64_t> chunk_size;
    std::optional<std::size_t> parallelism;
    bool use_sha256 = false;
    std::optional<uint64_t> test_size;
    std::string local_file;
    std::string object_id;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        bool has_value = i + 1 < argc;
        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        }
        if ((arg == "-s" || arg == "--store") && has_value) {
            store_dir = argv[++i];
        } else if ((arg == "-c" || arg == "--chunk-size") && has_value) {
            chunk_size = parse_byte_size(argv[++i]);
            if (!chunk_size) {
                std::cerr << "Bad chunk size: " << argv[i] << "\n";
                return 1;
            }
        } else if ((arg == "-p" || arg == "--parallel") && has_value) {
            parallelism = parse_count(argv[++i]);
            if (!parallelism) {
                std::cerr << "Bad parallelism: " << argv[i] << "\n";
                return 1;
            }
        } else if (arg == "--sha256") {
            use_sha256 = true;
        } else if (arg == "--create-test" && has_value) {
            test_size = parse_byte_size(argv[++i]);
            if (!test_size) {
                std::cerr << "Bad test file size: " << argv[i] << "\n";
                return 1;
            }
        } else if (local_file.empty()) {
            local_file = arg;
        } else if (object_id.empty()) {
            object_id = arg;
        } else {
            std::cerr << "Unexpected argument: " << arg << "\n";
            return 1;
        }
    }

    if (local_file.empty() || object_id.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    if (test_size) {
        try {
            write_sample_file(local_file, *test_size);
        } catch (const std::exception& e) {
            std::cerr << e.what() << std::endl;
            return 1;
        }
        std::cout << "Wrote sample file " << local_file << " (" << format_bytes(*test_size)
                  << ")" << std::endl;
    }

    auto base = transfer_config::from_environment();
    if (!base) {
        std::cerr << "Bad environment: " << base.error().message << std::endl;
        return 1;
    }

    transfer_config::builder builder(base.value());
    builder.with_policy(chunk_policy::unbounded());
    if (chunk_size) {
        builder.with_chunk_size(*chunk_size);
    }
    if (parallelism) {
        builder.with_parallelism(*parallelism);
    }
    if (use_sha256) {
        builder.with_checksum(checksum_algorithm::sha256);
    }
    auto config = builder.build();
    if (!config) {
        std::cerr << "Invalid configuration: " << config.error().message << std::endl;
        return 1;
    }

    auto store = local_object_store::create(store_dir, config.value().checksum);
    if (!store) {
        std::cerr << "Cannot open object store at " << store_dir << std::endl;
        return 1;
    }

    transfer_context ctx;
    ctx.service = store;
    transfer_engine engine(ctx);

    auto handle = engine.start_transfer(transfer_endpoint::local(local_file),
                                        transfer_endpoint::remote(object_id), config.value());
    if (!handle) {
        std::cerr << "Cannot start upload: " << handle.error().message << std::endl;
        return 1;
    }

    std::cout << "Uploading " << local_file << " -> " << object_id << " (job "
              << handle.value().id().to_string() << ")" << std::endl;

    std::optional<transfer_outcome> outcome;
    while (!(outcome = handle.value().wait_for(std::chrono::milliseconds(250)))) {
        print_progress(handle.value().progress());
    }
    print_progress(handle.value().progress());
    std::cout << std::endl;

    if (!outcome->succeeded()) {
        std::cerr << "Upload " << to_string(outcome->status) << ": " << outcome->message
                  << std::endl;
        if (outcome->failing_chunk) {
            std::cerr << "  failing chunk: " << *outcome->failing_chunk << " after "
                      << outcome->attempts << " attempts (" << to_string(outcome->last_error)
                      << ")" << std::endl;
        }
        std::cerr << "  Run again with the same arguments to resume." << std::endl;
        return 1;
    }

    auto seconds = std::chrono::duration<double>(outcome->elapsed).count();
    std::cout << "Upload complete: " << format_bytes(outcome->bytes_transferred) << " in "
              << std::fixed << std::setprecision(2) << seconds << "s" << std::endl;
    std::cout << "Object checksum: " << outcome->message << std::endl;
    return 0;
}
