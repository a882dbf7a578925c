/**
 * @file resume_transfer.cpp
 * @brief Interrupt an upload and resume it from its saved state
 *
 * This example demonstrates:
 * - Cancelling a running job through its transfer_handle
 * - Inspecting saved job records with state_store::list()
 * - Restarting the same source and destination to resume the job
 */

#include <dx/transfer/transfer.h>
#include <dx/transfer/core/state_store.h>
#include <dx/transfer/transport/local_object_store.h>

#include "example_support.h"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <thread>
#include <vector>

using namespace dx::transfer;
using namespace dx::transfer::examples;

namespace {

/**
 * @brief Delays every put so the first run can be interrupted mid-way
 */
class throttled_service final : public remote_object_service {
public:
    throttled_service(std::shared_ptr<remote_object_service> inner,
                      std::chrono::milliseconds put_delay)
        : inner_(std::move(inner)), put_delay_(put_delay) {}

    auto open_upload_session(const std::string& object_id, uint64_t total_size,
                             const call_options& options)
        -> transport_result<std::string> override {
        return inner_->open_upload_session(object_id, total_size, options);
    }

    auto put_chunk(const std::string& session_token, uint64_t index,
                   std::span<const std::byte> data, const call_options& options)
        -> transport_result<chunk_ack> override {
        std::this_thread::sleep_for(put_delay_.load());
        return inner_->put_chunk(session_token, index, data, options);
    }

    auto get_chunk(const std::string& object_id, uint64_t index, uint64_t offset,
                   uint64_t length, const call_options& options)
        -> transport_result<std::vector<std::byte>> override {
        return inner_->get_chunk(object_id, index, offset, length, options);
    }

    auto close_object(const std::string& session_token, const std::string& whole_checksum,
                      const call_options& options) -> transport_result<void> override {
        return inner_->close_object(session_token, whole_checksum, options);
    }

    auto get_object_metadata(const std::string& object_id, const call_options& options)
        -> transport_result<object_metadata> override {
        return inner_->get_object_metadata(object_id, options);
    }

    auto abort_upload_session(const std::string& session_token, const call_options& options)
        -> transport_result<void> override {
        return inner_->abort_upload_session(session_token, options);
    }

    auto query_session_checksum(const std::string& session_token, const call_options& options)
        -> transport_result<std::optional<std::string>> override {
        return inner_->query_session_checksum(session_token, options);
    }

    void set_put_delay(std::chrono::milliseconds delay) { put_delay_ = delay; }

private:
    std::shared_ptr<remote_object_service> inner_;
    std::atomic<std::chrono::milliseconds> put_delay_;
};

void print_saved_states(const std::filesystem::path& state_dir) {
    state_store store(state_store_config{state_dir});
    auto states = store.list();
    if (states.empty()) {
        std::cout << "  (no saved jobs)" << std::endl;
        return;
    }
    for (const auto& s : states) {
        std::cout << "  " << s.id.to_string() << "  " << to_string(s.direction) << "  "
                  << s.local_path << " <-> " << s.object_id << "  " << s.completed_count()
                  << " chunks saved" << std::endl;
    }
}

}  // namespace

auto main(int argc, char* argv[]) -> int {
    std::filesystem::path work_dir = std::filesystem::temp_directory_path() / "dx_resume_example";
    if (argc > 1) {
        work_dir = argv[1];
    }

    const auto source = work_dir / "source.bin";
    const auto state_dir = work_dir / "state";
    const std::string object_id = "examples/source.bin";
    constexpr size_t file_size = 32 * 1024 * 1024;

    std::error_code ec;
    std::filesystem::remove_all(work_dir, ec);

    try {
        write_sample_file(source, file_size, 54321);
    } catch (const std::exception& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }
    std::cout << "Created " << source << " (" << format_bytes(file_size) << ")" << std::endl;

    auto store = local_object_store::create(work_dir / "store");
    if (!store) {
        std::cerr << "Cannot open object store" << std::endl;
        return 1;
    }
    auto service = std::make_shared<throttled_service>(store, std::chrono::milliseconds(100));

    auto config = transfer_config::builder()
                      .with_policy(chunk_policy::unbounded())
                      .with_chunk_size(1024 * 1024)
                      .with_parallelism(2)
                      .with_state_directory(state_dir)
                      .build();
    if (!config) {
        std::cerr << "Invalid configuration: " << config.error().message << std::endl;
        return 1;
    }

    transfer_context ctx;
    ctx.service = service;
    transfer_engine engine(ctx);

    auto src = transfer_endpoint::local(source);
    auto dst = transfer_endpoint::remote(object_id);

    // First run: cancel once roughly a third of the chunks are committed
    std::cout << std::endl << "=== First run ===" << std::endl;
    auto first = engine.start_transfer(src, dst, config.value());
    if (!first) {
        std::cerr << "Cannot start upload: " << first.error().message << std::endl;
        return 1;
    }

    std::optional<transfer_outcome> outcome;
    bool cancelled = false;
    while (!(outcome = first.value().wait_for(std::chrono::milliseconds(100)))) {
        auto p = first.value().progress();
        if (!cancelled && p.total_chunks > 0 && p.chunks_done * 3 >= p.total_chunks) {
            cancelled = true;
            std::cout << "Cancelling at " << p.chunks_done << "/" << p.total_chunks << " chunks"
                      << std::endl;
            first.value().cancel();
        }
    }
    std::cout << "First run ended: " << to_string(outcome->status) << std::endl;

    std::cout << std::endl << "Saved jobs in " << state_dir << ":" << std::endl;
    print_saved_states(state_dir);

    // Second run: same endpoints derive the same job id and pick up the saved state
    std::cout << std::endl << "=== Second run ===" << std::endl;
    service->set_put_delay(std::chrono::milliseconds(0));
    auto second = engine.start_transfer(src, dst, config.value());
    if (!second) {
        std::cerr << "Cannot resume upload: " << second.error().message << std::endl;
        return 1;
    }
    std::cout << "Resuming job " << second.value().id().to_string() << std::endl;

    auto final_outcome = second.value().await_completion();
    if (!final_outcome.succeeded()) {
        std::cerr << "Resume " << to_string(final_outcome.status) << ": "
                  << final_outcome.message << std::endl;
        return 1;
    }

    std::cout << "Resumed run transferred " << format_bytes(final_outcome.bytes_transferred)
              << " of " << format_bytes(file_size) << std::endl;
    std::cout << "Object checksum: " << final_outcome.message << std::endl;

    auto stats = store->get_statistics();
    std::cout << "Chunks stored across both runs: " << stats.chunks_put << std::endl;

    std::cout << std::endl << "Saved jobs after completion:" << std::endl;
    print_saved_states(state_dir);
    return 0;
}
