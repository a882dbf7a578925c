/**
 * @file progress_tracker.cpp
 * @brief Implementation of the completed-chunk tracker
 */

#include "dx/transfer/core/progress_tracker.h"

#include "dx/transfer/core/logging.h"

namespace dx::transfer {

progress_tracker::progress_tracker(chunk_plan plan, transfer_state identity)
    : plan_(std::move(plan)), state_(std::move(identity)), results_(plan_.chunk_count()) {
    state_.total_size = plan_.total_size;
    state_.chunk_size = plan_.chunk_size;
    state_.completed.clear();
    auto now = std::chrono::system_clock::now();
    if (state_.created_at == std::chrono::system_clock::time_point{}) {
        state_.created_at = now;
    }
    state_.updated_at = now;
}

auto progress_tracker::mark_complete(uint64_t index, const std::string& checksum)
    -> result<void> {
    if (index >= plan_.chunk_count()) {
        return unexpected(error(error_code::invalid_chunk_index,
                                "chunk index " + std::to_string(index) + " outside plan"));
    }
    if (checksum.empty()) {
        return unexpected(error(error_code::state_inconsistency,
                                "chunk " + std::to_string(index) + " completed without checksum"));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = state_.completed.find(index);
    if (it != state_.completed.end()) {
        if (it->second == checksum) {
            return {};
        }
        DXT_LOG_ERROR(log_category::tracker,
                      "chunk " + std::to_string(index) + " completed twice with different checksums");
        return unexpected(error(error_code::state_inconsistency,
                                "chunk " + std::to_string(index) + " checksum changed: " +
                                    it->second + " vs " + checksum));
    }

    state_.completed.emplace(index, checksum);
    auto now = std::chrono::system_clock::now();
    state_.updated_at = now;
    auto& res = results_[index];
    res.completed_at = now;
    res.checksum = checksum;
    res.last_error = error_kind::none;
    bytes_done_.fetch_add(plan_.chunks[index].length, std::memory_order_relaxed);
    return {};
}

auto progress_tracker::is_complete(uint64_t index) const -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.completed.count(index) != 0;
}

auto progress_tracker::pending_chunks() const -> std::vector<uint64_t> {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<uint64_t> pending;
    pending.reserve(plan_.chunk_count() - state_.completed.size());
    for (uint64_t i = 0; i < plan_.chunk_count(); ++i) {
        if (state_.completed.count(i) == 0) {
            pending.push_back(i);
        }
    }
    return pending;
}

auto progress_tracker::snapshot() const -> transfer_state {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

auto progress_tracker::restore(const transfer_state& state) -> result<void> {
    if (state.total_size != plan_.total_size || state.chunk_size != plan_.chunk_size) {
        return unexpected(error(
            error_code::state_inconsistency,
            "persisted state planned for size " + std::to_string(state.total_size) +
                "/chunk " + std::to_string(state.chunk_size) + ", current plan is " +
                std::to_string(plan_.total_size) + "/" + std::to_string(plan_.chunk_size)));
    }
    for (const auto& [index, sum] : state.completed) {
        if (index >= plan_.chunk_count()) {
            return unexpected(error(error_code::state_corruption,
                                    "persisted chunk index " + std::to_string(index) +
                                        " outside plan"));
        }
        if (sum.empty()) {
            return unexpected(error(error_code::state_corruption,
                                    "persisted chunk " + std::to_string(index) +
                                        " has no checksum"));
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    state_ = state;
    results_.assign(plan_.chunk_count(), chunk_result{});
    uint64_t done = 0;
    for (const auto& [index, sum] : state_.completed) {
        results_[index].completed_at = state_.updated_at;
        results_[index].checksum = sum;
        done += plan_.chunks[index].length;
    }
    bytes_done_.store(done, std::memory_order_relaxed);

    DXT_LOG_DEBUG(log_category::tracker,
                  "restored " + std::to_string(state_.completed.size()) + "/" +
                      std::to_string(plan_.chunk_count()) + " completed chunks");
    return {};
}

void progress_tracker::invalidate(uint64_t index) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_.completed.erase(index) == 0) {
        return;
    }
    results_[index].completed_at.reset();
    results_[index].checksum.clear();
    bytes_done_.fetch_sub(plan_.chunks[index].length, std::memory_order_relaxed);
    state_.updated_at = std::chrono::system_clock::now();
}

void progress_tracker::record_attempt(uint64_t index, error_kind kind) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (index >= results_.size()) {
        return;
    }
    ++results_[index].attempts;
    results_[index].last_error = kind;
}

auto progress_tracker::chunk_status(uint64_t index) const -> chunk_result {
    std::lock_guard<std::mutex> lock(mutex_);
    if (index >= results_.size()) {
        return {};
    }
    return results_[index];
}

void progress_tracker::set_session_token(std::string token) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.session_token = std::move(token);
}

auto progress_tracker::completed_count() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.completed.size();
}

auto progress_tracker::all_complete() const -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.completed.size() == plan_.chunk_count();
}

auto progress_tracker::ordered_checksums() const -> result<std::vector<std::string>> {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_.completed.size() != plan_.chunk_count()) {
        return unexpected(error(error_code::state_inconsistency,
                                std::to_string(plan_.chunk_count() - state_.completed.size()) +
                                    " chunks still pending"));
    }
    std::vector<std::string> sums;
    sums.reserve(state_.completed.size());
    for (const auto& [index, sum] : state_.completed) {
        sums.push_back(sum);
    }
    return sums;
}

}  // namespace dx::transfer
