/**
 * @file statistics_collector.cpp
 * @brief Implementation of transfer statistics
 */

#include "dx/transfer/core/statistics_collector.h"

#include <atomic>
#include <deque>
#include <mutex>

namespace dx::transfer {

namespace {

auto per_second(uint64_t bytes, std::chrono::steady_clock::duration span) -> double {
    auto ms = std::chrono::duration_cast<std::chrono::microseconds>(span).count();
    if (ms <= 0) {
        return 0.0;
    }
    return static_cast<double>(bytes) * 1'000'000.0 / static_cast<double>(ms);
}

}  // namespace

struct statistics_collector::impl {
    /// Cumulative bytes_this_run at a chunk completion
    struct mark {
        time_point at;
        uint64_t moved;
    };

    config cfg;

    std::atomic<bool> active{false};
    std::atomic<uint64_t> total_bytes{0};
    std::atomic<uint64_t> resumed{0};
    std::atomic<uint64_t> moved{0};
    std::atomic<uint64_t> reverted{0};
    std::atomic<uint64_t> chunks_completed{0};
    std::atomic<uint64_t> chunks_invalidated{0};
    std::atomic<uint64_t> retries{0};
    std::array<std::atomic<uint64_t>, error_kind_count> failures{};

    // Guards timing, the rate window and the cached ETA
    mutable std::mutex mutex;
    bool started = false;
    time_point start_time{};
    time_point stop_time{};
    std::deque<mark> window;
    mutable time_point eta_at{};
    mutable duration eta{0};
    mutable bool eta_valid = false;

    impl() = default;
    explicit impl(config c) : cfg(std::move(c)) {}

    [[nodiscard]] auto done() const -> uint64_t {
        auto gained = resumed.load() + moved.load();
        auto lost = reverted.load();
        return gained > lost ? gained - lost : 0;
    }

    [[nodiscard]] auto elapsed_locked(time_point now) const -> duration {
        if (!started) {
            return duration{0};
        }
        auto end = active.load() ? now : stop_time;
        return std::chrono::duration_cast<duration>(end - start_time);
    }

    [[nodiscard]] auto average_locked(time_point now) const -> double {
        if (!started) {
            return 0.0;
        }
        auto end = active.load() ? now : stop_time;
        return per_second(moved.load(), end - start_time);
    }

    [[nodiscard]] auto current_locked() const -> double {
        if (window.size() < 2) {
            return 0.0;
        }
        const auto& oldest = window.front();
        const auto& newest = window.back();
        return per_second(newest.moved - oldest.moved, newest.at - oldest.at);
    }

    [[nodiscard]] auto eta_locked(time_point now) const -> duration {
        if (eta_valid && now - eta_at < cfg.eta_refresh) {
            return eta;
        }
        eta_at = now;
        eta_valid = true;

        auto total = total_bytes.load();
        auto have = done();
        if (!active.load() || have >= total) {
            eta = duration{0};
            return eta;
        }

        bool window_full = window.size() > cfg.rate_window;
        double rate = window_full ? current_locked() : average_locked(now);
        if (rate <= 0.0) {
            eta = duration{0};
            return eta;
        }
        eta = duration{static_cast<int64_t>(static_cast<double>(total - have) * 1000.0 / rate)};
        return eta;
    }
};

statistics_collector::statistics_collector() : impl_(std::make_unique<impl>()) {}

statistics_collector::statistics_collector(config cfg)
    : impl_(std::make_unique<impl>(std::move(cfg))) {}

statistics_collector::statistics_collector(statistics_collector&&) noexcept = default;
auto statistics_collector::operator=(statistics_collector&&) noexcept
    -> statistics_collector& = default;
statistics_collector::~statistics_collector() = default;

void statistics_collector::start(uint64_t total_bytes, uint64_t already_done) {
    reset();
    impl_->total_bytes.store(total_bytes);
    impl_->resumed.store(already_done);

    auto now = std::chrono::steady_clock::now();
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->started = true;
    impl_->start_time = now;
    impl_->stop_time = now;
    impl_->window.push_back({now, 0});
    impl_->active.store(true);
}

void statistics_collector::stop() {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (impl_->active.exchange(false)) {
        impl_->stop_time = std::chrono::steady_clock::now();
        impl_->eta_valid = false;
    }
}

void statistics_collector::reset() {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->active.store(false);
    impl_->started = false;
    impl_->window.clear();
    impl_->eta = duration{0};
    impl_->eta_valid = false;

    impl_->total_bytes.store(0);
    impl_->resumed.store(0);
    impl_->moved.store(0);
    impl_->reverted.store(0);
    impl_->chunks_completed.store(0);
    impl_->chunks_invalidated.store(0);
    impl_->retries.store(0);
    for (auto& f : impl_->failures) {
        f.store(0);
    }
}

auto statistics_collector::is_active() const noexcept -> bool {
    return impl_->active.load();
}

void statistics_collector::record_chunk_completed(uint64_t bytes, uint32_t attempts) {
    impl_->chunks_completed.fetch_add(1);
    if (attempts > 1) {
        impl_->retries.fetch_add(attempts - 1);
    }
    auto moved = impl_->moved.fetch_add(bytes) + bytes;

    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (!impl_->started) {
        return;
    }
    impl_->window.push_back({std::chrono::steady_clock::now(), moved});
    while (impl_->window.size() > impl_->cfg.rate_window + 1) {
        impl_->window.pop_front();
    }
}

void statistics_collector::record_chunk_invalidated(uint64_t bytes) {
    impl_->chunks_invalidated.fetch_add(1);
    impl_->reverted.fetch_add(bytes);
}

void statistics_collector::record_failure(error_kind kind) {
    auto slot = static_cast<std::size_t>(kind);
    if (slot < error_kind_count) {
        impl_->failures[slot].fetch_add(1);
    }
}

auto statistics_collector::bytes_done() const -> uint64_t {
    return impl_->done();
}

auto statistics_collector::bytes_this_run() const -> uint64_t {
    return impl_->moved.load();
}

auto statistics_collector::elapsed() const -> duration {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->elapsed_locked(std::chrono::steady_clock::now());
}

auto statistics_collector::get_snapshot() const -> snapshot {
    snapshot s;
    s.bytes_done = impl_->done();
    s.bytes_resumed = impl_->resumed.load();
    s.bytes_this_run = impl_->moved.load();
    s.total_bytes = impl_->total_bytes.load();
    s.chunks_completed = impl_->chunks_completed.load();
    s.chunks_invalidated = impl_->chunks_invalidated.load();
    s.retries = impl_->retries.load();
    for (std::size_t i = 0; i < error_kind_count; ++i) {
        s.failures_by_kind[i] = impl_->failures[i].load();
        s.failed_attempts += s.failures_by_kind[i];
    }

    auto now = std::chrono::steady_clock::now();
    std::lock_guard<std::mutex> lock(impl_->mutex);
    s.current_rate = impl_->current_locked();
    s.average_rate = impl_->average_locked(now);
    s.elapsed = impl_->elapsed_locked(now);
    s.estimated_remaining = impl_->eta_locked(now);
    return s;
}

}  // namespace dx::transfer
