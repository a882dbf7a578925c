/**
 * @file transfer_orchestrator.cpp
 * @brief Implementation of the upload and download state machines
 */

#include "dx/transfer/engine/transfer_orchestrator.h"

#include "dx/transfer/core/chunk_planner.h"
#include "dx/transfer/core/file_naming.h"
#include "dx/transfer/core/integrity_verifier.h"
#include "dx/transfer/core/logging.h"
#include "dx/transfer/core/progress_tracker.h"
#include "dx/transfer/core/retry_controller.h"
#include "dx/transfer/core/state_store.h"
#include "dx/transfer/core/statistics_collector.h"
#include "dx/transfer/engine/destination_file.h"
#include "dx/transfer/transport/service_transport.h"

#include <algorithm>
#include <atomic>
#include <limits>
#include <mutex>
#include <set>
#include <vector>

namespace dx::transfer {

namespace {

/// Chunk index reported for session-level calls (open, metadata, checksum query).
constexpr uint64_t session_call = std::numeric_limits<uint64_t>::max();

auto kind_of(error_code code) -> error_kind {
    switch (code) {
        case error_code::success: return error_kind::none;
        case error_code::transport_timeout: return error_kind::timeout;
        case error_code::connection_error: return error_kind::connection_error;
        case error_code::auth_expired: return error_kind::auth_expired;
        case error_code::server_rejected: return error_kind::server_rejected;
        case error_code::retries_exhausted: return error_kind::retries_exhausted;
        case error_code::cancelled: return error_kind::cancelled;
        case error_code::checksum_mismatch:
        case error_code::whole_checksum_mismatch: return error_kind::checksum_mismatch;
        case error_code::state_corruption: return error_kind::state_corruption;
        case error_code::state_inconsistency: return error_kind::state_inconsistency;
        default: return error_kind::io_error;
    }
}

/**
 * @brief File readers handed to one worker at a time
 *
 * At most one reader per concurrently running worker is ever created.
 */
class reader_pool {
public:
    explicit reader_pool(std::filesystem::path path) : path_(std::move(path)) {}

    auto acquire() -> std::unique_ptr<chunk_reader> {
        std::lock_guard<std::mutex> lock(mutex_);
        if (idle_.empty()) {
            return std::make_unique<chunk_reader>(path_);
        }
        auto reader = std::move(idle_.back());
        idle_.pop_back();
        return reader;
    }

    void release(std::unique_ptr<chunk_reader> reader) {
        std::lock_guard<std::mutex> lock(mutex_);
        idle_.push_back(std::move(reader));
    }

private:
    std::filesystem::path path_;
    std::mutex mutex_;
    std::vector<std::unique_ptr<chunk_reader>> idle_;
};

}  // namespace

auto direction_of(const transfer_endpoint& source, const transfer_endpoint& destination)
    -> result<transfer_direction> {
    if (source.is_local() && destination.is_remote()) {
        return transfer_direction::upload;
    }
    if (source.is_remote() && destination.is_local()) {
        return transfer_direction::download;
    }
    return unexpected(error(error_code::invalid_configuration,
                            "transfer must be local-to-remote or remote-to-local, got " +
                                source.describe() + " -> " + destination.describe()));
}

// ============================================================================
// transfer_orchestrator::impl
// ============================================================================

class transfer_orchestrator::impl {
public:
    impl(transfer_context ctx, job_id id, transfer_endpoint source,
         transfer_endpoint destination, transfer_config config)
        : ctx_(std::move(ctx)),
          id_(id),
          source_(std::move(source)),
          destination_(std::move(destination)),
          config_(std::move(config)),
          planner_(config_.make_chunk_policy()),
          verifier_(config_.checksum),
          retry_(config_.make_retry_policy(), ctx_.credentials),
          store_(state_store_config(config_.state_directory)) {
        auto dir = direction_of(source_, destination_);
        direction_ = dir ? dir.value() : transfer_direction::upload;
        if (direction_ == transfer_direction::upload) {
            local_path_ = source_.path;
            object_id_ = destination_.object_id;
        } else {
            local_path_ = destination_.path;
            object_id_ = source_.object_id;
        }
        if (!ctx_.transport && ctx_.service) {
            ctx_.transport = std::make_shared<service_transport>(ctx_.service);
        }
        retry_.set_failure_observer(
            [this](uint64_t, uint32_t, const transport_error& err) { stats_.record_failure(err.kind); });
    }

    auto run(cancellation_token& token) -> transfer_outcome {
        auto started = context();
        DXT_LOG_INFO_CTX(log_category::orchestrator, "transfer started", started);

        auto prepared = direction_ == transfer_direction::upload ? prepare_upload(token)
                                                                 : prepare_download(token);
        if (!prepared) {
            return abort(prepared.error(), token);
        }

        auto transferred = transfer_chunks(token);
        if (!transferred) {
            return abort(transferred.error(), token);
        }

        auto finalized = direction_ == transfer_direction::upload ? finalize_upload(token)
                                                                  : finalize_download(token);
        if (!finalized) {
            return abort(finalized.error(), token);
        }

        return complete();
    }

    // ------------------------------------------------------------------------
    // State
    // ------------------------------------------------------------------------

    auto state() const -> job_state { return state_.load(); }

    auto transition(job_state to) -> result<void> {
        auto from = state_.load();
        if (!is_valid_transition(from, to)) {
            DXT_LOG_ERROR(log_category::orchestrator,
                          std::string("invalid transition ") + to_string(from) + " -> " +
                              to_string(to));
            return unexpected(error(error_code::invalid_state_transition,
                                    std::string(to_string(from)) + " -> " + to_string(to)));
        }
        state_.store(to);
        DXT_LOG_DEBUG(log_category::orchestrator,
                      "job " + id_.to_string() + ": " + to_string(from) + " -> " + to_string(to));
        return {};
    }

    auto context() const -> transfer_log_context {
        transfer_log_context ctx;
        ctx.job_id = id_.to_string();
        ctx.direction = to_string(direction_);
        ctx.object_id = object_id_;
        ctx.local_path = local_path_.string();
        if (auto t = current_tracker()) {
            ctx.total_size = t->plan().total_size;
            ctx.total_chunks = t->plan().chunk_count();
            ctx.bytes_done = t->bytes_done();
        }
        return ctx;
    }

    auto current_tracker() const -> std::shared_ptr<progress_tracker> {
        std::lock_guard<std::mutex> lock(job_mutex_);
        return tracker_;
    }

    auto progress() const -> transfer_progress {
        transfer_progress p;
        p.state = state_.load();
        auto s = stats_.get_snapshot();
        p.rate = s.current_rate;
        p.average_rate = s.average_rate;
        p.elapsed = s.elapsed;
        p.eta = s.estimated_remaining;
        p.retries = s.retries;
        if (auto t = current_tracker()) {
            p.bytes_done = t->bytes_done();
            p.bytes_total = t->plan().total_size;
            p.chunks_done = t->completed_count();
            p.total_chunks = t->plan().chunk_count();
        }
        return p;
    }

    auto last_report() const -> std::optional<pool_report> {
        std::lock_guard<std::mutex> lock(job_mutex_);
        return report_;
    }

    // ------------------------------------------------------------------------
    // Planning
    // ------------------------------------------------------------------------

    auto validate_job() -> result<void> {
        auto dir = direction_of(source_, destination_);
        if (!dir) {
            return unexpected(dir.error());
        }
        if (object_id_.empty()) {
            return unexpected(error(error_code::invalid_configuration, "object id is empty"));
        }
        if (!ctx_.service || !ctx_.transport) {
            return unexpected(error(error_code::invalid_configuration,
                                    "no remote object service configured"));
        }
        return config_.validate();
    }

    void install_tracker(chunk_plan plan) {
        transfer_state identity;
        identity.id = id_;
        identity.direction = direction_;
        identity.object_id = object_id_;
        identity.local_path = local_path_.string();
        auto tracker = std::make_shared<progress_tracker>(std::move(plan), std::move(identity));
        std::lock_guard<std::mutex> lock(job_mutex_);
        tracker_ = std::move(tracker);
    }

    /**
     * @brief Load persisted state and restore it if it still fits the plan
     * @return true if state was restored, false if starting fresh
     */
    auto restore_state() -> result<bool> {
        auto loaded = store_.load(id_);
        if (!loaded) {
            if (loaded.error().code == error_code::state_not_found) {
                return false;
            }
            return unexpected(loaded.error());
        }

        const auto& saved = loaded.value();
        auto& tracker = *tracker_;
        std::string drift;
        if (saved.direction != direction_) {
            drift = "direction changed";
        } else if (saved.object_id != object_id_) {
            drift = "object changed";
        } else if (saved.local_path != local_path_.string()) {
            drift = "local path changed";
        } else if (saved.total_size != tracker.plan().total_size ||
                   saved.chunk_size != tracker.plan().chunk_size) {
            drift = "size or chunk size changed from " + std::to_string(saved.total_size) + "/" +
                    std::to_string(saved.chunk_size);
        }

        if (drift.empty()) {
            auto restored = tracker.restore(saved);
            if (!restored) {
                return unexpected(restored.error());
            }
            auto ctx = context();
            ctx.session_token = saved.session_token;
            DXT_LOG_INFO_CTX(log_category::orchestrator,
                             "resuming with " + std::to_string(saved.completed.size()) +
                                 " chunks already complete",
                             ctx);
            return true;
        }

        DXT_LOG_WARN(log_category::orchestrator,
                     "discarding persisted state of job " + id_.to_string() + ": " + drift);
        if (direction_ == transfer_direction::upload && !saved.session_token.empty()) {
            auto aborted = ctx_.service->abort_upload_session(saved.session_token,
                                                              call_options{config_.timeout});
            if (!aborted) {
                DXT_LOG_WARN(log_category::orchestrator,
                             "cannot abort stale upload session: " + aborted.error().describe());
            }
        }
        auto removed = store_.remove(id_);
        if (!removed) {
            return unexpected(removed.error());
        }
        return false;
    }

    auto prepare_upload(cancellation_token& token) -> result<void> {
        if (auto valid = validate_job(); !valid) {
            return valid;
        }

        std::error_code ec;
        auto status = std::filesystem::status(local_path_, ec);
        if (ec || !std::filesystem::exists(status)) {
            return unexpected(error(error_code::file_not_found,
                                    "source not found: " + local_path_.string()));
        }
        if (!std::filesystem::is_regular_file(status)) {
            return unexpected(error(error_code::invalid_file_path,
                                    "source is not a regular file: " + local_path_.string()));
        }
        auto size = std::filesystem::file_size(local_path_, ec);
        if (ec) {
            return unexpected(error(error_code::file_read_error,
                                    "cannot stat " + local_path_.string() + ": " + ec.message()));
        }

        auto plan = planner_.plan(size);
        if (!plan) {
            return unexpected(plan.error());
        }
        install_tracker(std::move(plan).value());

        auto restored = restore_state();
        if (!restored) {
            return unexpected(restored.error());
        }

        auto saved = tracker_->snapshot();
        if (!restored.value() || saved.session_token.empty()) {
            auto opened = retry_.execute<std::string>(
                [&](uint32_t) {
                    return ctx_.service->open_upload_session(object_id_, size,
                                                             call_options{config_.timeout});
                },
                session_call, token);
            if (!opened.succeeded() || !opened.value) {
                return unexpected(session_error(opened, "open_upload_session"));
            }
            tracker_->set_session_token(*opened.value);
            DXT_LOG_DEBUG(log_category::orchestrator, "upload session opened");
        }
        session_.object_id = object_id_;
        session_.session_token = tracker_->snapshot().session_token;
        readers_ = std::make_unique<reader_pool>(local_path_);
        persistable_ = true;
        checkpoint();
        return {};
    }

    auto prepare_download(cancellation_token& token) -> result<void> {
        if (auto valid = validate_job(); !valid) {
            return valid;
        }

        auto resolved = resolve_download_path(destination_.path, object_id_);
        if (!resolved) {
            return unexpected(resolved.error());
        }
        local_path_ = resolved.value();
        part_path_ = local_path_;
        part_path_ += ".part";

        auto meta = retry_.execute<object_metadata>(
            [&](uint32_t) {
                return ctx_.service->get_object_metadata(object_id_, call_options{config_.timeout});
            },
            session_call, token);
        if (!meta.succeeded() || !meta.value) {
            return unexpected(session_error(meta, "get_object_metadata"));
        }
        metadata_ = std::move(*meta.value);

        // A zero chunk size means the object was stored as one chunk
        auto chunk_size = metadata_.chunk_size > 0 ? metadata_.chunk_size
                                                   : std::max<uint64_t>(1, metadata_.size);
        auto plan = planner_.plan_remote(metadata_.size, chunk_size);
        if (!plan) {
            return unexpected(plan.error());
        }
        auto& chunks = plan.value().chunks;
        if (!metadata_.chunk_checksums.empty()) {
            if (metadata_.chunk_checksums.size() != chunks.size()) {
                return unexpected(error(
                    error_code::state_inconsistency,
                    "metadata lists " + std::to_string(metadata_.chunk_checksums.size()) +
                        " checksums for " + std::to_string(chunks.size()) + " chunks"));
            }
            for (std::size_t i = 0; i < chunks.size(); ++i) {
                chunks[i].expected_checksum = metadata_.chunk_checksums[i];
            }
        }
        install_tracker(std::move(plan).value());

        auto restored = restore_state();
        if (!restored) {
            return unexpected(restored.error());
        }
        bool resume = restored.value();
        std::error_code ec;
        if (resume && !std::filesystem::exists(part_path_, ec)) {
            DXT_LOG_WARN(log_category::orchestrator,
                         "part file " + part_path_.string() + " missing, restarting download");
            install_tracker(tracker_->plan());
            resume = false;
        }

        auto file = destination_file::open(part_path_, metadata_.size, !resume);
        if (!file) {
            return unexpected(file.error());
        }
        part_ = std::move(file).value();

        session_.object_id = object_id_;
        persistable_ = true;
        checkpoint();
        return {};
    }

    template <typename T>
    auto session_error(const retry_outcome<T>& out, const std::string& call) -> error {
        if (out.status == retry_status::cancelled) {
            return error(error_code::cancelled, call + " cancelled");
        }
        failure_attempts_ = out.attempts;
        last_kind_ = out.kind;
        return error(to_error_code(out.kind), call + " failed: " + out.message);
    }

    // ------------------------------------------------------------------------
    // Chunk transfer
    // ------------------------------------------------------------------------

    auto transfer_chunks(cancellation_token& token) -> result<void> {
        if (token.is_cancelled()) {
            return unexpected(error(error_code::cancelled, "cancelled before transfer"));
        }
        if (auto moved = transition(job_state::in_progress); !moved) {
            return moved;
        }

        stats_.start(tracker_->plan().total_size, tracker_->bytes_done());
        return dispatch(token);
    }

    auto dispatch(cancellation_token& token) -> result<void> {
        auto pending = tracker_->pending_chunks();
        auto parallelism = config_.effective_parallelism();

        auto pool = ctx_.thread_pool;
        if (!pool) {
            pool = adapters::transfer_pool_factory::create(
                std::min<std::size_t>(parallelism, std::max<std::size_t>(pending.size(), 1)),
                "dx_transfer_" + id_.to_string().substr(0, 8));
        }
        worker_pool workers(pool, direction_);

        auto ctx = context();
        DXT_LOG_INFO_CTX(log_category::orchestrator,
                         std::to_string(pending.size()) + " chunks pending", ctx);

        auto task = [this, &token](uint64_t index) -> std::optional<chunk_failure> {
            return direction_ == transfer_direction::upload ? upload_chunk(index, token)
                                                            : download_chunk(index, token);
        };
        auto report = workers.run(pending, parallelism, task, token);
        {
            std::lock_guard<std::mutex> lock(job_mutex_);
            report_ = report;
        }

        if (report.failure) {
            const auto& f = *report.failure;
            failing_chunk_ = f.index;
            failure_attempts_ = f.attempts;
            last_kind_ = f.kind;
            return unexpected(error(f.code, "chunk " + std::to_string(f.index) + ": " + f.message));
        }
        if (report.cancelled) {
            return unexpected(error(error_code::cancelled, "cancelled during transfer"));
        }
        checkpoint();
        return {};
    }

    auto upload_chunk(uint64_t index, cancellation_token& token) -> std::optional<chunk_failure> {
        const auto& chunk = tracker_->plan().chunks[index];

        std::vector<std::byte> buffer;
        auto reader = readers_->acquire();
        auto read = reader->read(chunk, buffer);
        readers_->release(std::move(reader));
        if (!read) {
            return chunk_failure{index, error_kind::io_error, read.error().code, 0,
                                 read.error().message};
        }

        // Once the remote has held wrong bytes for this chunk, a 409 proves nothing
        bool must_replace = needs_replacement(index);
        auto digest = verifier_.compute(buffer);
        auto out = retry_.execute<chunk_ack>(
            [&](uint32_t) -> transport_result<chunk_ack> {
                auto ack = ctx_.transport->send(session_, chunk, buffer, config_.timeout);
                if (!ack) {
                    if (must_replace && ack.error().is_already_exists()) {
                        tracker_->record_attempt(index, error_kind::checksum_mismatch);
                        return transport_error{error_kind::checksum_mismatch,
                                               "remote kept a mismatched copy of the chunk"};
                    }
                    tracker_->record_attempt(index, ack.error().kind);
                    return ack;
                }
                if (!integrity_verifier::same_digest(ack.value().checksum, digest)) {
                    must_replace = true;
                    tracker_->record_attempt(index, error_kind::checksum_mismatch);
                    return transport_error{error_kind::checksum_mismatch,
                                           "remote acknowledged " + ack.value().checksum +
                                               ", expected " + digest};
                }
                tracker_->record_attempt(index, error_kind::none);
                return ack;
            },
            index, token);

        return complete_chunk(chunk, out, digest);
    }

    auto download_chunk(uint64_t index, cancellation_token& token)
        -> std::optional<chunk_failure> {
        const auto& chunk = tracker_->plan().chunks[index];

        std::string digest;
        auto out = retry_.execute<std::vector<std::byte>>(
            [&](uint32_t) -> transport_result<std::vector<std::byte>> {
                auto data = ctx_.transport->receive(session_, chunk, config_.timeout);
                if (!data) {
                    tracker_->record_attempt(index, data.error().kind);
                    return data;
                }
                digest = verifier_.compute(data.value());
                if (chunk.expected_checksum) {
                    auto verified = verifier_.verify_chunk(chunk, digest, *chunk.expected_checksum);
                    if (!verified) {
                        tracker_->record_attempt(index, error_kind::checksum_mismatch);
                        return transport_error{error_kind::checksum_mismatch,
                                               verified.error().message};
                    }
                }
                tracker_->record_attempt(index, error_kind::none);
                return data;
            },
            index, token);

        if (out.succeeded() && out.value) {
            auto written = part_->write_at(chunk.offset, *out.value);
            if (!written) {
                return chunk_failure{index, error_kind::io_error, written.error().code,
                                     out.attempts, written.error().message};
            }
        }
        return complete_chunk(chunk, out, digest);
    }

    template <typename T>
    auto complete_chunk(const chunk_descriptor& chunk, const retry_outcome<T>& out,
                        const std::string& digest) -> std::optional<chunk_failure> {
        if (out.status == retry_status::cancelled) {
            return chunk_failure{chunk.index, error_kind::cancelled, error_code::cancelled,
                                 out.attempts, "cancelled"};
        }
        if (!out.succeeded()) {
            auto ctx = context();
            ctx.chunk_index = chunk.index;
            ctx.attempt = out.attempts;
            ctx.error_kind = to_string(out.kind);
            ctx.error_message = out.message;
            DXT_LOG_ERROR_CTX(log_category::orchestrator, "chunk failed", ctx);
            return chunk_failure{chunk.index, out.kind, to_error_code(out.kind), out.attempts,
                                 std::string(to_string(out.kind)) + " after " +
                                     std::to_string(out.attempts) + " attempts: " + out.message};
        }

        auto marked = tracker_->mark_complete(chunk.index, digest);
        if (!marked) {
            return chunk_failure{chunk.index, error_kind::state_inconsistency,
                                 marked.error().code, out.attempts, marked.error().message};
        }
        stats_.record_chunk_completed(chunk.length, out.attempts);

        if (++since_checkpoint_ >= config_.checkpoint_interval) {
            since_checkpoint_ = 0;
            checkpoint();
        }
        return std::nullopt;
    }

    // ------------------------------------------------------------------------
    // Finalization
    // ------------------------------------------------------------------------

    auto combined_checksum() -> result<std::string> {
        auto sums = tracker_->ordered_checksums();
        if (!sums) {
            return unexpected(sums.error());
        }
        return verifier_.combine(sums.value());
    }

    auto finalize_upload(cancellation_token& token) -> result<void> {
        if (token.is_cancelled()) {
            return unexpected(error(error_code::cancelled, "cancelled before finalization"));
        }
        if (auto moved = transition(job_state::finalizing); !moved) {
            return moved;
        }

        auto whole = combined_checksum();
        if (!whole) {
            return unexpected(whole.error());
        }

        if (config_.verify_whole_object) {
            auto remote = retry_.execute<std::optional<std::string>>(
                [&](uint32_t) {
                    return ctx_.service->query_session_checksum(session_.session_token,
                                                                call_options{config_.timeout});
                },
                session_call, token);
            if (!remote.succeeded() || !remote.value) {
                return unexpected(session_error(remote, "query_session_checksum"));
            }
            if (*remote.value) {
                auto verified = verifier_.verify_whole_object(whole.value(), **remote.value);
                if (!verified) {
                    if (repaired_) {
                        return unexpected(verified.error());
                    }
                    auto repaired = repair_upload(token);
                    if (!repaired) {
                        return repaired;
                    }
                    return finalize_upload(token);
                }
            } else {
                DXT_LOG_DEBUG(log_category::orchestrator,
                              "remote reports no session checksum, closing on local digest");
            }
        }

        // Closing is a commit: called exactly once, never retried
        auto closed = ctx_.service->close_object(session_.session_token, whole.value(),
                                                 call_options{config_.timeout});
        if (!closed) {
            last_kind_ = closed.error().kind;
            failure_attempts_ = 1;
            return unexpected(error(to_error_code(closed.error().kind),
                                    "close_object failed: " + closed.error().describe()));
        }

        whole_checksum_ = whole.value();
        return {};
    }

    auto finalize_download(cancellation_token& token) -> result<void> {
        if (token.is_cancelled()) {
            return unexpected(error(error_code::cancelled, "cancelled before finalization"));
        }
        if (auto moved = transition(job_state::finalizing); !moved) {
            return moved;
        }

        auto whole = combined_checksum();
        if (!whole) {
            return unexpected(whole.error());
        }

        if (config_.verify_whole_object && metadata_.whole_checksum) {
            auto verified = verifier_.verify_whole_object(whole.value(), *metadata_.whole_checksum);
            if (!verified) {
                if (repaired_) {
                    return unexpected(verified.error());
                }
                auto repaired = repair_download(token);
                if (!repaired) {
                    return repaired;
                }
                return finalize_download(token);
            }
        }

        auto committed = part_->commit(local_path_);
        if (!committed) {
            return committed;
        }
        whole_checksum_ = whole.value();
        return {};
    }

    /**
     * @brief Re-verify the part file and re-fetch chunks that no longer match
     *
     * Runs at most once per job. Chunks whose bytes on disk still match
     * their recorded digest are kept.
     */
    auto repair_download(cancellation_token& token) -> result<void> {
        repaired_ = true;
        std::size_t invalidated = 0;
        for (const auto& chunk : tracker_->plan().chunks) {
            auto bytes = part_->read_at(chunk.offset, chunk.length);
            if (!bytes) {
                return unexpected(bytes.error());
            }
            auto actual = verifier_.compute(bytes.value());
            auto expected = chunk.expected_checksum
                                ? *chunk.expected_checksum
                                : tracker_->chunk_status(chunk.index).checksum;
            if (!integrity_verifier::same_digest(actual, expected)) {
                tracker_->invalidate(chunk.index);
                stats_.record_chunk_invalidated(chunk.length);
                ++invalidated;
            }
        }

        if (invalidated == 0) {
            return unexpected(error(error_code::whole_checksum_mismatch,
                                    "every chunk matches but the object checksum does not"));
        }

        DXT_LOG_WARN(log_category::orchestrator,
                     "whole-object mismatch, re-fetching " + std::to_string(invalidated) +
                         " chunks");
        checkpoint();
        if (auto moved = transition(job_state::in_progress); !moved) {
            return moved;
        }
        return dispatch(token);
    }

    /**
     * @brief Re-send every chunk after the remote session checksum disagreed
     *
     * The service reports one checksum per session, so the bad chunk cannot
     * be singled out. Runs at most once per run().
     */
    auto repair_upload(cancellation_token& token) -> result<void> {
        repaired_ = true;
        {
            std::lock_guard<std::mutex> lock(job_mutex_);
            for (const auto& chunk : tracker_->plan().chunks) {
                replace_.insert(chunk.index);
            }
        }
        for (const auto& chunk : tracker_->plan().chunks) {
            if (tracker_->is_complete(chunk.index)) {
                tracker_->invalidate(chunk.index);
                stats_.record_chunk_invalidated(chunk.length);
            }
        }

        DXT_LOG_WARN(log_category::orchestrator,
                     "remote session checksum mismatch, re-sending " +
                         std::to_string(tracker_->plan().chunk_count()) + " chunks");
        checkpoint();
        if (auto moved = transition(job_state::in_progress); !moved) {
            return moved;
        }
        return dispatch(token);
    }

    auto needs_replacement(uint64_t index) const -> bool {
        std::lock_guard<std::mutex> lock(job_mutex_);
        return replace_.count(index) > 0;
    }

    // ------------------------------------------------------------------------
    // Terminal states
    // ------------------------------------------------------------------------

    void checkpoint() {
        if (!persistable_) {
            return;
        }
        std::lock_guard<std::mutex> lock(checkpoint_mutex_);
        auto saved = store_.save(tracker_->snapshot());
        if (!saved) {
            DXT_LOG_WARN(log_category::orchestrator,
                         "checkpoint failed, resume may repeat work: " + saved.error().message);
        }
    }

    void discard_state() {
        auto removed = store_.remove(id_);
        if (!removed) {
            DXT_LOG_WARN(log_category::orchestrator,
                         "cannot remove persisted state: " + removed.error().message);
        }
    }

    auto complete() -> transfer_outcome {
        stats_.stop();
        if (auto moved = transition(job_state::complete); !moved) {
            return abort_without_state(moved.error());
        }
        discard_state();

        auto ctx = context();
        auto s = stats_.get_snapshot();
        ctx.duration_ms = static_cast<uint64_t>(s.elapsed.count());
        ctx.rate_mbps = s.average_rate / (1024.0 * 1024.0);
        DXT_LOG_INFO_CTX(log_category::orchestrator, "transfer complete", ctx);

        transfer_outcome out;
        out.status = job_state::complete;
        out.bytes_transferred = stats_.bytes_this_run();
        out.elapsed = stats_.elapsed();
        out.message = whole_checksum_;
        return out;
    }

    auto abort(const error& err, cancellation_token& token) -> transfer_outcome {
        stats_.stop();
        bool cancelled = err.code == error_code::cancelled || token.is_cancelled();
        auto terminal = cancelled ? job_state::cancelled : job_state::failed;

        if (config_.cleanup_on_abort) {
            cleanup_remote_and_local();
        } else {
            checkpoint();
            part_.reset();
        }

        if (auto moved = transition(terminal); !moved) {
            state_.store(terminal);
        }

        auto ctx = context();
        ctx.error_message = err.message;
        if (failing_chunk_) {
            ctx.chunk_index = *failing_chunk_;
        }
        if (cancelled) {
            DXT_LOG_INFO_CTX(log_category::orchestrator, "transfer cancelled", ctx);
        } else {
            DXT_LOG_ERROR_CTX(log_category::orchestrator, "transfer failed", ctx);
        }

        transfer_outcome out;
        out.status = terminal;
        out.failing_chunk = cancelled ? std::nullopt : failing_chunk_;
        out.last_error = cancelled ? error_kind::cancelled
                                   : (last_kind_ != error_kind::none ? last_kind_
                                                                     : kind_of(err.code));
        out.code = cancelled ? error_code::cancelled : err.code;
        out.attempts = failure_attempts_;
        out.bytes_transferred = stats_.bytes_this_run();
        out.elapsed = stats_.elapsed();
        out.message = err.message;
        return out;
    }

    auto abort_without_state(const error& err) -> transfer_outcome {
        state_.store(job_state::failed);
        transfer_outcome out;
        out.status = job_state::failed;
        out.last_error = kind_of(err.code);
        out.code = err.code;
        out.message = err.message;
        return out;
    }

    void cleanup_remote_and_local() {
        if (direction_ == transfer_direction::upload && !session_.session_token.empty()) {
            auto aborted = ctx_.service->abort_upload_session(session_.session_token,
                                                              call_options{config_.timeout});
            if (!aborted) {
                DXT_LOG_WARN(log_category::orchestrator,
                             "cannot abort upload session: " + aborted.error().describe());
            }
        }
        if (part_) {
            part_->discard();
            part_.reset();
        }
        if (persistable_) {
            discard_state();
        }
    }

    transfer_context ctx_;
    job_id id_;
    transfer_endpoint source_;
    transfer_endpoint destination_;
    transfer_config config_;
    transfer_direction direction_ = transfer_direction::upload;
    std::filesystem::path local_path_;
    std::filesystem::path part_path_;
    std::string object_id_;

    chunk_planner planner_;
    integrity_verifier verifier_;
    retry_controller retry_;
    state_store store_;
    statistics_collector stats_;

    std::atomic<job_state> state_{job_state::planned};
    mutable std::mutex job_mutex_;
    std::shared_ptr<progress_tracker> tracker_;
    std::optional<pool_report> report_;

    transfer_session session_;
    object_metadata metadata_;
    std::unique_ptr<reader_pool> readers_;
    std::unique_ptr<destination_file> part_;

    std::mutex checkpoint_mutex_;
    std::atomic<uint32_t> since_checkpoint_{0};
    bool persistable_ = false;
    bool repaired_ = false;
    std::set<uint64_t> replace_;  ///< Chunks whose remote copy must be overwritten

    std::optional<uint64_t> failing_chunk_;
    uint32_t failure_attempts_ = 0;
    error_kind last_kind_ = error_kind::none;
    std::string whole_checksum_;
};

// ============================================================================
// transfer_orchestrator public interface
// ============================================================================

transfer_orchestrator::transfer_orchestrator(transfer_context context,
                                             job_id id,
                                             transfer_endpoint source,
                                             transfer_endpoint destination,
                                             transfer_config config)
    : impl_(std::make_unique<impl>(std::move(context), id, std::move(source),
                                   std::move(destination), std::move(config))) {}

transfer_orchestrator::~transfer_orchestrator() = default;

auto transfer_orchestrator::run(cancellation_token& token) -> transfer_outcome {
    return impl_->run(token);
}

auto transfer_orchestrator::state() const -> job_state {
    return impl_->state();
}

auto transfer_orchestrator::id() const -> const job_id& {
    return impl_->id_;
}

auto transfer_orchestrator::direction() const -> transfer_direction {
    return impl_->direction_;
}

auto transfer_orchestrator::progress() const -> transfer_progress {
    return impl_->progress();
}

auto transfer_orchestrator::last_pool_report() const -> std::optional<pool_report> {
    return impl_->last_report();
}

}  // namespace dx::transfer
