/**
 * @file transfer_engine.cpp
 * @brief Implementation of transfer_engine and transfer_handle
 */

#include "dx/transfer/engine/transfer_engine.h"

#include "dx/transfer/core/logging.h"
#include "dx/transfer/transport/service_transport.h"

#include <future>
#include <map>
#include <mutex>
#include <thread>

namespace dx::transfer {

namespace detail {

/**
 * @brief Shared state of one job: the orchestrator, its token and its thread
 */
struct job_record {
    job_id id;
    std::unique_ptr<transfer_orchestrator> orchestrator;
    cancellation_token token;
    std::promise<transfer_outcome> promise;
    std::shared_future<transfer_outcome> outcome;
    std::thread worker;
};

}  // namespace detail

// ============================================================================
// transfer_handle
// ============================================================================

transfer_handle::transfer_handle(std::shared_ptr<detail::job_record> record)
    : record_(std::move(record)) {}

auto transfer_handle::id() const -> job_id {
    return record_ ? record_->id : job_id{};
}

auto transfer_handle::state() const -> job_state {
    if (!record_) {
        return job_state::failed;
    }
    return record_->orchestrator->state();
}

auto transfer_handle::progress() const -> transfer_progress {
    if (!record_) {
        return transfer_progress{};
    }
    return record_->orchestrator->progress();
}

void transfer_handle::cancel() {
    if (record_) {
        record_->token.cancel();
    }
}

auto transfer_handle::await_completion() const -> transfer_outcome {
    if (!record_) {
        transfer_outcome out;
        out.code = error_code::invalid_configuration;
        out.message = "invalid transfer handle";
        return out;
    }
    return record_->outcome.get();
}

auto transfer_handle::wait_for(std::chrono::milliseconds timeout) const
    -> std::optional<transfer_outcome> {
    if (!record_) {
        return await_completion();
    }
    if (record_->outcome.wait_for(timeout) != std::future_status::ready) {
        return std::nullopt;
    }
    return record_->outcome.get();
}

// ============================================================================
// transfer_engine::impl
// ============================================================================

class transfer_engine::impl {
public:
    explicit impl(transfer_context ctx) : ctx_(std::move(ctx)) {
        if (!ctx_.transport && ctx_.service) {
            ctx_.transport = std::make_shared<service_transport>(ctx_.service);
        }
    }

    ~impl() {
        std::map<job_id, std::shared_ptr<detail::job_record>> jobs;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            jobs.swap(jobs_);
        }
        for (auto& [id, job] : jobs) {
            job->token.cancel();
        }
        for (auto& [id, job] : jobs) {
            if (job->worker.joinable()) {
                job->worker.join();
            }
        }
    }

    auto start(const transfer_endpoint& source,
               const transfer_endpoint& destination,
               const transfer_config& config) -> result<transfer_handle> {
        auto valid = config.validate();
        if (!valid) {
            return unexpected(valid.error());
        }
        auto direction = direction_of(source, destination);
        if (!direction) {
            return unexpected(direction.error());
        }
        if (!ctx_.service) {
            return unexpected(error(error_code::invalid_configuration,
                                    "engine has no remote object service"));
        }

        auto id = config.id ? *config.id
                            : job_id::derive(source.describe(), destination.describe());

        auto record = std::make_shared<detail::job_record>();
        record->id = id;
        record->outcome = record->promise.get_future().share();
        record->orchestrator =
            std::make_unique<transfer_orchestrator>(ctx_, id, source, destination, config);

        {
            std::lock_guard<std::mutex> lock(mutex_);
            reap_finished();
            if (jobs_.count(id) != 0) {
                return unexpected(error(error_code::already_running,
                                        "job " + id.to_string() + " is already running"));
            }
            jobs_.emplace(id, record);

            // Started under the lock so the destructor never sees an unstarted worker
            record->worker = std::thread([record] {
                record->promise.set_value(record->orchestrator->run(record->token));
            });
        }

        DXT_LOG_INFO(log_category::engine,
                     std::string("started ") + to_string(direction.value()) + " job " +
                         id.to_string() + ": " + source.describe() + " -> " +
                         destination.describe());
        return transfer_handle(record);
    }

    auto active() const -> std::vector<job_id> {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<job_id> ids;
        for (const auto& [id, job] : jobs_) {
            if (!is_terminal_state(job->orchestrator->state())) {
                ids.push_back(id);
            }
        }
        return ids;
    }

    void cancel_all() {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [id, job] : jobs_) {
            job->token.cancel();
        }
    }

private:
    /// Join and drop jobs whose outcome is already published. Caller holds mutex_.
    void reap_finished() {
        for (auto it = jobs_.begin(); it != jobs_.end();) {
            auto& job = it->second;
            if (job->outcome.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
                if (job->worker.joinable()) {
                    job->worker.join();
                }
                it = jobs_.erase(it);
            } else {
                ++it;
            }
        }
    }

    transfer_context ctx_;
    mutable std::mutex mutex_;
    std::map<job_id, std::shared_ptr<detail::job_record>> jobs_;
};

// ============================================================================
// transfer_engine public interface
// ============================================================================

transfer_engine::transfer_engine(transfer_context context)
    : impl_(std::make_unique<impl>(std::move(context))) {
    get_logger().initialize();
    DXT_LOG_DEBUG(log_category::engine, std::string("chunk workers on ") +
                                            build_features::executor() + ", logs to " +
                                            build_features::log_sink());
}

transfer_engine::~transfer_engine() = default;

auto transfer_engine::start_transfer(const transfer_endpoint& source,
                                     const transfer_endpoint& destination,
                                     const transfer_config& config)
    -> result<transfer_handle> {
    return impl_->start(source, destination, config);
}

auto transfer_engine::active_jobs() const -> std::vector<job_id> {
    return impl_->active();
}

void transfer_engine::cancel_all() {
    impl_->cancel_all();
}

}  // namespace dx::transfer
