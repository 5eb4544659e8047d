// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "job_scheduler.hpp"

#include <string>
#include <utility>

#include <boost/asio/post.hpp>
#include <gsl/util>

#include <ferry/infra/common/log.hpp>
#include <ferry/migration/error.hpp>

namespace ferry::migration {

JobScheduler::JobScheduler(size_t num_workers) : workers_{num_workers} {}

JobScheduler::~JobScheduler() {
    shutdown();
}

void JobScheduler::launch(std::shared_ptr<BatchRunner> runner) {
    const JobId job_id{runner->job_id()};
    auto promise{std::make_shared<std::promise<BatchRunner::Result>>()};
    {
        std::scoped_lock lock{mutex_};
        if (shut_down_) {
            throw MigrationError{ErrorCode::kAlreadyRunning, "Scheduler is shut down"};
        }
        if (running_.contains(job_id)) {
            throw MigrationError{ErrorCode::kAlreadyRunning,
                                 "Migration job " + std::to_string(job_id) + " is already running"};
        }
        running_.emplace(job_id, Handle{runner, promise->get_future().share()});
        finished_.erase(job_id);
    }
    FERRY_DEBUG_M("Scheduling migration runner", {"job", std::to_string(job_id)});

    boost::asio::post(workers_, [this, runner = std::move(runner), promise, job_id]() {
        log::set_thread_name(("job-" + std::to_string(job_id)).c_str());
        std::optional<BatchRunner::Result> result;
        std::exception_ptr failure;
        {
            [[maybe_unused]] auto _ = gsl::finally([this, job_id, &result]() {
                std::scoped_lock lock{mutex_};
                running_.erase(job_id);
                if (result) finished_.insert_or_assign(job_id, *result);
            });
            try {
                result = runner->run();
            } catch (...) {
                failure = std::current_exception();
            }
        }
        // The handle is gone here, so whoever observes the result may relaunch the job
        if (failure) {
            promise->set_exception(failure);
        } else {
            promise->set_value(*result);
        }
    });
}

bool JobScheduler::stop(JobId job_id) {
    std::scoped_lock lock{mutex_};
    const auto it{running_.find(job_id)};
    if (it == running_.end()) {
        return false;
    }
    it->second.runner->stop();
    return true;
}

bool JobScheduler::is_running(JobId job_id) const {
    std::scoped_lock lock{mutex_};
    return running_.contains(job_id);
}

std::vector<JobId> JobScheduler::running_jobs() const {
    std::scoped_lock lock{mutex_};
    std::vector<JobId> job_ids;
    job_ids.reserve(running_.size());
    for (const auto& [job_id, _] : running_) {
        job_ids.push_back(job_id);
    }
    return job_ids;
}

std::optional<BatchRunner::Result> JobScheduler::wait(JobId job_id) {
    std::shared_future<BatchRunner::Result> result;
    {
        std::scoped_lock lock{mutex_};
        const auto it{running_.find(job_id)};
        if (it == running_.end()) {
            const auto last{finished_.find(job_id)};
            if (last == finished_.end()) return std::nullopt;
            return last->second;
        }
        result = it->second.result;
    }
    return result.get();
}

void JobScheduler::stop_all() {
    std::scoped_lock lock{mutex_};
    for (auto& [job_id, handle] : running_) {
        handle.runner->stop();
    }
}

void JobScheduler::shutdown() {
    {
        std::scoped_lock lock{mutex_};
        if (shut_down_) return;
        shut_down_ = true;
        for (auto& [job_id, handle] : running_) {
            handle.runner->stop();
        }
    }
    workers_.join();
    FERRY_DEBUG << "Migration scheduler stopped";
}

}  // namespace ferry::migration
