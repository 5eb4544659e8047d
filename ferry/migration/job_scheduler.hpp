// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include <boost/asio/thread_pool.hpp>

#include <ferry/migration/batch_runner.hpp>

namespace ferry::migration {

using WorkerPool = boost::asio::thread_pool;

//! \brief Runs batch runners on a worker pool, at most one per job
//! \details The running-job registry is the only in-memory state of the engine: everything else is in the ledger.
//! A runner is unregistered before its result becomes observable through wait().
class JobScheduler {
  public:
    explicit JobScheduler(size_t num_workers);
    ~JobScheduler();

    JobScheduler(const JobScheduler&) = delete;
    JobScheduler& operator=(const JobScheduler&) = delete;

    //! \brief Posts runner on the worker pool
    //! \throws MigrationError with kAlreadyRunning if a runner for the same job is registered
    void launch(std::shared_ptr<BatchRunner> runner);

    //! \brief Requests the runner of job_id to stop at the next file boundary
    //! \return False if no runner is registered for job_id
    bool stop(JobId job_id);

    bool is_running(JobId job_id) const;

    std::vector<JobId> running_jobs() const;

    //! \brief Blocks until the runner of job_id returns
    //! \return The runner result (or the result of its last run if already finished), std::nullopt if job_id was
    //! never launched
    std::optional<BatchRunner::Result> wait(JobId job_id);

    //! \brief Requests all registered runners to stop
    void stop_all();

    //! \brief Stops all runners and joins the worker pool; idempotent
    void shutdown();

  private:
    struct Handle {
        std::shared_ptr<BatchRunner> runner;
        std::shared_future<BatchRunner::Result> result;
    };

    WorkerPool workers_;
    mutable std::mutex mutex_;
    std::map<JobId, Handle> running_;
    std::map<JobId, BatchRunner::Result> finished_;
    bool shut_down_{false};
};

}  // namespace ferry::migration
