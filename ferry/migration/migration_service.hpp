// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <optional>
#include <vector>

#include <ferry/db/kvdb/mdbx.hpp>
#include <ferry/migration/job_scheduler.hpp>
#include <ferry/migration/mdbx_checkpoint_store.hpp>
#include <ferry/migration/mdbx_transfer_ledger.hpp>
#include <ferry/migration/orchestrator.hpp>
#include <ferry/migration/resume_controller.hpp>
#include <ferry/migration/settings.hpp>
#include <ferry/migration/storage_config_registry.hpp>

namespace ferry::migration {

//! \brief Outcome of the startup recovery scan
struct RecoveryReport {
    std::vector<JobId> paused;      // InProgress jobs with no runner, moved to Paused
    std::vector<JobId> relaunched;  // Pending jobs handed to the scheduler
    size_t requeued_records{0};     // Records found Transferring/Verifying and marked Failed
};

//! \brief Job control surface of the migration engine over an MDBX ledger
//! \details Owns the stores, the scheduler and the components wiring them. Destruction stops all runners (their jobs
//! become Paused) before the stores go away.
class MigrationService {
  public:
    MigrationService(::mdbx::env& env, MigrationSettings settings,
                     TransportRegistry transports = TransportRegistry::with_builtin_transports(),
                     std::unique_ptr<FileInventory> inventory = nullptr);
    ~MigrationService();

    MigrationService(const MigrationService&) = delete;
    MigrationService& operator=(const MigrationService&) = delete;

    MigrationJob start(const MigrationRequest& request) { return orchestrator_.start(request); }
    MigrationJob resume(JobId job_id) { return resume_controller_.resume(job_id); }

    std::optional<MigrationJob> status(JobId job_id) { return ledger_.read_job(job_id); }

    //! \brief Moves a Pending or InProgress job to Cancelled; an in-flight batch finishes first
    //! \return False if the job does not exist or is in another state
    bool cancel(JobId job_id);

    //! \brief Asks the runner of the job to stop after the current file; the job becomes Paused
    //! \return False if no runner is active for the job
    bool pause(JobId job_id) { return scheduler_.stop(job_id); }

    std::vector<FileTransferRecord> list_files(JobId job_id, std::optional<FileTransferState> status = std::nullopt);
    std::optional<Checkpoint> get_checkpoint(JobId job_id) { return checkpoints_.load(job_id); }
    std::vector<MigrationJob> list_jobs() { return ledger_.list_jobs(); }

    //! \brief Blocks until the runner of the job exits
    //! \return Outcome of the last runner of the job, std::nullopt if none was launched by this service
    std::optional<BatchRunner::Result> wait(JobId job_id) { return scheduler_.wait(job_id); }

    bool is_running(JobId job_id) const { return scheduler_.is_running(job_id); }

    //! \brief Repairs jobs left behind by a previous process; call once at startup
    RecoveryReport recover();

    //! \brief Stops all runners and joins the worker pool
    void shutdown() { scheduler_.shutdown(); }

    StorageConfigRegistry& configurations() { return configurations_; }
    const MigrationSettings& settings() const { return settings_; }

  private:
    MigrationSettings settings_;
    MdbxTransferLedger ledger_;
    MdbxCheckpointStore checkpoints_;
    StorageConfigRegistry configurations_;
    TransportRegistry transports_;
    std::unique_ptr<FileInventory> inventory_;
    JobScheduler scheduler_;
    Orchestrator orchestrator_;
    ResumeController resume_controller_;
};

}  // namespace ferry::migration
