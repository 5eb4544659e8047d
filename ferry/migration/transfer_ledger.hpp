// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <ferry/migration/file_inventory.hpp>
#include <ferry/migration/types.hpp>

namespace ferry::migration {

//! Error stored on records whose transfer was cut short by a process exit or an aborted runner
inline constexpr const char* kInterruptedError{"interrupted"};

//! \brief Durable source of truth for jobs and their per-file transfer records
//! \details Every operation is atomic. Job counters (migrated_files, failed_files, transferred_bytes) are kept equal
//! to the aggregates of the current record statuses, so a file failing then succeeding on retry is counted once.
//! Implementations must be safe for concurrent use by runners of different jobs.
class TransferLedger {
  public:
    virtual ~TransferLedger() = default;

    //! \brief Persists a new Pending job together with one Pending record per entry, all or nothing
    //! \return The stored job, with id, totals and started_at assigned
    virtual MigrationJob create_job(MigrationJob job, const std::vector<InventoryEntry>& entries) = 0;

    virtual std::optional<MigrationJob> read_job(JobId job_id) = 0;

    //! \brief All jobs in creation order
    virtual std::vector<MigrationJob> list_jobs() = 0;

    //! \brief Compare-and-set transition of the job status
    //! \details Succeeds only if the current status is one of expected. Entering a terminal state sets completed_at and
    //! clears current_file; Paused sets can_resume; Cancelled clears can_resume; Failed stores error.
    //! \return The updated job, std::nullopt if the job does not exist or its status is not in expected
    virtual std::optional<MigrationJob> transition(JobId job_id, const std::vector<MigrationState>& expected,
                                                   MigrationState desired,
                                                   const std::optional<std::string>& error = std::nullopt) = 0;

    //! \brief Up to limit eligible records (Pending or Failed with attempt_count < max_attempts), oldest first
    virtual std::vector<FileTransferRecord> fetch_eligible(JobId job_id, size_t limit, uint32_t max_attempts) = 0;

    //! \brief Moves an eligible record to Transferring and counts the attempt
    //! \details The record becomes the job current_file only while the job is InProgress
    //! \return The claimed record
    virtual FileTransferRecord claim(JobId job_id, RecordId record_id) = 0;

    //! \brief Transferring -> Completed with target_path; the job counters follow
    //! \return Snapshot of the job after the update
    virtual MigrationJob record_success(JobId job_id, RecordId record_id, const std::string& target_path) = 0;

    //! \brief Transferring -> Failed with last_error; the job counters follow
    //! \return Snapshot of the job after the update
    virtual MigrationJob record_failure(JobId job_id, RecordId record_id, const std::string& error) = 0;

    //! \brief Records of a job in creation order, optionally restricted to one status
    virtual std::vector<FileTransferRecord> list_records(JobId job_id,
                                                         std::optional<FileTransferState> status = std::nullopt) = 0;

    //! \brief Per-status counts recomputed from the records
    virtual LedgerTally tally(JobId job_id) = 0;

    //! \brief Marks records left Transferring/Verifying by an interrupted runner as Failed with the given error
    //! \return Number of records requeued
    virtual size_t requeue_interrupted(JobId job_id, const std::string& error) = 0;

    //! \brief InProgress -> Completed, to be called once no eligible record remains; counters are reconciled with
    //! the records
    //! \return The updated job, std::nullopt if the job was no longer InProgress
    virtual std::optional<MigrationJob> finalize(JobId job_id) = 0;
};

}  // namespace ferry::migration
