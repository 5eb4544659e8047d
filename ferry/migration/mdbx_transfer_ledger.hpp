// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <ferry/db/kvdb/mdbx.hpp>
#include <ferry/migration/transfer_ledger.hpp>

namespace ferry::migration {

//! \brief TransferLedger stored in the Migrations and TransferRecords tables of an MDBX environment
//! \details Each operation runs in its own transaction; MDBX serializes writers across threads
class MdbxTransferLedger : public TransferLedger {
  public:
    explicit MdbxTransferLedger(::mdbx::env& env) : env_{env} {}

    MigrationJob create_job(MigrationJob job, const std::vector<InventoryEntry>& entries) override;
    std::optional<MigrationJob> read_job(JobId job_id) override;
    std::vector<MigrationJob> list_jobs() override;
    std::optional<MigrationJob> transition(JobId job_id, const std::vector<MigrationState>& expected,
                                           MigrationState desired,
                                           const std::optional<std::string>& error = std::nullopt) override;
    std::vector<FileTransferRecord> fetch_eligible(JobId job_id, size_t limit, uint32_t max_attempts) override;
    FileTransferRecord claim(JobId job_id, RecordId record_id) override;
    MigrationJob record_success(JobId job_id, RecordId record_id, const std::string& target_path) override;
    MigrationJob record_failure(JobId job_id, RecordId record_id, const std::string& error) override;
    std::vector<FileTransferRecord> list_records(JobId job_id,
                                                 std::optional<FileTransferState> status = std::nullopt) override;
    LedgerTally tally(JobId job_id) override;
    size_t requeue_interrupted(JobId job_id, const std::string& error) override;
    std::optional<MigrationJob> finalize(JobId job_id) override;

  private:
    ::mdbx::env& env_;
};

}  // namespace ferry::migration
