// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>

#include <ferry/migration/types.hpp>

namespace ferry::migration {

//! \brief Latest progress snapshot per job (upsert, last write wins)
//! \remarks Observability only: which files remain is always decided by the TransferLedger
class CheckpointStore {
  public:
    virtual ~CheckpointStore() = default;

    virtual void save(const Checkpoint& checkpoint) = 0;
    virtual std::optional<Checkpoint> load(JobId job_id) = 0;
};

//! \brief Checkpoint reflecting the aggregate counters of a job snapshot
inline Checkpoint make_checkpoint(const MigrationJob& job, std::optional<RecordId> last_processed_file_id) {
    return Checkpoint{
        .migration_id = job.id,
        .last_processed_file_id = last_processed_file_id,
        .processed_count = job.migrated_files,
        .failed_count = job.failed_files,
        .bytes_transferred = job.transferred_bytes,
        .timestamp = now_seconds(),
    };
}

}  // namespace ferry::migration
