// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <ferry/infra/concurrency/stoppable.hpp>
#include <ferry/migration/checkpoint_store.hpp>
#include <ferry/migration/settings.hpp>
#include <ferry/migration/transfer_ledger.hpp>
#include <ferry/migration/transport.hpp>

namespace ferry::migration {

//! \brief Worker loop moving the files of one job until the ledger holds no eligible record
//! \details Every decision derives from the ledger, so run() may be invoked again after a crash or a pause and picks
//! up exactly the records still eligible. Files are transferred one at a time. Cancellation is observed before each
//! batch; a stop request (pause) is observed before each file.
class BatchRunner : public Stoppable {
  public:
    enum class [[nodiscard]] Result {
        kCompleted,    // No eligible record left, job finalized
        kCancelled,    // Job found Cancelled before a batch
        kPaused,       // Stop requested, job moved to Paused
        kFailed,       // Orchestration error, job moved to Failed
        kNotRunnable,  // Job missing or not in a runnable state
    };

    BatchRunner(JobId job_id, TransferLedger& ledger, CheckpointStore& checkpoints,
                std::unique_ptr<Transport> transport, const MigrationSettings& settings);

    //! \brief Runs batches until completion, cancellation, pause or failure
    Result run();

    JobId job_id() const { return job_id_; }

    //! \brief Number of batches fetched and processed so far
    size_t processed_batches() const { return processed_batches_.load(); }

    //! \brief Number of transfer attempts made so far
    size_t transfer_attempts() const { return transfer_attempts_.load(); }

    //! \brief Key/value pairs describing the runner progress, suitable for log::Args
    std::vector<std::string> get_log_progress() const;

  private:
    Result run_loop();
    Result pause();
    void process_file(const FileTransferRecord& record);
    void save_checkpoint(const MigrationJob& snapshot, std::optional<RecordId> last_processed);
    std::optional<RecordId> last_processed_id();
    Result abort(const std::string& error);

    JobId job_id_;
    TransferLedger& ledger_;
    CheckpointStore& checkpoints_;
    std::unique_ptr<Transport> transport_;
    const MigrationSettings& settings_;
    uint32_t consecutive_checkpoint_failures_{0};
    std::optional<RecordId> last_processed_;
    std::atomic<size_t> processed_batches_{0};
    std::atomic<size_t> transfer_attempts_{0};
};

}  // namespace ferry::migration
