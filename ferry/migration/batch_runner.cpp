// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "batch_runner.hpp"

#include <utility>

#include <magic_enum.hpp>

#include <ferry/infra/common/ensure.hpp>
#include <ferry/infra/common/log.hpp>
#include <ferry/migration/error.hpp>

namespace ferry::migration {

BatchRunner::BatchRunner(JobId job_id, TransferLedger& ledger, CheckpointStore& checkpoints,
                         std::unique_ptr<Transport> transport, const MigrationSettings& settings)
    : job_id_{job_id},
      ledger_{ledger},
      checkpoints_{checkpoints},
      transport_{std::move(transport)},
      settings_{settings} {
    ensure(transport_ != nullptr, "BatchRunner requires a transport");
}

std::vector<std::string> BatchRunner::get_log_progress() const {
    return {"job", std::to_string(job_id_), "batches", std::to_string(processed_batches()),
            "attempts", std::to_string(transfer_attempts())};
}

BatchRunner::Result BatchRunner::run() {
    FERRY_INFO_M("Migration runner started", {"job", std::to_string(job_id_)});
    Result result{Result::kFailed};
    try {
        result = run_loop();
    } catch (const std::exception& ex) {
        result = abort(ex.what());
    }
    auto args{get_log_progress()};
    args.emplace_back("result");
    args.emplace_back(magic_enum::enum_name(result));
    FERRY_INFO_M("Migration runner stopped", args);
    return result;
}

BatchRunner::Result BatchRunner::run_loop() {
    auto job{ledger_.read_job(job_id_)};
    if (!job) {
        FERRY_WARN_M("Migration job not found", {"job", std::to_string(job_id_)});
        return Result::kNotRunnable;
    }
    if (job->status == MigrationState::kCancelled) {
        return Result::kCancelled;
    }
    if (job->status == MigrationState::kPending) {
        job = ledger_.transition(job_id_, {MigrationState::kPending}, MigrationState::kInProgress);
        if (!job) return Result::kNotRunnable;  // Raced by cancel
    } else if (job->status != MigrationState::kInProgress) {
        FERRY_WARN_M("Migration job not runnable", {"job", std::to_string(job_id_),
                                                    "status", std::string{to_string(job->status)}});
        return Result::kNotRunnable;
    }
    const size_t batch_size{job->batch_size > 0 ? job->batch_size : settings_.default_batch_size};

    // At most one runner exists per job, so anything in flight now was left behind by an aborted run
    if (const auto requeued{ledger_.requeue_interrupted(job_id_, kInterruptedError)}; requeued > 0) {
        FERRY_WARN_M("Requeued interrupted transfers", {"job", std::to_string(job_id_),
                                                        "records", std::to_string(requeued)});
    }

    while (true) {
        const auto current{ledger_.read_job(job_id_)};
        if (!current) {
            throw MigrationError{ErrorCode::kJobNotFound, "Migration job " + std::to_string(job_id_) + " vanished"};
        }
        if (current->status == MigrationState::kCancelled) {
            FERRY_INFO_M("Migration cancelled", {"job", std::to_string(job_id_)});
            return Result::kCancelled;
        }
        if (current->status != MigrationState::kInProgress) {
            return Result::kNotRunnable;
        }
        if (is_stopping()) {
            return pause();
        }

        const auto batch{ledger_.fetch_eligible(job_id_, batch_size, settings_.max_attempts)};
        if (batch.empty()) {
            const auto finalized{ledger_.finalize(job_id_)};
            if (!finalized) {
                // Status changed between the check above and finalization: only cancellation can do that
                const auto latest{ledger_.read_job(job_id_)};
                return latest && latest->status == MigrationState::kCancelled ? Result::kCancelled
                                                                               : Result::kNotRunnable;
            }
            save_checkpoint(*finalized, last_processed_id());
            FERRY_INFO_M("Migration completed", {"job", std::to_string(job_id_),
                                                 "migrated", std::to_string(finalized->migrated_files),
                                                 "failed", std::to_string(finalized->failed_files),
                                                 "total", std::to_string(finalized->total_files)});
            return Result::kCompleted;
        }

        ++processed_batches_;
        FERRY_DEBUG_M("Processing batch", {"job", std::to_string(job_id_),
                                           "batch", std::to_string(processed_batches_.load()),
                                           "files", std::to_string(batch.size())});
        for (const auto& record : batch) {
            if (is_stopping()) {
                return pause();
            }
            process_file(record);
        }
    }
}

BatchRunner::Result BatchRunner::pause() {
    if (ledger_.transition(job_id_, {MigrationState::kInProgress}, MigrationState::kPaused)) {
        FERRY_INFO_M("Migration paused", {"job", std::to_string(job_id_)});
        return Result::kPaused;
    }
    const auto latest{ledger_.read_job(job_id_)};
    return latest && latest->status == MigrationState::kCancelled ? Result::kCancelled : Result::kNotRunnable;
}

void BatchRunner::process_file(const FileTransferRecord& record) {
    const auto claimed{ledger_.claim(job_id_, record.id)};
    ++transfer_attempts_;
    last_processed_ = claimed.id;

    std::string target_path;
    std::optional<std::string> failure;
    try {
        target_path = transport_->transfer(claimed.source_path);
    } catch (const std::exception& ex) {
        failure = ex.what();
    }

    if (failure) {
        FERRY_WARN_M("File transfer failed", {"job", std::to_string(job_id_),
                                              "file", claimed.source_path,
                                              "attempt", std::to_string(claimed.attempt_count),
                                              "error", *failure});
        const auto snapshot{ledger_.record_failure(job_id_, claimed.id, *failure)};
        save_checkpoint(snapshot, claimed.id);
    } else {
        FERRY_TRACE_M("File transferred", {"job", std::to_string(job_id_),
                                           "file", claimed.source_path,
                                           "target", target_path});
        const auto snapshot{ledger_.record_success(job_id_, claimed.id, target_path)};
        save_checkpoint(snapshot, claimed.id);
    }
}

void BatchRunner::save_checkpoint(const MigrationJob& snapshot, std::optional<RecordId> last_processed) {
    try {
        checkpoints_.save(make_checkpoint(snapshot, last_processed));
        consecutive_checkpoint_failures_ = 0;
    } catch (const std::exception& ex) {
        ++consecutive_checkpoint_failures_;
        FERRY_WARN_M("Checkpoint write failed", {"job", std::to_string(job_id_),
                                                 "consecutive", std::to_string(consecutive_checkpoint_failures_),
                                                 "error", ex.what()});
        if (consecutive_checkpoint_failures_ > settings_.max_checkpoint_failures) {
            throw MigrationError{ErrorCode::kCheckpointError,
                                 "Checkpoint writes failed " + std::to_string(consecutive_checkpoint_failures_) +
                                     " times in a row: " + ex.what()};
        }
    }
}

std::optional<RecordId> BatchRunner::last_processed_id() {
    if (last_processed_) {
        return last_processed_;
    }
    // A runner finding nothing left to do keeps the file recorded by the previous run
    try {
        if (const auto checkpoint{checkpoints_.load(job_id_)}) {
            return checkpoint->last_processed_file_id;
        }
    } catch (const std::exception& ex) {
        FERRY_WARN_M("Checkpoint read failed", {"job", std::to_string(job_id_), "error", ex.what()});
    }
    return std::nullopt;
}

BatchRunner::Result BatchRunner::abort(const std::string& error) {
    FERRY_ERROR_M("Migration aborted", {"job", std::to_string(job_id_), "error", error});
    try {
        (void)ledger_.transition(job_id_, {MigrationState::kPending, MigrationState::kInProgress},
                                 MigrationState::kFailed, error);
    } catch (const std::exception& ex) {
        FERRY_CRIT_M("Cannot mark migration as failed", {"job", std::to_string(job_id_), "error", ex.what()});
    }
    return Result::kFailed;
}

}  // namespace ferry::migration
