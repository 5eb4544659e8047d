// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "batch_runner.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

#include <catch2/catch_test_macros.hpp>

#include <ferry/migration/error.hpp>
#include <ferry/migration/test_util/ledger_test_base.hpp>

namespace ferry::migration {

using test_util::LedgerTestBase;

//! Checkpoint store failing a scripted number of writes (negative: all of them)
class FlakyCheckpointStore : public CheckpointStore {
  public:
    explicit FlakyCheckpointStore(CheckpointStore& delegate, int failures) : delegate_{delegate}, failures_{failures} {}

    void save(const Checkpoint& checkpoint) override {
        if (failures_ != 0) {
            if (failures_ > 0) --failures_;
            throw MigrationError{ErrorCode::kLedgerError, "checkpoint storage unavailable"};
        }
        delegate_.save(checkpoint);
    }
    std::optional<Checkpoint> load(JobId job_id) override { return delegate_.load(job_id); }

  private:
    CheckpointStore& delegate_;
    int failures_;
};

//! Checkpoint store verifying the job counters against the ledger on every write
class AuditingCheckpointStore : public CheckpointStore {
  public:
    explicit AuditingCheckpointStore(TransferLedger& ledger) : ledger_{ledger} {}

    void save(const Checkpoint& checkpoint) override {
        const auto job{ledger_.read_job(checkpoint.migration_id)};
        if (job->migrated_files + job->failed_files > job->total_files) ++violations;
        if (checkpoint.processed_count + checkpoint.failed_count > job->total_files) ++violations;
        ++saves;
        last = checkpoint;
    }
    std::optional<Checkpoint> load(JobId) override { return last; }

    size_t saves{0};
    size_t violations{0};
    std::optional<Checkpoint> last;

  private:
    TransferLedger& ledger_;
};

//! Ledger delegating to another one, failing record_success after a number of calls
class UnreachableLedger : public TransferLedger {
  public:
    UnreachableLedger(TransferLedger& delegate, size_t successes_allowed)
        : delegate_{delegate}, successes_allowed_{successes_allowed} {}

    MigrationJob create_job(MigrationJob job, const std::vector<InventoryEntry>& entries) override {
        return delegate_.create_job(std::move(job), entries);
    }
    std::optional<MigrationJob> read_job(JobId job_id) override { return delegate_.read_job(job_id); }
    std::vector<MigrationJob> list_jobs() override { return delegate_.list_jobs(); }
    std::optional<MigrationJob> transition(JobId job_id, const std::vector<MigrationState>& expected,
                                           MigrationState desired, const std::optional<std::string>& error) override {
        return delegate_.transition(job_id, expected, desired, error);
    }
    std::vector<FileTransferRecord> fetch_eligible(JobId job_id, size_t limit, uint32_t max_attempts) override {
        return delegate_.fetch_eligible(job_id, limit, max_attempts);
    }
    FileTransferRecord claim(JobId job_id, RecordId record_id) override { return delegate_.claim(job_id, record_id); }
    MigrationJob record_success(JobId job_id, RecordId record_id, const std::string& target_path) override {
        if (successes_allowed_ == 0) {
            throw MigrationError{ErrorCode::kLedgerError, "record_success failed: ledger unreachable"};
        }
        --successes_allowed_;
        return delegate_.record_success(job_id, record_id, target_path);
    }
    MigrationJob record_failure(JobId job_id, RecordId record_id, const std::string& error) override {
        return delegate_.record_failure(job_id, record_id, error);
    }
    std::vector<FileTransferRecord> list_records(JobId job_id, std::optional<FileTransferState> status) override {
        return delegate_.list_records(job_id, status);
    }
    LedgerTally tally(JobId job_id) override { return delegate_.tally(job_id); }
    size_t requeue_interrupted(JobId job_id, const std::string& error) override {
        return delegate_.requeue_interrupted(job_id, error);
    }
    std::optional<MigrationJob> finalize(JobId job_id) override { return delegate_.finalize(job_id); }

  private:
    TransferLedger& delegate_;
    size_t successes_allowed_;
};

TEST_CASE_METHOD(LedgerTestBase, "BatchRunner: all transfers succeed", "[ferry][migration][runner]") {
    const auto created{create_job(25, 10)};
    auto runner{make_runner(created.id)};

    CHECK(runner->run() == BatchRunner::Result::kCompleted);
    CHECK(runner->processed_batches() == 3);
    CHECK(runner->transfer_attempts() == 25);

    const auto done{job(created.id)};
    CHECK(done.status == MigrationState::kCompleted);
    CHECK(done.migrated_files == 25);
    CHECK(done.failed_files == 0);
    CHECK(done.transferred_bytes == done.total_bytes);
    CHECK(done.completed_at);
    CHECK_FALSE(done.current_file);

    for (const auto& record : records(created.id)) {
        CHECK(record.status == FileTransferState::kCompleted);
        CHECK(record.attempt_count == 1);
        CHECK(record.target_path == "target/" + record.source_path);
    }
    // Files are attempted in creation order
    REQUIRE(script_->calls.size() == 25);
    CHECK(std::ranges::is_sorted(script_->calls));

    const auto checkpoint{checkpoints_.load(created.id)};
    REQUIRE(checkpoint);
    CHECK(checkpoint->processed_count == 25);
    CHECK(checkpoint->bytes_transferred == done.total_bytes);
    // Finalization keeps pointing at the last file moved
    CHECK(checkpoint->last_processed_file_id == records(created.id).back().id);
}

TEST_CASE_METHOD(LedgerTestBase, "BatchRunner: file failing every attempt", "[ferry][migration][runner]") {
    script_->failures["file-003.png"] = -1;
    const auto created{create_job(5, 10)};
    auto runner{make_runner(created.id)};

    CHECK(runner->run() == BatchRunner::Result::kCompleted);
    CHECK(runner->transfer_attempts() == 5 + 2);

    const auto done{job(created.id)};
    CHECK(done.status == MigrationState::kCompleted);
    CHECK(done.migrated_files == 4);
    CHECK(done.failed_files == 1);

    const auto all{records(created.id)};
    CHECK(all[2].status == FileTransferState::kFailed);
    CHECK(all[2].attempt_count == kMaxTransferAttempts);
    CHECK(all[2].last_error == "scripted failure of file-003.png");
    CHECK_FALSE(all[2].target_path);
    CHECK(std::ranges::count(script_->calls, "file-003.png") == 3);
    CHECK(checkpoints_.load(created.id)->last_processed_file_id == all[2].id);

    SECTION("never re-attempted automatically") {
        REQUIRE(ledger_.transition(created.id, {MigrationState::kCompleted}, MigrationState::kInProgress));
        auto again{make_runner(created.id)};
        CHECK(again->run() == BatchRunner::Result::kCompleted);
        CHECK(again->transfer_attempts() == 0);
        CHECK(records(created.id)[2].attempt_count == kMaxTransferAttempts);
        // A run with nothing to move keeps the file recorded by the previous one
        CHECK(checkpoints_.load(created.id)->last_processed_file_id == all[2].id);
    }
}

TEST_CASE_METHOD(LedgerTestBase, "BatchRunner: transient failures are retried", "[ferry][migration][runner]") {
    script_->failures["file-002.png"] = 1;
    script_->failures["file-004.png"] = 2;
    const auto created{create_job(6, 4)};
    AuditingCheckpointStore audit{ledger_};
    BatchRunner runner{created.id, ledger_, audit, std::make_unique<test_util::ScriptedTransport>(script_), settings_};

    CHECK(runner.run() == BatchRunner::Result::kCompleted);
    CHECK(runner.transfer_attempts() == 6 + 3);
    CHECK(audit.violations == 0);
    CHECK(audit.saves == runner.transfer_attempts() + 1);

    const auto done{job(created.id)};
    CHECK(done.migrated_files == 6);
    CHECK(done.failed_files == 0);
    const auto all{records(created.id)};
    CHECK(all[1].attempt_count == 2);
    CHECK(all[3].attempt_count == 3);
    CHECK(all[3].status == FileTransferState::kCompleted);
    CHECK_FALSE(all[3].last_error);
    REQUIRE(audit.last);
    CHECK(audit.last->last_processed_file_id == all[3].id);

    // Retries queue behind files already eligible: file-002 is retried only after the first batch
    REQUIRE(script_->calls.size() == 9);
    CHECK(script_->calls[4] == "file-002.png");
}

TEST_CASE_METHOD(LedgerTestBase, "BatchRunner: cancellation between batches", "[ferry][migration][runner]") {
    const auto created{create_job(30, 10)};
    script_->on_success = [&](size_t successes) {
        if (successes == 4) {
            // Cancelled while the first batch is in flight
            REQUIRE(ledger_.transition(created.id, {MigrationState::kInProgress}, MigrationState::kCancelled));
        }
    };
    auto runner{make_runner(created.id)};

    CHECK(runner->run() == BatchRunner::Result::kCancelled);
    CHECK(runner->processed_batches() == 1);

    const auto cancelled{job(created.id)};
    CHECK(cancelled.status == MigrationState::kCancelled);
    CHECK_FALSE(cancelled.can_resume);
    CHECK_FALSE(cancelled.current_file);
    CHECK(cancelled.migrated_files <= 10);
    CHECK(cancelled.migrated_files + cancelled.failed_files <= cancelled.total_files);

    const auto all{records(created.id)};
    for (size_t i{0}; i < all.size(); ++i) {
        if (i < 10) {
            CHECK(all[i].status == FileTransferState::kCompleted);
        } else {
            CHECK(all[i].attempt_count == 0);
            CHECK(all[i].status == FileTransferState::kPending);
        }
    }

    SECTION("cancelled job does not run again") {
        auto again{make_runner(created.id)};
        CHECK(again->run() == BatchRunner::Result::kCancelled);
        CHECK(again->transfer_attempts() == 0);
    }
}

TEST_CASE_METHOD(LedgerTestBase, "BatchRunner: pause and resume", "[ferry][migration][runner]") {
    const auto created{create_job(20, 10)};
    auto first{make_runner(created.id)};
    script_->on_success = [&](size_t successes) {
        if (successes == 7) first->stop();
    };

    CHECK(first->run() == BatchRunner::Result::kPaused);
    CHECK(first->transfer_attempts() == 7);

    const auto paused{job(created.id)};
    CHECK(paused.status == MigrationState::kPaused);
    CHECK(paused.can_resume);
    CHECK(paused.migrated_files == 7);
    CHECK_FALSE(paused.current_file);

    script_->on_success = nullptr;
    REQUIRE(ledger_.transition(created.id, {MigrationState::kPaused}, MigrationState::kInProgress));
    auto second{make_runner(created.id)};
    CHECK(second->run() == BatchRunner::Result::kCompleted);
    CHECK(second->transfer_attempts() == 13);

    const auto all{records(created.id)};
    REQUIRE(all.size() == 20);
    for (const auto& record : all) {
        CHECK(record.status == FileTransferState::kCompleted);
        CHECK(record.attempt_count == 1);
    }
    CHECK(job(created.id).migrated_files == 20);
    CHECK(script_->calls.size() == 20);
}

TEST_CASE_METHOD(LedgerTestBase, "BatchRunner: checkpoint write failures", "[ferry][migration][runner]") {
    const auto created{create_job(10, 10)};

    SECTION("tolerated when transient") {
        FlakyCheckpointStore flaky{checkpoints_, 3};
        BatchRunner runner{created.id, ledger_, flaky, std::make_unique<test_util::ScriptedTransport>(script_),
                           settings_};
        CHECK(runner.run() == BatchRunner::Result::kCompleted);
        CHECK(job(created.id).migrated_files == 10);
        CHECK(checkpoints_.load(created.id)->processed_count == 10);
    }

    SECTION("fatal when repeated") {
        FlakyCheckpointStore flaky{checkpoints_, -1};
        BatchRunner runner{created.id, ledger_, flaky, std::make_unique<test_util::ScriptedTransport>(script_),
                           settings_};
        CHECK(runner.run() == BatchRunner::Result::kFailed);
        CHECK(runner.transfer_attempts() == settings_.max_checkpoint_failures + 1);

        const auto failed{job(created.id)};
        CHECK(failed.status == MigrationState::kFailed);
        CHECK(failed.can_resume);
        REQUIRE(failed.error);
        CHECK(failed.error->find("Checkpoint writes failed") != std::string::npos);
    }
}

TEST_CASE_METHOD(LedgerTestBase, "BatchRunner: unreachable ledger", "[ferry][migration][runner]") {
    const auto created{create_job(5, 10)};
    UnreachableLedger unreachable{ledger_, 2};
    BatchRunner runner{created.id, unreachable, checkpoints_, std::make_unique<test_util::ScriptedTransport>(script_),
                       settings_};

    CHECK(runner.run() == BatchRunner::Result::kFailed);
    const auto failed{job(created.id)};
    CHECK(failed.status == MigrationState::kFailed);
    CHECK(failed.migrated_files == 2);
    CHECK(failed.error == "record_success failed: ledger unreachable");
    CHECK(records(created.id)[2].status == FileTransferState::kTransferring);

    SECTION("resumed run requeues the interrupted record") {
        REQUIRE(ledger_.transition(created.id, {MigrationState::kFailed}, MigrationState::kInProgress));
        auto resumed{make_runner(created.id)};
        CHECK(resumed->run() == BatchRunner::Result::kCompleted);
        CHECK(resumed->transfer_attempts() == 3);

        const auto all{records(created.id)};
        CHECK(all[2].status == FileTransferState::kCompleted);
        CHECK(all[2].attempt_count == 2);
        CHECK(job(created.id).migrated_files == 5);
        CHECK(job(created.id).failed_files == 0);
    }
}

TEST_CASE_METHOD(LedgerTestBase, "BatchRunner: job not runnable", "[ferry][migration][runner]") {
    SECTION("unknown job") {
        auto runner{make_runner(77)};
        CHECK(runner->run() == BatchRunner::Result::kNotRunnable);
    }
    SECTION("paused job") {
        const auto created{create_job(3)};
        REQUIRE(ledger_.transition(created.id, {MigrationState::kPending}, MigrationState::kInProgress));
        REQUIRE(ledger_.transition(created.id, {MigrationState::kInProgress}, MigrationState::kPaused));
        auto runner{make_runner(created.id)};
        CHECK(runner->run() == BatchRunner::Result::kNotRunnable);
        CHECK(script_->calls.empty());
        CHECK(job(created.id).status == MigrationState::kPaused);
    }
    SECTION("empty job completes at once") {
        const auto created{create_job(0)};
        auto runner{make_runner(created.id)};
        CHECK(runner->run() == BatchRunner::Result::kCompleted);
        CHECK(runner->processed_batches() == 0);
        CHECK(job(created.id).status == MigrationState::kCompleted);
    }
}

}  // namespace ferry::migration
