// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "resume_controller.hpp"

#include <utility>

#include <catch2/catch_test_macros.hpp>

#include <ferry/migration/error.hpp>
#include <ferry/migration/test_util/ledger_test_base.hpp>

namespace ferry::migration {

class ResumeControllerTest : public test_util::LedgerTestBase {
  public:
    ResumeControllerTest() {
        transports_.register_factory(StorageProvider::kLocal, test_util::scripted_factory(script_));
        (void)configurations_.upsert(StorageCategory::kAssets, StorageProvider::kLocal,
                                     {{"local_path", "/srv/assets"}});
    }

  protected:
    //! Job whose first processed files are done and that got interrupted into status
    JobId interrupted_job(size_t files, size_t processed, MigrationState status) {
        const auto created{create_job(files, 4)};
        auto runner{make_runner(created.id)};
        script_->on_success = [&](size_t successes) {
            if (successes == processed) runner->stop();
        };
        (void)runner->run();
        script_->on_success = nullptr;
        script_->calls.clear();
        if (status == MigrationState::kFailed) {
            REQUIRE(ledger_.transition(created.id, {MigrationState::kPaused}, MigrationState::kFailed, "ledger lost"));
        }
        return created.id;
    }

    ErrorCode resume_error(JobId job_id) {
        try {
            (void)controller_.resume(job_id);
        } catch (const MigrationError& ex) {
            return ex.code();
        }
        FAIL("resume unexpectedly succeeded");
        return ErrorCode::kLedgerError;
    }

    StorageConfigRegistry configurations_{context_.env()};
    TransportRegistry transports_;
    JobScheduler scheduler_{2};
    ResumeController controller_{ledger_, checkpoints_, configurations_, transports_, scheduler_, settings_};
};

TEST_CASE_METHOD(ResumeControllerTest, "ResumeController::resume", "[ferry][migration][resume]") {
    SECTION("paused job") {
        const auto job_id{interrupted_job(20, 7, MigrationState::kPaused)};
        const auto resumed{controller_.resume(job_id)};
        CHECK(resumed.status == MigrationState::kInProgress);

        CHECK(scheduler_.wait(job_id) == BatchRunner::Result::kCompleted);
        CHECK(script_->calls.size() == 13);
        for (const auto& record : records(job_id)) {
            CHECK(record.status == FileTransferState::kCompleted);
            CHECK(record.attempt_count == 1);
        }
        CHECK(job(job_id).migrated_files == 20);
    }

    SECTION("failed job") {
        const auto job_id{interrupted_job(6, 2, MigrationState::kFailed)};
        const auto resumed{controller_.resume(job_id)};
        CHECK(resumed.status == MigrationState::kInProgress);
        CHECK_FALSE(resumed.error);

        CHECK(scheduler_.wait(job_id) == BatchRunner::Result::kCompleted);
        CHECK(script_->calls.size() == 4);
        CHECK(job(job_id).status == MigrationState::kCompleted);
    }
}

TEST_CASE_METHOD(ResumeControllerTest, "ResumeController::resume preconditions", "[ferry][migration][resume]") {
    SECTION("unknown job") {
        CHECK(resume_error(42) == ErrorCode::kJobNotFound);
    }

    SECTION("pending job") {
        const auto created{create_job(3)};
        CHECK(resume_error(created.id) == ErrorCode::kNotResumable);
        CHECK(job(created.id).status == MigrationState::kPending);
    }

    SECTION("completed job") {
        const auto created{create_job(3)};
        CHECK(make_runner(created.id)->run() == BatchRunner::Result::kCompleted);
        CHECK(resume_error(created.id) == ErrorCode::kNotResumable);
    }

    SECTION("cancelled job") {
        const auto created{create_job(3)};
        REQUIRE(ledger_.transition(created.id, {MigrationState::kPending}, MigrationState::kCancelled));
        CHECK(resume_error(created.id) == ErrorCode::kNotResumable);
        CHECK(job(created.id).status == MigrationState::kCancelled);
    }

    SECTION("job already in progress") {
        const auto created{create_job(3)};
        REQUIRE(ledger_.transition(created.id, {MigrationState::kPending}, MigrationState::kInProgress));
        CHECK(resume_error(created.id) == ErrorCode::kAlreadyRunning);
    }

    SECTION("source configuration missing") {
        MigrationJob orphan{
            .source_category = StorageCategory::kApps,
            .target_provider = StorageProvider::kLocal,
            .target_config = {{"local_path", "/mnt/target"}},
        };
        orphan = ledger_.create_job(std::move(orphan), test_util::make_entries(1));
        REQUIRE(ledger_.transition(orphan.id, {MigrationState::kPending}, MigrationState::kInProgress));
        REQUIRE(ledger_.transition(orphan.id, {MigrationState::kInProgress}, MigrationState::kPaused));
        CHECK(resume_error(orphan.id) == ErrorCode::kUnknownSourceCategory);
        CHECK(job(orphan.id).status == MigrationState::kPaused);
    }
}

}  // namespace ferry::migration
