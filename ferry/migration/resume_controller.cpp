// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "resume_controller.hpp"

#include <memory>
#include <string>
#include <utility>

#include <ferry/infra/common/log.hpp>
#include <ferry/migration/batch_runner.hpp>
#include <ferry/migration/error.hpp>

namespace ferry::migration {

MigrationJob ResumeController::resume(JobId job_id) {
    const auto job{ledger_.read_job(job_id)};
    if (!job) {
        throw MigrationError{ErrorCode::kJobNotFound, "Migration job " + std::to_string(job_id) + " not found"};
    }
    if (scheduler_.is_running(job_id) || job->status == MigrationState::kInProgress) {
        throw MigrationError{ErrorCode::kAlreadyRunning, "Migration job " + std::to_string(job_id) + " is running"};
    }
    if (!job->can_resume || (job->status != MigrationState::kPaused && job->status != MigrationState::kFailed)) {
        throw MigrationError{ErrorCode::kNotResumable, "Migration job " + std::to_string(job_id) + " is " +
                                                           std::string{to_string(job->status)} + " and cannot resume"};
    }

    const auto source{configurations_.find(job->source_category)};
    if (!source) {
        throw MigrationError{ErrorCode::kUnknownSourceCategory,
                             "No storage configuration for category " + std::string{to_string(job->source_category)}};
    }
    auto transport{transports_.create(job->target_provider, *source, job->target_config)};
    const auto checkpoint{checkpoints_.load(job_id)};

    // Compare-and-set: a concurrent resume or cancel wins over this one
    const auto resumed{ledger_.transition(job_id, {MigrationState::kPaused, MigrationState::kFailed},
                                          MigrationState::kInProgress)};
    if (!resumed) {
        throw MigrationError{ErrorCode::kNotResumable,
                             "Migration job " + std::to_string(job_id) + " changed state while resuming"};
    }
    FERRY_INFO_M("Migration resumed", {"job", std::to_string(job_id),
                                       "from", std::string{to_string(job->status)},
                                       "processed", std::to_string(checkpoint ? checkpoint->processed_count : 0)});

    try {
        scheduler_.launch(
            std::make_shared<BatchRunner>(job_id, ledger_, checkpoints_, std::move(transport), settings_));
    } catch (const MigrationError&) {
        (void)ledger_.transition(job_id, {MigrationState::kInProgress}, MigrationState::kPaused);
        throw;
    }
    return *resumed;
}

}  // namespace ferry::migration
