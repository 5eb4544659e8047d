// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "migration_service.hpp"

#include <string>
#include <utility>

#include <ferry/infra/common/log.hpp>
#include <ferry/migration/directory_inventory.hpp>
#include <ferry/migration/error.hpp>

namespace ferry::migration {

MigrationService::MigrationService(::mdbx::env& env, MigrationSettings settings, TransportRegistry transports,
                                   std::unique_ptr<FileInventory> inventory)
    : settings_{std::move(settings)},
      ledger_{env},
      checkpoints_{env},
      configurations_{env},
      transports_{std::move(transports)},
      inventory_{inventory ? std::move(inventory) : std::make_unique<DirectoryInventory>()},
      scheduler_{settings_.num_workers},
      orchestrator_{ledger_, checkpoints_, configurations_, transports_, *inventory_, scheduler_, settings_},
      resume_controller_{ledger_, checkpoints_, configurations_, transports_, scheduler_, settings_} {}

MigrationService::~MigrationService() {
    shutdown();
}

bool MigrationService::cancel(JobId job_id) {
    const auto cancelled{ledger_.transition(job_id, {MigrationState::kPending, MigrationState::kInProgress},
                                            MigrationState::kCancelled)};
    if (!cancelled) {
        return false;
    }
    FERRY_INFO_M("Migration cancel requested", {"job", std::to_string(job_id),
                                                "running", scheduler_.is_running(job_id) ? "yes" : "no"});
    return true;
}

std::vector<FileTransferRecord> MigrationService::list_files(JobId job_id, std::optional<FileTransferState> status) {
    return ledger_.list_records(job_id, status);
}

RecoveryReport MigrationService::recover() {
    RecoveryReport report;
    for (const auto& job : ledger_.list_jobs()) {
        if (scheduler_.is_running(job.id)) continue;

        if (job.status == MigrationState::kInProgress) {
            const auto requeued{ledger_.requeue_interrupted(job.id, kInterruptedError)};
            report.requeued_records += requeued;
            if (ledger_.transition(job.id, {MigrationState::kInProgress}, MigrationState::kPaused)) {
                report.paused.push_back(job.id);
                FERRY_INFO_M("Interrupted migration paused", {"job", std::to_string(job.id),
                                                              "requeued", std::to_string(requeued)});
            }
        } else if (job.status == MigrationState::kPending && settings_.relaunch_pending) {
            const auto source{configurations_.find(job.source_category)};
            if (!source) {
                FERRY_WARN_M("Pending migration has no source configuration",
                             {"job", std::to_string(job.id), "category", std::string{to_string(job.source_category)}});
                continue;
            }
            try {
                auto transport{transports_.create(job.target_provider, *source, job.target_config)};
                scheduler_.launch(
                    std::make_shared<BatchRunner>(job.id, ledger_, checkpoints_, std::move(transport), settings_));
                report.relaunched.push_back(job.id);
            } catch (const MigrationError& ex) {
                FERRY_WARN_M("Pending migration not relaunched", {"job", std::to_string(job.id),
                                                                  "code", ex.code_name(), "error", ex.what()});
            }
        }
    }
    FERRY_INFO_M("Migration recovery done", {"paused", std::to_string(report.paused.size()),
                                             "relaunched", std::to_string(report.relaunched.size()),
                                             "requeued", std::to_string(report.requeued_records)});
    return report;
}

}  // namespace ferry::migration
