// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <ferry/migration/checkpoint_store.hpp>
#include <ferry/migration/job_scheduler.hpp>
#include <ferry/migration/settings.hpp>
#include <ferry/migration/storage_config_registry.hpp>
#include <ferry/migration/transfer_ledger.hpp>
#include <ferry/migration/transport.hpp>

namespace ferry::migration {

//! \brief Relaunches the runner of a Paused or Failed job
//! \details No resume-specific bookkeeping exists: the runner picks up whatever the ledger still holds as eligible
class ResumeController {
  public:
    ResumeController(TransferLedger& ledger, CheckpointStore& checkpoints, StorageConfigRegistry& configurations,
                     const TransportRegistry& transports, JobScheduler& scheduler, const MigrationSettings& settings)
        : ledger_{ledger},
          checkpoints_{checkpoints},
          configurations_{configurations},
          transports_{transports},
          scheduler_{scheduler},
          settings_{settings} {}

    //! \brief Moves the job back to InProgress and launches its runner
    //! \return Snapshot of the job after the transition
    //! \throws MigrationError (kJobNotFound, kAlreadyRunning, kNotResumable, kUnknownSourceCategory,
    //! kUnsupportedProvider); the job is left untouched on error
    MigrationJob resume(JobId job_id);

  private:
    TransferLedger& ledger_;
    CheckpointStore& checkpoints_;
    StorageConfigRegistry& configurations_;
    const TransportRegistry& transports_;
    JobScheduler& scheduler_;
    const MigrationSettings& settings_;
};

}  // namespace ferry::migration
