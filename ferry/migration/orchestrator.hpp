// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include <ferry/migration/checkpoint_store.hpp>
#include <ferry/migration/file_inventory.hpp>
#include <ferry/migration/job_scheduler.hpp>
#include <ferry/migration/settings.hpp>
#include <ferry/migration/storage_config_registry.hpp>
#include <ferry/migration/transfer_ledger.hpp>
#include <ferry/migration/transport.hpp>

namespace ferry::migration {

//! \brief Parameters of a new migration
struct MigrationRequest {
    StorageCategory source_category{StorageCategory::kAssets};
    StorageProvider target_provider{StorageProvider::kLocal};
    nlohmann::json target_config = nlohmann::json::object();
    std::vector<std::string> asset_types;
    bool update_references{false};
    std::optional<uint32_t> batch_size;  // Falls back to MigrationSettings::default_batch_size
};

//! \brief Creates migration jobs and hands them over to the scheduler
class Orchestrator {
  public:
    Orchestrator(TransferLedger& ledger, CheckpointStore& checkpoints, StorageConfigRegistry& configurations,
                 const TransportRegistry& transports, FileInventory& inventory, JobScheduler& scheduler,
                 const MigrationSettings& settings)
        : ledger_{ledger},
          checkpoints_{checkpoints},
          configurations_{configurations},
          transports_{transports},
          inventory_{inventory},
          scheduler_{scheduler},
          settings_{settings} {}

    //! \brief Validates request, persists the job with one Pending record per inventory entry and launches its runner
    //! \return Snapshot of the job as created (status Pending); the runner proceeds in background
    //! \throws MigrationError on validation failures, in which case nothing is persisted
    MigrationJob start(const MigrationRequest& request);

  private:
    TransferLedger& ledger_;
    CheckpointStore& checkpoints_;
    StorageConfigRegistry& configurations_;
    const TransportRegistry& transports_;
    FileInventory& inventory_;
    JobScheduler& scheduler_;
    const MigrationSettings& settings_;
};

}  // namespace ferry::migration
