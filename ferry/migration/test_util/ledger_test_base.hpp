// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <utility>
#include <vector>

#include <ferry/db/test_util/temp_ledger.hpp>
#include <ferry/infra/test_util/log.hpp>
#include <ferry/migration/batch_runner.hpp>
#include <ferry/migration/mdbx_checkpoint_store.hpp>
#include <ferry/migration/mdbx_transfer_ledger.hpp>
#include <ferry/migration/settings.hpp>
#include <ferry/migration/test_util/memory_inventory.hpp>
#include <ferry/migration/test_util/scripted_transport.hpp>

namespace ferry::migration::test_util {

//! \brief Base fixture owning a temporary ledger with its MDBX-backed stores and a shared transport script
class LedgerTestBase {
  public:
    LedgerTestBase() { settings_.ledger_dir = context_.dir().ledger().path(); }

  protected:
    //! \brief Persists a job over files entries named as by make_entries
    MigrationJob create_job(size_t files, uint32_t batch_size = kDefaultBatchSize) {
        MigrationJob job{
            .source_category = StorageCategory::kAssets,
            .target_provider = StorageProvider::kLocal,
            .target_config = {{"local_path", "/mnt/target"}},
            .batch_size = batch_size,
        };
        return ledger_.create_job(std::move(job), make_entries(files));
    }

    std::unique_ptr<BatchRunner> make_runner(JobId job_id) {
        return std::make_unique<BatchRunner>(job_id, ledger_, checkpoints_,
                                             std::make_unique<ScriptedTransport>(script_), settings_);
    }

    MigrationJob job(JobId job_id) { return ledger_.read_job(job_id).value(); }

    std::vector<FileTransferRecord> records(JobId job_id) { return ledger_.list_records(job_id); }

    ferry::test_util::SetLogVerbosityGuard log_guard_{log::Level::kNone};
    db::test_util::TempLedger context_;
    MdbxTransferLedger ledger_{context_.env()};
    MdbxCheckpointStore checkpoints_{context_.env()};
    std::shared_ptr<ScriptedTransport::Script> script_{std::make_shared<ScriptedTransport::Script>()};
    MigrationSettings settings_;
};

}  // namespace ferry::migration::test_util
