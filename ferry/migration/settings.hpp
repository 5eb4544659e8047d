// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <filesystem>

#include <ferry/migration/types.hpp>

namespace ferry::migration {

//! \brief Tunables of the migration engine
struct MigrationSettings {
    //! Directory holding the ledger MDBX environment
    std::filesystem::path ledger_dir;
    //! Worker threads running batch runners (one runner per active job)
    uint32_t num_workers{2};
    //! Batch size used when a request does not specify one
    uint32_t default_batch_size{kDefaultBatchSize};
    //! Transfer attempts per file before it is permanently failed
    uint32_t max_attempts{kMaxTransferAttempts};
    //! Consecutive checkpoint write failures tolerated before the job is aborted
    uint32_t max_checkpoint_failures{5};
    //! Whether startup recovery launches jobs left Pending
    bool relaunch_pending{false};
};

}  // namespace ferry::migration
