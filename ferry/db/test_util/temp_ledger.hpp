// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <ferry/db/kvdb/mdbx.hpp>
#include <ferry/infra/common/directories.hpp>

namespace ferry::db::test_util {

//! \brief TempLedger is a helper resource manager for a temporary data directory plus a ledger database.
//! Upon construction, it creates the directory tree and all the ledger tables.
//! \remarks TempLedger follows the RAII idiom and cleans up its temporary directory upon destruction.
class TempLedger {
  public:
    explicit TempLedger(bool in_memory = true);

    // Not copyable nor movable
    TempLedger(const TempLedger&) = delete;
    TempLedger& operator=(const TempLedger&) = delete;

    const DataDirectory& dir() const { return data_dir_; }

    ::mdbx::env& env() { return env_; }

  private:
    TemporaryDirectory tmp_dir_;
    DataDirectory data_dir_;
    ::mdbx::env_managed env_;
};

}  // namespace ferry::db::test_util
