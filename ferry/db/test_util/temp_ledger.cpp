// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "temp_ledger.hpp"

#include <ferry/db/ledger.hpp>

namespace ferry::db::test_util {

TempLedger::TempLedger(bool in_memory)
    : data_dir_{tmp_dir_.path(), /*create=*/true},
      env_{open_ledger_env(data_dir_.ledger().path(), in_memory)} {}

}  // namespace ferry::db::test_util
