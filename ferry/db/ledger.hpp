// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>

#include <ferry/db/kvdb/mdbx.hpp>

namespace ferry::db {

//! \brief Opens (creating if needed) the ledger environment in directory and ensures its tables exist
//! \param in_memory : skip meta syncs, for tests and throwaway runs
//! \throws std::runtime_error on incompatible schema
::mdbx::env_managed open_ledger_env(const std::filesystem::path& directory, bool in_memory = false);

}  // namespace ferry::db
