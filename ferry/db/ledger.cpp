// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "ledger.hpp"

#include <ferry/db/tables.hpp>
#include <ferry/infra/common/log.hpp>

namespace ferry::db {

::mdbx::env_managed open_ledger_env(const std::filesystem::path& directory, bool in_memory) {
    EnvConfig config{
        .path = directory.string(),
        .create = !std::filesystem::exists(get_datafile_path(directory)),
        .inmemory = in_memory,
    };
    FERRY_DEBUG_M("Opening ledger", {"path", config.path, "create", config.create ? "true" : "false"});

    auto env{open_env(config)};
    RWTxn txn{env};
    table::check_or_create_ledger_tables(*txn);
    txn.commit();
    return env;
}

}  // namespace ferry::db
