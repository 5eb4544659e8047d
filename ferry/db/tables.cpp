// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "tables.hpp"

#include <stdexcept>
#include <string>

#include <ferry/db/util.hpp>

namespace ferry::db::table {

static constexpr const char* kSchemaVersionKey{"schema_version"};

void check_or_create_ledger_tables(::mdbx::txn& txn) {
    for (const auto& config : kLedgerTables) {
        if (db::has_map(txn, config.name)) {
            auto table_map{txn.open_map(config.name)};
            auto table_info{txn.get_handle_info(table_map)};
            if (table_info.key_mode() != config.key_mode || table_info.value_mode() != config.value_mode) {
                throw std::runtime_error("MDBX Table schema incompatible: " + std::string(config.name) +
                                         " has incompatible flags.");
            }
            continue;
        }
        (void)txn.create_map(config.name, config.key_mode, config.value_mode);  // Will throw if tx is RO
    }

    auto info_map{txn.open_map(kDatabaseInfo.name)};
    const auto stored{txn.get(info_map, ::mdbx::slice{kSchemaVersionKey}, ::mdbx::slice{})};
    if (stored.empty()) {
        txn.upsert(info_map, ::mdbx::slice{kSchemaVersionKey}, to_slice(encode_u64(kRequiredSchemaVersion)));
        return;
    }
    const auto version{decode_u64(from_slice(stored))};
    if (version != kRequiredSchemaVersion) {
        throw std::runtime_error("Incompatible schema version. Expected " + std::to_string(kRequiredSchemaVersion) +
                                 " got " + std::to_string(version));
    }
}

}  // namespace ferry::db::table
