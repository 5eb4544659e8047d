// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <ferry/db/kvdb/mdbx.hpp>

/*
Part of the compatibility layer with the ferry ledger format; see its documentation for details.
Values are JSON documents unless otherwise stated.
*/

namespace ferry::db::table {

//! Version of the ledger layout, bumped on any incompatible change to keys or values
inline constexpr uint64_t kRequiredSchemaVersion{1};

/* Tables */

//! \details Holds ledger metadata (e.g. schema version)
//! \struct
//! key   : metadata name
//! value : 8 bytes big-endian unsigned integer
inline constexpr db::MapConfig kDatabaseInfo{"DbInfo"};

//! \details Holds the last assigned id for each table allocating sequential identifiers
//! \struct
//! key   : table name
//! value : 8 bytes big-endian next free id
inline constexpr db::MapConfig kSequence{"Sequence"};

//! \details Migration jobs
//! \struct
//! key   : job id (8 bytes big-endian)
//! value : MigrationJob
inline constexpr db::MapConfig kMigrations{"Migrations"};

//! \details Per-file transfer records. Key order equals creation order within a job
//! \struct
//! key   : job id (8 bytes big-endian) + record id (8 bytes big-endian)
//! value : FileTransferRecord
inline constexpr db::MapConfig kTransferRecords{"TransferRecords"};

//! \details Scan floor of each job: every record of the job keyed below it is Completed or Skipped
//! \struct
//! key   : job id (8 bytes big-endian)
//! value : record id (8 bytes big-endian)
//! \remarks A missing entry means the records are scanned from the first one of the job
inline constexpr db::MapConfig kTransferScanFloor{"TransferScanFloor"};

//! \details Latest checkpoint of each job
//! \struct
//! key   : job id (8 bytes big-endian)
//! value : Checkpoint
inline constexpr db::MapConfig kCheckpoints{"Checkpoints"};

//! \details Active storage configuration per category
//! \struct
//! key   : category name (e.g. "assets")
//! value : StorageConfiguration
inline constexpr db::MapConfig kStorageConfigurations{"StorageConfigurations"};

inline constexpr db::MapConfig kLedgerTables[]{
    kDatabaseInfo,
    kSequence,
    kMigrations,
    kTransferRecords,
    kTransferScanFloor,
    kCheckpoints,
    kStorageConfigurations,
};

//! \brief Ensures all defined tables are present in db with consistent flags. Should a table not exist it gets created
//! \throws std::runtime_error on incompatible table flags or schema version
void check_or_create_ledger_tables(::mdbx::txn& txn);

}  // namespace ferry::db::table
