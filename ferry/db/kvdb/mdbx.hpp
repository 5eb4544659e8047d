// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wimplicit-fallthrough"
#pragma GCC diagnostic ignored "-Wold-style-cast"
#pragma GCC diagnostic ignored "-Wsign-conversion"
#pragma GCC diagnostic ignored "-Wshadow"
#include <mdbx.h++>
#pragma GCC diagnostic pop

#include <absl/functional/function_ref.h>

namespace ferry::db {

inline constexpr std::string_view kDbDataFileName{"mdbx.dat"};

inline constexpr size_t kKibi{1024};
inline constexpr size_t kMebi{1024 * kKibi};
inline constexpr size_t kGibi{1024 * kMebi};

//! \brief This class wraps a read only transaction.
//! It is used to make clear in the methods signature that the method does not require read-write access.
class ROTxn {
  public:
    explicit ROTxn(::mdbx::env& env) : managed_txn_{env.start_read()} {}
    ROTxn(ROTxn&& source) noexcept = default;

    ROTxn(const ROTxn&) = delete;
    ROTxn& operator=(const ROTxn&) = delete;

    virtual ~ROTxn() = default;

    // Access to the underling raw mdbx transaction
    ::mdbx::txn& operator*() { return managed_txn_; }
    ::mdbx::txn* operator->() { return &managed_txn_; }
    operator ::mdbx::txn&() { return managed_txn_; }  // NOLINT(google-explicit-constructor)

    void abort() { managed_txn_.abort(); }

  protected:
    explicit ROTxn(::mdbx::txn_managed&& source) : managed_txn_{std::move(source)} {}

    ::mdbx::txn_managed managed_txn_;
};

//! \brief This class wraps a read-write transaction.
//! Anything not committed before destruction is aborted.
class RWTxn : public ROTxn {
  public:
    explicit RWTxn(::mdbx::env& env) : ROTxn{env.start_write()} {}
    RWTxn(RWTxn&& source) noexcept = default;

    void commit() { managed_txn_.commit(); }
};

//! \brief Reference to a processing function invoked by cursor_for_each & cursor_for_prefix on each record
using WalkFuncRef = absl::FunctionRef<void(std::string_view key, std::string_view value)>;

//! \brief Environment settings of the ledger database
struct EnvConfig {
    std::string path{};
    bool create{false};              // Whether db file must be created
    bool inmemory{false};            // Whether durability can be traded for speed (tests)
    size_t page_size{4 * kKibi};     // Mdbx page size
    size_t max_size{8 * kGibi};      // Mdbx max map size
    size_t growth_size{16 * kMebi};  // Increment size for each extension
    uint32_t max_tables{16};         // Default max number of named tables
    uint32_t max_readers{64};        // Default max number of readers
};

//! \brief Configuration settings for a "map" (aka a table)
struct MapConfig {
    const char* name{nullptr};                                        // Name of the table (is key in MAIN_DBI)
    const ::mdbx::key_mode key_mode{::mdbx::key_mode::usual};         // Key collation order
    const ::mdbx::value_mode value_mode{::mdbx::value_mode::single};  // Data Storage Mode
};

//! \brief Opens an mdbx environment using the provided environment config
//! \remarks Creates the environment directory and data file if config.create is set and none exist yet
::mdbx::env_managed open_env(const EnvConfig& config);

//! \brief Opens an mdbx "map" (aka table)
::mdbx::map_handle open_map(::mdbx::txn& tx, const MapConfig& config);

//! \brief Opens a cursor to an mdbx "map" (aka table)
::mdbx::cursor_managed open_cursor(::mdbx::txn& tx, const MapConfig& config);

//! \brief Checks whether a provided map name exists in database
bool has_map(::mdbx::txn& tx, const char* map_name);

//! \brief Builds the full path to mdbx datafile provided a directory
inline std::filesystem::path get_datafile_path(const std::filesystem::path& base_path) {
    return base_path / std::filesystem::path(kDbDataFileName);
}

inline ::mdbx::slice to_slice(std::string_view value) { return ::mdbx::slice{value.data(), value.length()}; }

inline std::string_view from_slice(const ::mdbx::slice& slice) {
    return {static_cast<const char*>(slice.data()), slice.length()};
}

//! \brief Executes a function on each record reachable by the provided cursor moving forward
//! \return The overall number of processed records
size_t cursor_for_each(::mdbx::cursor& cursor, WalkFuncRef walker);

//! \brief Executes a function on each record whose key starts with provided prefix, in key order
//! \return The overall number of processed records
size_t cursor_for_prefix(::mdbx::cursor& cursor, std::string_view prefix, WalkFuncRef walker);

}  // namespace ferry::db
