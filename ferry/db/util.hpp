// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/*
Key encoding helpers and sequence counters for the ledger tables.
All integers are stored big-endian so that lexicographic key order matches numeric order.
*/

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include <ferry/db/kvdb/mdbx.hpp>

namespace ferry::db {

inline constexpr size_t kJobKeySize{sizeof(uint64_t)};
inline constexpr size_t kRecordKeySize{2 * sizeof(uint64_t)};

//! \brief Encodes an unsigned integer into its 8 bytes big-endian form
std::string encode_u64(uint64_t value);

//! \brief Decodes an 8 bytes big-endian unsigned integer
//! \throws std::length_error when input is not exactly 8 bytes long
uint64_t decode_u64(std::string_view data);

//! \brief Key of a job in Migrations and Checkpoints tables, and prefix of its records in TransferRecords
inline std::string job_key(uint64_t job_id) { return encode_u64(job_id); }

//! \brief Key of a record in TransferRecords table
std::string record_key(uint64_t job_id, uint64_t record_id);

//! \brief Splits a TransferRecords key into job id and record id
std::pair<uint64_t, uint64_t> split_record_key(std::string_view key);

//! \brief Reads current value of sequence for a given map name
uint64_t read_map_sequence(::mdbx::txn& txn, const char* map_name);

//! \brief Increments the sequence value for a given map name and returns the value before increment
uint64_t increment_map_sequence(::mdbx::txn& txn, const char* map_name, uint64_t increment = 1u);

}  // namespace ferry::db
