// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "util.hpp"

#include <stdexcept>

#include <boost/endian/conversion.hpp>

#include <ferry/db/tables.hpp>

namespace ferry::db {

std::string encode_u64(uint64_t value) {
    std::string data(sizeof(uint64_t), '\0');
    boost::endian::store_big_u64(reinterpret_cast<unsigned char*>(data.data()), value);
    return data;
}

uint64_t decode_u64(std::string_view data) {
    if (data.length() != sizeof(uint64_t)) {
        throw std::length_error("Bad big-endian u64 length: " + std::to_string(data.length()));
    }
    return boost::endian::load_big_u64(reinterpret_cast<const unsigned char*>(data.data()));
}

std::string record_key(uint64_t job_id, uint64_t record_id) {
    std::string key{encode_u64(job_id)};
    key.append(encode_u64(record_id));
    return key;
}

std::pair<uint64_t, uint64_t> split_record_key(std::string_view key) {
    if (key.length() != kRecordKeySize) {
        throw std::length_error("Bad transfer record key length: " + std::to_string(key.length()));
    }
    return {decode_u64(key.substr(0, kJobKeySize)), decode_u64(key.substr(kJobKeySize))};
}

uint64_t read_map_sequence(::mdbx::txn& txn, const char* map_name) {
    auto sequence_map{open_map(txn, table::kSequence)};
    const auto data{txn.get(sequence_map, ::mdbx::slice{map_name}, ::mdbx::slice{})};
    if (data.empty()) {
        return 0;
    }
    if (data.length() != sizeof(uint64_t)) {
        throw std::length_error("Bad sequence value in db");
    }
    return decode_u64(from_slice(data));
}

uint64_t increment_map_sequence(::mdbx::txn& txn, const char* map_name, uint64_t increment) {
    uint64_t current_value{read_map_sequence(txn, map_name)};
    if (increment) {
        auto sequence_map{open_map(txn, table::kSequence)};
        const std::string new_data{encode_u64(current_value + increment)};
        txn.upsert(sequence_map, ::mdbx::slice{map_name}, to_slice(new_data));
    }
    return current_value;
}

}  // namespace ferry::db
