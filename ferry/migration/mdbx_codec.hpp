// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <nlohmann/json.hpp>

#include <ferry/db/kvdb/mdbx.hpp>
#include <ferry/migration/error.hpp>

namespace ferry::migration::detail {

//! \brief Serializes a ledger value
template <typename T>
std::string encode_value(const T& value) {
    return nlohmann::json(value).dump();
}

//! \brief Deserializes a ledger value
//! \throws MigrationError with kLedgerError when the stored value is corrupt
template <typename T>
T decode_value(std::string_view data) {
    try {
        return nlohmann::json::parse(data).get<T>();
    } catch (const nlohmann::json::exception& ex) {
        throw MigrationError{ErrorCode::kLedgerError, std::string{"Corrupt ledger value: "} + ex.what()};
    } catch (const std::invalid_argument& ex) {
        throw MigrationError{ErrorCode::kLedgerError, std::string{"Corrupt ledger value: "} + ex.what()};
    }
}

//! \brief Runs a storage operation translating storage engine failures into MigrationError{kLedgerError}
template <typename F>
auto with_ledger_errors(std::string_view operation, F&& func) -> decltype(func()) {
    try {
        return std::forward<F>(func)();
    } catch (const ::mdbx::exception& ex) {
        throw MigrationError{ErrorCode::kLedgerError, std::string{operation} + " failed: " + ex.what()};
    } catch (const std::length_error& ex) {
        throw MigrationError{ErrorCode::kLedgerError, std::string{operation} + " failed: " + ex.what()};
    }
}

}  // namespace ferry::migration::detail
