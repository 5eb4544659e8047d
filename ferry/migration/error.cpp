// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "error.hpp"

#include <utility>

#include <magic_enum.hpp>

namespace ferry::migration {

MigrationError::MigrationError(ErrorCode code)
    : code_{code}, message_{std::string(magic_enum::enum_name<ErrorCode>(code))} {}

MigrationError::MigrationError(ErrorCode code, std::string message) : code_{code}, message_{std::move(message)} {}

std::string MigrationError::code_name() const { return std::string(magic_enum::enum_name<ErrorCode>(code_)); }

}  // namespace ferry::migration
