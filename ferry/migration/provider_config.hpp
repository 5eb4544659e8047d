// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include <ferry/migration/types.hpp>

namespace ferry::migration {

//! \brief Fields a provider configuration blob must carry as non-empty strings
const std::vector<std::string_view>& required_fields(StorageProvider provider);

//! \brief Structural validation of a provider configuration (no connectivity check)
//! \throws MigrationError with kMissingTargetField naming the first missing field
void validate_provider_config(StorageProvider provider, const nlohmann::json& config);

}  // namespace ferry::migration
