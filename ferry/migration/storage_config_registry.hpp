// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>
#include <optional>
#include <vector>

#include <nlohmann/json.hpp>

#include <ferry/db/kvdb/mdbx.hpp>
#include <ferry/migration/types.hpp>

namespace ferry::migration {

//! \brief Active storage configuration of each category, kept in the StorageConfigurations table
class StorageConfigRegistry {
  public:
    explicit StorageConfigRegistry(::mdbx::env& env) : env_{env} {}

    std::vector<StorageConfiguration> list();
    std::optional<StorageConfiguration> find(StorageCategory category);

    //! \brief Stores the configuration of category after structural validation
    //! \throws MigrationError with kMissingTargetField on an invalid config
    StorageConfiguration upsert(StorageCategory category, StorageProvider provider, const nlohmann::json& config);

    //! \brief Returns the configuration of category, creating a local one rooted at <root>/<category> if missing
    StorageConfiguration get_or_create_default(StorageCategory category, const std::filesystem::path& root);

  private:
    ::mdbx::env& env_;
};

}  // namespace ferry::migration
