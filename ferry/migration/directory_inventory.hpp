// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>
#include <string>

#include <ferry/migration/file_inventory.hpp>

namespace ferry::migration {

//! \brief Inventory of a local storage: every regular file below the configured local_path
class DirectoryInventory : public FileInventory {
  public:
    std::vector<InventoryEntry> list(const StorageConfiguration& source, const AssetTypeFilter& filter) override;

    //! \brief MIME type guessed from the file extension, application/octet-stream when unknown
    static std::string mime_type_for(const std::filesystem::path& path);
};

}  // namespace ferry::migration
