// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <ferry/migration/asset_filter.hpp>
#include <ferry/migration/types.hpp>

namespace ferry::migration {

//! \brief One candidate asset of a storage category
struct InventoryEntry {
    std::optional<std::string> media_id;  // Back-reference to the asset catalog, if any
    std::string path;                     // Relative to the storage root
    uint64_t size{0};
    std::string mime_type;
};

//! \brief Enumerates the assets of a storage category
class FileInventory {
  public:
    virtual ~FileInventory() = default;

    //! \brief Finite snapshot of the assets stored under source matching filter, in a stable order
    virtual std::vector<InventoryEntry> list(const StorageConfiguration& source, const AssetTypeFilter& filter) = 0;
};

}  // namespace ferry::migration
