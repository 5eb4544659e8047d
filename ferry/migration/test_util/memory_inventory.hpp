// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

#include <ferry/migration/file_inventory.hpp>

namespace ferry::migration::test_util {

//! \brief Inventory over a fixed list of entries
class MemoryInventory : public FileInventory {
  public:
    explicit MemoryInventory(std::vector<InventoryEntry> entries) : entries_{std::move(entries)} {}

    std::vector<InventoryEntry> list(const StorageConfiguration&, const AssetTypeFilter& filter) override {
        std::vector<InventoryEntry> matching;
        for (const auto& entry : entries_) {
            if (filter.matches(entry.mime_type)) matching.push_back(entry);
        }
        return matching;
    }

  private:
    std::vector<InventoryEntry> entries_;
};

//! \brief count image entries named file-001.png, file-002.png, ... with sizes 100, 200, ...
inline std::vector<InventoryEntry> make_entries(size_t count) {
    std::vector<InventoryEntry> entries;
    for (size_t i{1}; i <= count; ++i) {
        std::string name{std::to_string(i)};
        name.insert(0, 3 - std::min<size_t>(3, name.size()), '0');
        entries.push_back(InventoryEntry{
            .media_id = "media-" + std::to_string(i),
            .path = "file-" + name + ".png",
            .size = 100 * i,
            .mime_type = "image/png",
        });
    }
    return entries;
}

}  // namespace ferry::migration::test_util
