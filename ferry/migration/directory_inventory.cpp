// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "directory_inventory.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <system_error>

#include <ferry/infra/common/log.hpp>
#include <ferry/migration/error.hpp>

namespace ferry::migration {

namespace fs = std::filesystem;

std::string DirectoryInventory::mime_type_for(const fs::path& path) {
    static const std::map<std::string, std::string, std::less<>> kMimeTypes{
        {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".png", "image/png"},
        {".gif", "image/gif"},
        {".webp", "image/webp"},
        {".svg", "image/svg+xml"},
        {".avif", "image/avif"},
        {".ico", "image/x-icon"},
        {".mp4", "video/mp4"},
        {".webm", "video/webm"},
        {".mov", "video/quicktime"},
        {".mkv", "video/x-matroska"},
        {".mp3", "audio/mpeg"},
        {".wav", "audio/wav"},
        {".pdf", "application/pdf"},
        {".doc", "application/msword"},
        {".docx", "application/vnd.openxmlformats-officedocument.wordprocessingml.document"},
        {".odt", "application/vnd.oasis.opendocument.text"},
        {".txt", "text/plain"},
        {".md", "text/markdown"},
        {".csv", "text/csv"},
        {".html", "text/html"},
        {".css", "text/css"},
        {".js", "text/javascript"},
        {".json", "application/json"},
        {".zip", "application/zip"},
        {".wasm", "application/wasm"},
    };
    std::string extension{path.extension().string()};
    std::ranges::transform(extension, extension.begin(), [](unsigned char c) { return std::tolower(c); });
    const auto it{kMimeTypes.find(extension)};
    return it != kMimeTypes.end() ? it->second : "application/octet-stream";
}

std::vector<InventoryEntry> DirectoryInventory::list(const StorageConfiguration& source,
                                                     const AssetTypeFilter& filter) {
    if (source.provider != StorageProvider::kLocal) {
        throw MigrationError{ErrorCode::kUnsupportedProvider,
                             "Cannot enumerate files of provider " + std::string{to_string(source.provider)}};
    }
    const fs::path root{source.config.value("local_path", std::string{})};
    std::vector<InventoryEntry> entries;
    std::error_code ec;
    if (root.empty() || !fs::is_directory(root, ec)) {
        FERRY_WARN_M("Inventory root not found", {"category", std::string{to_string(source.category)},
                                                  "root", root.string()});
        return entries;
    }

    for (auto it{fs::recursive_directory_iterator(root, fs::directory_options::skip_permission_denied)};
         it != fs::recursive_directory_iterator(); ++it) {
        if (!it->is_regular_file()) continue;
        const fs::path& path{it->path()};
        auto mime_type{mime_type_for(path)};
        if (!filter.matches(mime_type)) continue;
        entries.push_back(InventoryEntry{
            .media_id = std::nullopt,
            .path = path.lexically_relative(root).generic_string(),
            .size = it->file_size(),
            .mime_type = std::move(mime_type),
        });
    }
    std::ranges::sort(entries, {}, &InventoryEntry::path);
    FERRY_DEBUG_M("Inventory listed", {"category", std::string{to_string(source.category)},
                                       "files", std::to_string(entries.size())});
    return entries;
}

}  // namespace ferry::migration
