// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "local_transport.hpp"

#include <system_error>
#include <utility>

#include <ferry/migration/error.hpp>

namespace ferry::migration {

namespace fs = std::filesystem;

//! Rejects absolute paths and paths escaping their root through ".."
static fs::path checked_relative_path(const std::string& source_path) {
    const fs::path relative{fs::path{source_path}.lexically_normal()};
    if (source_path.empty() || relative.is_absolute() || relative.has_root_name()) {
        throw TransferError{"Invalid source path: '" + source_path + "'"};
    }
    for (const auto& part : relative) {
        if (part == "..") {
            throw TransferError{"Source path escapes storage root: '" + source_path + "'"};
        }
    }
    return relative;
}

LocalTransport::LocalTransport(fs::path source_root, fs::path target_root)
    : source_root_{std::move(source_root)}, target_root_{std::move(target_root)} {}

std::unique_ptr<Transport> LocalTransport::from_configs(const StorageConfiguration& source,
                                                       const nlohmann::json& target_config) {
    if (source.provider != StorageProvider::kLocal) {
        throw MigrationError{ErrorCode::kUnsupportedProvider,
                             "Local transport cannot read from provider " + std::string{to_string(source.provider)}};
    }
    const auto source_root{source.config.value("local_path", std::string{})};
    const auto target_root{target_config.value("local_path", std::string{})};
    if (source_root.empty() || target_root.empty()) {
        throw MigrationError{ErrorCode::kMissingTargetField, "Local transport requires 'local_path' on both ends"};
    }
    return std::make_unique<LocalTransport>(source_root, target_root);
}

std::string LocalTransport::transfer(const std::string& source_path) {
    const fs::path relative{checked_relative_path(source_path)};
    const fs::path source{source_root_ / relative};
    const fs::path target{target_root_ / relative};

    std::error_code ec;
    if (!fs::is_regular_file(source, ec)) {
        throw TransferError{"Source file not found: " + source.string()};
    }
    const auto source_size{fs::file_size(source, ec)};
    if (ec) {
        throw TransferError{"Cannot stat " + source.string() + ": " + ec.message()};
    }
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
        throw TransferError{"Cannot create " + target.parent_path().string() + ": " + ec.message()};
    }
    fs::copy_file(source, target, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        throw TransferError{"Cannot copy " + source.string() + " to " + target.string() + ": " + ec.message()};
    }
    const auto target_size{fs::file_size(target, ec)};
    if (ec || target_size != source_size) {
        throw TransferError{"Size mismatch after copying " + source.string() + ": expected " +
                            std::to_string(source_size) + " got " + std::to_string(ec ? 0 : target_size)};
    }
    return target.string();
}

}  // namespace ferry::migration
