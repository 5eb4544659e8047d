// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "provider_config.hpp"

#include <string>

#include <ferry/migration/error.hpp>

namespace ferry::migration {

const std::vector<std::string_view>& required_fields(StorageProvider provider) {
    static const std::vector<std::string_view> kNone{};
    static const std::vector<std::string_view> kLocalFields{"local_path"};
    static const std::vector<std::string_view> kS3Fields{"bucket", "access_key", "secret_key"};
    static const std::vector<std::string_view> kShellFields{"host", "username"};
    static const std::vector<std::string_view> kGcsFields{"bucket", "project_id"};
    static const std::vector<std::string_view> kAzureFields{"container", "connection_string"};
    static const std::vector<std::string_view> kBunnyFields{"storage_zone", "api_key"};
    static const std::vector<std::string_view> kCloudinaryFields{"cloud_name", "api_key", "api_secret"};
    static const std::vector<std::string_view> kImageKitFields{"api_key", "api_secret"};

    switch (provider) {
        case StorageProvider::kLocal:
            return kLocalFields;
        case StorageProvider::kS3:
        case StorageProvider::kCloudflareR2:
        case StorageProvider::kDigitalOceanSpaces:
        case StorageProvider::kMinio:
        case StorageProvider::kWasabi:
        case StorageProvider::kBackblazeB2:
        case StorageProvider::kLinode:
        case StorageProvider::kVultr:
            return kS3Fields;
        case StorageProvider::kSsh:
        case StorageProvider::kSftp:
        case StorageProvider::kFtp:
            return kShellFields;
        case StorageProvider::kGcs:
            return kGcsFields;
        case StorageProvider::kAzure:
            return kAzureFields;
        case StorageProvider::kBunnyStorage:
            return kBunnyFields;
        case StorageProvider::kCloudinary:
            return kCloudinaryFields;
        case StorageProvider::kImageKit:
            return kImageKitFields;
        default:
            return kNone;
    }
}

void validate_provider_config(StorageProvider provider, const nlohmann::json& config) {
    if (!config.is_object()) {
        throw MigrationError{ErrorCode::kMissingTargetField,
                             "Configuration of provider " + std::string{to_string(provider)} + " must be an object"};
    }
    for (const auto field : required_fields(provider)) {
        const auto it{config.find(std::string{field})};
        if (it == config.end() || !it->is_string() || it->get_ref<const std::string&>().empty()) {
            throw MigrationError{ErrorCode::kMissingTargetField,
                                 "Missing required field '" + std::string{field} + "' for provider " +
                                     std::string{to_string(provider)}};
        }
    }
}

}  // namespace ferry::migration
