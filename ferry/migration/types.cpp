// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "types.hpp"

#include <array>
#include <stdexcept>
#include <utility>

namespace ferry::migration {

namespace {

    template <typename E, size_t N>
    using NameTable = std::array<std::pair<E, std::string_view>, N>;

    constexpr NameTable<StorageCategory, 5> kCategoryNames{{
        {StorageCategory::kThemes, "themes"},
        {StorageCategory::kAssets, "assets"},
        {StorageCategory::kFunctions, "functions"},
        {StorageCategory::kPlugins, "plugins"},
        {StorageCategory::kApps, "apps"},
    }};

    constexpr NameTable<StorageProvider, 23> kProviderNames{{
        {StorageProvider::kLocal, "local"},
        {StorageProvider::kS3, "s3"},
        {StorageProvider::kSsh, "ssh"},
        {StorageProvider::kSftp, "sftp"},
        {StorageProvider::kGcs, "gcs"},
        {StorageProvider::kAzure, "azure"},
        {StorageProvider::kFtp, "ftp"},
        {StorageProvider::kCloudflareR2, "cloudflare-r2"},
        {StorageProvider::kDigitalOceanSpaces, "digitalocean-spaces"},
        {StorageProvider::kMinio, "minio"},
        {StorageProvider::kBackblazeB2, "backblaze-b2"},
        {StorageProvider::kWasabi, "wasabi"},
        {StorageProvider::kLinode, "linode"},
        {StorageProvider::kVultr, "vultr"},
        {StorageProvider::kBunnyStorage, "bunny-storage"},
        {StorageProvider::kImageKit, "imagekit"},
        {StorageProvider::kCloudinary, "cloudinary"},
        {StorageProvider::kImgix, "imgix"},
        {StorageProvider::kUploadcare, "uploadcare"},
        {StorageProvider::kKeyCdn, "keycdn"},
        {StorageProvider::kStackPath, "stackpath"},
        {StorageProvider::kFastly, "fastly"},
        {StorageProvider::kAkamai, "akamai"},
    }};

    constexpr NameTable<MigrationState, 6> kMigrationStateNames{{
        {MigrationState::kPending, "pending"},
        {MigrationState::kInProgress, "in_progress"},
        {MigrationState::kPaused, "paused"},
        {MigrationState::kCompleted, "completed"},
        {MigrationState::kFailed, "failed"},
        {MigrationState::kCancelled, "cancelled"},
    }};

    constexpr NameTable<FileTransferState, 6> kFileTransferStateNames{{
        {FileTransferState::kPending, "pending"},
        {FileTransferState::kTransferring, "transferring"},
        {FileTransferState::kVerifying, "verifying"},
        {FileTransferState::kCompleted, "completed"},
        {FileTransferState::kFailed, "failed"},
        {FileTransferState::kSkipped, "skipped"},
    }};

    template <typename E, size_t N>
    std::string_view name_of(const NameTable<E, N>& table, E value) {
        for (const auto& [entry, name] : table) {
            if (entry == value) return name;
        }
        return "unknown";
    }

    template <typename E, size_t N>
    std::optional<E> value_of(const NameTable<E, N>& table, std::string_view name) {
        for (const auto& [entry, entry_name] : table) {
            if (entry_name == name) return entry;
        }
        return std::nullopt;
    }

    template <typename E, size_t N>
    std::vector<E> values_of(const NameTable<E, N>& table) {
        std::vector<E> values;
        values.reserve(N);
        for (const auto& entry : table) {
            values.push_back(entry.first);
        }
        return values;
    }

    template <typename E>
    E required_enum(const nlohmann::json& json, const char* key, std::optional<E> (*parse)(std::string_view)) {
        const auto name{json.at(key).get<std::string>()};
        const auto value{parse(name)};
        if (!value) {
            throw std::invalid_argument(std::string{"Unknown "} + key + " value: " + name);
        }
        return *value;
    }

    void put_time(nlohmann::json& json, const char* key, const std::optional<TimePoint>& time) {
        json[key] = time ? nlohmann::json(format_rfc3339(*time)) : nlohmann::json(nullptr);
    }

    std::optional<TimePoint> get_time(const nlohmann::json& json, const char* key) {
        if (!json.contains(key) || json.at(key).is_null()) return std::nullopt;
        return parse_rfc3339(json.at(key).get<std::string>());
    }

    void put_string(nlohmann::json& json, const char* key, const std::optional<std::string>& value) {
        json[key] = value ? nlohmann::json(*value) : nlohmann::json(nullptr);
    }

    std::optional<std::string> get_string(const nlohmann::json& json, const char* key) {
        if (!json.contains(key) || json.at(key).is_null()) return std::nullopt;
        return json.at(key).get<std::string>();
    }

}  // namespace

std::string_view to_string(StorageCategory category) { return name_of(kCategoryNames, category); }
std::string_view to_string(StorageProvider provider) { return name_of(kProviderNames, provider); }
std::string_view to_string(MigrationState state) { return name_of(kMigrationStateNames, state); }
std::string_view to_string(FileTransferState state) { return name_of(kFileTransferStateNames, state); }

std::optional<StorageCategory> parse_storage_category(std::string_view name) {
    return value_of(kCategoryNames, name);
}

std::optional<StorageProvider> parse_storage_provider(std::string_view name) {
    return value_of(kProviderNames, name);
}

std::optional<MigrationState> parse_migration_state(std::string_view name) {
    return value_of(kMigrationStateNames, name);
}

std::optional<FileTransferState> parse_file_transfer_state(std::string_view name) {
    return value_of(kFileTransferStateNames, name);
}

const std::vector<StorageCategory>& all_storage_categories() {
    static const std::vector<StorageCategory> kAll{values_of(kCategoryNames)};
    return kAll;
}

const std::vector<StorageProvider>& all_storage_providers() {
    static const std::vector<StorageProvider> kAll{values_of(kProviderNames)};
    return kAll;
}

bool is_terminal(MigrationState state) {
    return state == MigrationState::kCompleted || state == MigrationState::kFailed ||
           state == MigrationState::kCancelled;
}

void to_json(nlohmann::json& json, const MigrationJob& job) {
    json = nlohmann::json{
        {"id", job.id},
        {"source_category", std::string{to_string(job.source_category)}},
        {"target_provider", std::string{to_string(job.target_provider)}},
        {"target_config", job.target_config},
        {"asset_type_filter", job.asset_type_filter},
        {"update_references", job.update_references},
        {"status", std::string{to_string(job.status)}},
        {"total_files", job.total_files},
        {"migrated_files", job.migrated_files},
        {"failed_files", job.failed_files},
        {"total_bytes", job.total_bytes},
        {"transferred_bytes", job.transferred_bytes},
        {"started_at", format_rfc3339(job.started_at)},
        {"can_resume", job.can_resume},
        {"batch_size", job.batch_size},
    };
    put_string(json, "current_file", job.current_file);
    put_time(json, "completed_at", job.completed_at);
    put_string(json, "error", job.error);
}

void from_json(const nlohmann::json& json, MigrationJob& job) {
    job.id = json.at("id").get<JobId>();
    job.source_category = required_enum<StorageCategory>(json, "source_category", parse_storage_category);
    job.target_provider = required_enum<StorageProvider>(json, "target_provider", parse_storage_provider);
    job.target_config = json.at("target_config");
    job.asset_type_filter = json.at("asset_type_filter").get<std::vector<std::string>>();
    job.update_references = json.at("update_references").get<bool>();
    job.status = required_enum<MigrationState>(json, "status", parse_migration_state);
    job.total_files = json.at("total_files").get<uint64_t>();
    job.migrated_files = json.at("migrated_files").get<uint64_t>();
    job.failed_files = json.at("failed_files").get<uint64_t>();
    job.total_bytes = json.at("total_bytes").get<uint64_t>();
    job.transferred_bytes = json.at("transferred_bytes").get<uint64_t>();
    job.current_file = get_string(json, "current_file");
    job.started_at = parse_rfc3339(json.at("started_at").get<std::string>());
    job.completed_at = get_time(json, "completed_at");
    job.can_resume = json.at("can_resume").get<bool>();
    job.batch_size = json.at("batch_size").get<uint32_t>();
    job.error = get_string(json, "error");
}

void to_json(nlohmann::json& json, const FileTransferRecord& record) {
    json = nlohmann::json{
        {"id", record.id},
        {"migration_id", record.migration_id},
        {"source_path", record.source_path},
        {"file_size", record.file_size},
        {"bytes_transferred", record.bytes_transferred},
        {"status", std::string{to_string(record.status)}},
        {"attempt_count", record.attempt_count},
    };
    put_string(json, "media_id", record.media_id);
    put_string(json, "target_path", record.target_path);
    put_string(json, "last_error", record.last_error);
    put_time(json, "started_at", record.started_at);
    put_time(json, "completed_at", record.completed_at);
}

void from_json(const nlohmann::json& json, FileTransferRecord& record) {
    record.id = json.at("id").get<RecordId>();
    record.migration_id = json.at("migration_id").get<JobId>();
    record.media_id = get_string(json, "media_id");
    record.source_path = json.at("source_path").get<std::string>();
    record.target_path = get_string(json, "target_path");
    record.file_size = json.at("file_size").get<uint64_t>();
    record.bytes_transferred = json.at("bytes_transferred").get<uint64_t>();
    record.status = required_enum<FileTransferState>(json, "status", parse_file_transfer_state);
    record.attempt_count = json.at("attempt_count").get<uint32_t>();
    record.last_error = get_string(json, "last_error");
    record.started_at = get_time(json, "started_at");
    record.completed_at = get_time(json, "completed_at");
}

void to_json(nlohmann::json& json, const Checkpoint& checkpoint) {
    json = nlohmann::json{
        {"migration_id", checkpoint.migration_id},
        {"processed_count", checkpoint.processed_count},
        {"failed_count", checkpoint.failed_count},
        {"bytes_transferred", checkpoint.bytes_transferred},
        {"timestamp", format_rfc3339(checkpoint.timestamp)},
    };
    json["last_processed_file_id"] = checkpoint.last_processed_file_id
                                         ? nlohmann::json(*checkpoint.last_processed_file_id)
                                         : nlohmann::json(nullptr);
}

void from_json(const nlohmann::json& json, Checkpoint& checkpoint) {
    checkpoint.migration_id = json.at("migration_id").get<JobId>();
    const auto& last{json.at("last_processed_file_id")};
    checkpoint.last_processed_file_id = last.is_null() ? std::nullopt : std::optional<RecordId>{last.get<RecordId>()};
    checkpoint.processed_count = json.at("processed_count").get<uint64_t>();
    checkpoint.failed_count = json.at("failed_count").get<uint64_t>();
    checkpoint.bytes_transferred = json.at("bytes_transferred").get<uint64_t>();
    checkpoint.timestamp = parse_rfc3339(json.at("timestamp").get<std::string>());
}

void to_json(nlohmann::json& json, const StorageConfiguration& configuration) {
    json = nlohmann::json{
        {"category", std::string{to_string(configuration.category)}},
        {"provider", std::string{to_string(configuration.provider)}},
        {"config", configuration.config},
        {"is_active", configuration.is_active},
        {"created_at", format_rfc3339(configuration.created_at)},
        {"updated_at", format_rfc3339(configuration.updated_at)},
    };
}

void from_json(const nlohmann::json& json, StorageConfiguration& configuration) {
    configuration.category = required_enum<StorageCategory>(json, "category", parse_storage_category);
    configuration.provider = required_enum<StorageProvider>(json, "provider", parse_storage_provider);
    configuration.config = json.at("config");
    configuration.is_active = json.at("is_active").get<bool>();
    configuration.created_at = parse_rfc3339(json.at("created_at").get<std::string>());
    configuration.updated_at = parse_rfc3339(json.at("updated_at").get<std::string>());
}

}  // namespace ferry::migration
