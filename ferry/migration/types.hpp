// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include <ferry/infra/common/unix_timestamp.hpp>

namespace ferry::migration {

using JobId = uint64_t;
using RecordId = uint64_t;

//! Maximum number of transfer attempts per file before it is permanently failed
inline constexpr uint32_t kMaxTransferAttempts{3};

//! Number of records fetched per batch when the request does not specify one
inline constexpr uint32_t kDefaultBatchSize{10};

//! \brief Kind of content a storage configuration holds
enum class StorageCategory {
    kThemes,
    kAssets,
    kFunctions,
    kPlugins,
    kApps,
};

//! \brief Storage backends a category can be migrated to
enum class StorageProvider {
    kLocal,
    kS3,
    kSsh,
    kSftp,
    kGcs,
    kAzure,
    kFtp,
    kCloudflareR2,
    kDigitalOceanSpaces,
    kMinio,
    kBackblazeB2,
    kWasabi,
    kLinode,
    kVultr,
    kBunnyStorage,
    kImageKit,
    kCloudinary,
    kImgix,
    kUploadcare,
    kKeyCdn,
    kStackPath,
    kFastly,
    kAkamai,
};

//! \brief MigrationJob state machine
//! Pending -> InProgress -> {Completed, Failed, Cancelled}, InProgress <-> Paused
enum class MigrationState {
    kPending,
    kInProgress,
    kPaused,
    kCompleted,
    kFailed,
    kCancelled,
};

enum class FileTransferState {
    kPending,
    kTransferring,
    kVerifying,
    kCompleted,
    kFailed,
    kSkipped,
};

std::string_view to_string(StorageCategory category);
std::string_view to_string(StorageProvider provider);
std::string_view to_string(MigrationState state);
std::string_view to_string(FileTransferState state);

//! \brief Parsers for the persisted (lowercase, kebab-case for providers) names
//! \return std::nullopt when the name is unknown
std::optional<StorageCategory> parse_storage_category(std::string_view name);
std::optional<StorageProvider> parse_storage_provider(std::string_view name);
std::optional<MigrationState> parse_migration_state(std::string_view name);
std::optional<FileTransferState> parse_file_transfer_state(std::string_view name);

const std::vector<StorageCategory>& all_storage_categories();
const std::vector<StorageProvider>& all_storage_providers();

//! \brief Whether no transition can leave this state
bool is_terminal(MigrationState state);

//! \brief One request to move a category of assets to a target provider
struct MigrationJob {
    JobId id{0};
    StorageCategory source_category{StorageCategory::kAssets};
    StorageProvider target_provider{StorageProvider::kLocal};
    nlohmann::json target_config = nlohmann::json::object();
    std::vector<std::string> asset_type_filter;
    bool update_references{false};
    MigrationState status{MigrationState::kPending};
    uint64_t total_files{0};
    uint64_t migrated_files{0};
    uint64_t failed_files{0};
    uint64_t total_bytes{0};
    uint64_t transferred_bytes{0};
    std::optional<std::string> current_file;
    TimePoint started_at{};
    std::optional<TimePoint> completed_at;
    bool can_resume{true};
    uint32_t batch_size{kDefaultBatchSize};
    std::optional<std::string> error;
};

//! \brief Unit of work and state for a single file within a job
struct FileTransferRecord {
    RecordId id{0};
    JobId migration_id{0};
    std::optional<std::string> media_id;
    std::string source_path;
    std::optional<std::string> target_path;
    uint64_t file_size{0};
    uint64_t bytes_transferred{0};
    FileTransferState status{FileTransferState::kPending};
    uint32_t attempt_count{0};
    std::optional<std::string> last_error;
    std::optional<TimePoint> started_at;
    std::optional<TimePoint> completed_at;

    //! \brief Whether the record is a candidate for the next transfer attempt
    bool is_eligible(uint32_t max_attempts = kMaxTransferAttempts) const {
        return (status == FileTransferState::kPending || status == FileTransferState::kFailed) &&
               attempt_count < max_attempts;
    }
};

//! \brief Latest progress snapshot of a job
struct Checkpoint {
    JobId migration_id{0};
    std::optional<RecordId> last_processed_file_id;
    uint64_t processed_count{0};
    uint64_t failed_count{0};
    uint64_t bytes_transferred{0};
    TimePoint timestamp{};
};

//! \brief Per-status record counts of a job, derived from the ledger
struct LedgerTally {
    uint64_t pending{0};
    uint64_t in_flight{0};  // Transferring or Verifying
    uint64_t completed{0};
    uint64_t failed{0};
    uint64_t skipped{0};
    uint64_t eligible{0};
    uint64_t transferred_bytes{0};
};

//! \brief Active storage backend of a content category
struct StorageConfiguration {
    StorageCategory category{StorageCategory::kAssets};
    StorageProvider provider{StorageProvider::kLocal};
    nlohmann::json config = nlohmann::json::object();
    bool is_active{true};
    TimePoint created_at{};
    TimePoint updated_at{};
};

void to_json(nlohmann::json& json, const MigrationJob& job);
void from_json(const nlohmann::json& json, MigrationJob& job);

void to_json(nlohmann::json& json, const FileTransferRecord& record);
void from_json(const nlohmann::json& json, FileTransferRecord& record);

void to_json(nlohmann::json& json, const Checkpoint& checkpoint);
void from_json(const nlohmann::json& json, Checkpoint& checkpoint);

void to_json(nlohmann::json& json, const StorageConfiguration& configuration);
void from_json(const nlohmann::json& json, StorageConfiguration& configuration);

}  // namespace ferry::migration
