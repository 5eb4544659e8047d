// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "types.hpp"

#include <catch2/catch_test_macros.hpp>

namespace ferry::migration {

TEST_CASE("enum names", "[ferry][migration][types]") {
    CHECK(to_string(StorageCategory::kThemes) == "themes");
    CHECK(to_string(StorageProvider::kDigitalOceanSpaces) == "digitalocean-spaces");
    CHECK(to_string(MigrationState::kInProgress) == "in_progress");
    CHECK(to_string(FileTransferState::kVerifying) == "verifying");

    for (const auto category : all_storage_categories()) {
        CHECK(parse_storage_category(to_string(category)) == category);
    }
    for (const auto provider : all_storage_providers()) {
        CHECK(parse_storage_provider(to_string(provider)) == provider);
    }
    CHECK(all_storage_providers().size() == 23);
    CHECK_FALSE(parse_storage_provider("dropbox"));
    CHECK_FALSE(parse_migration_state("In_Progress"));
}

TEST_CASE("terminal states", "[ferry][migration][types]") {
    CHECK(is_terminal(MigrationState::kCompleted));
    CHECK(is_terminal(MigrationState::kFailed));
    CHECK(is_terminal(MigrationState::kCancelled));
    CHECK_FALSE(is_terminal(MigrationState::kPending));
    CHECK_FALSE(is_terminal(MigrationState::kInProgress));
    CHECK_FALSE(is_terminal(MigrationState::kPaused));
}

TEST_CASE("record eligibility", "[ferry][migration][types]") {
    FileTransferRecord record;
    CHECK(record.is_eligible());

    record.status = FileTransferState::kFailed;
    record.attempt_count = 2;
    CHECK(record.is_eligible());
    record.attempt_count = 3;
    CHECK_FALSE(record.is_eligible());
    CHECK(record.is_eligible(4));

    record.attempt_count = 1;
    record.status = FileTransferState::kTransferring;
    CHECK_FALSE(record.is_eligible());
    record.status = FileTransferState::kCompleted;
    CHECK_FALSE(record.is_eligible());
    record.status = FileTransferState::kSkipped;
    CHECK_FALSE(record.is_eligible());
}

TEST_CASE("MigrationJob json", "[ferry][migration][types]") {
    MigrationJob job{
        .id = 7,
        .source_category = StorageCategory::kPlugins,
        .target_provider = StorageProvider::kS3,
        .target_config = {{"bucket", "b"}, {"access_key", "a"}, {"secret_key", "s"}},
        .asset_type_filter = {"images"},
        .status = MigrationState::kPaused,
        .total_files = 3,
        .migrated_files = 1,
        .current_file = "a/b.png",
        .started_at = time_point_from_unix_timestamp(1700000000),
    };

    const nlohmann::json json = job;
    CHECK(json["status"] == "paused");
    CHECK(json["target_provider"] == "s3");
    CHECK(json["started_at"] == "2023-11-14T22:13:20Z");
    CHECK(json["completed_at"].is_null());
    CHECK(json["error"].is_null());

    const auto decoded{json.get<MigrationJob>()};
    CHECK(decoded.id == 7);
    CHECK(decoded.source_category == StorageCategory::kPlugins);
    CHECK(decoded.target_config == job.target_config);
    CHECK(decoded.current_file == "a/b.png");
    CHECK(decoded.started_at == job.started_at);
    CHECK_FALSE(decoded.completed_at);

    SECTION("unknown enum name") {
        auto corrupt{json};
        corrupt["status"] = "exploded";
        CHECK_THROWS_AS(corrupt.get<MigrationJob>(), std::invalid_argument);
    }
}

TEST_CASE("FileTransferRecord json", "[ferry][migration][types]") {
    FileTransferRecord record{
        .id = 11,
        .migration_id = 2,
        .source_path = "docs/readme.txt",
        .file_size = 42,
        .status = FileTransferState::kFailed,
        .attempt_count = 2,
        .last_error = "timeout",
        .started_at = time_point_from_unix_timestamp(1700000000),
    };
    const nlohmann::json json = record;
    CHECK(json["media_id"].is_null());
    CHECK(json["last_error"] == "timeout");

    const auto decoded{json.get<FileTransferRecord>()};
    CHECK(decoded.status == FileTransferState::kFailed);
    CHECK(decoded.attempt_count == 2);
    CHECK_FALSE(decoded.media_id);
    CHECK_FALSE(decoded.target_path);
    CHECK(decoded.started_at == record.started_at);
}

}  // namespace ferry::migration
