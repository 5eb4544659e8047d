// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "provider_config.hpp"

#include <catch2/catch_test_macros.hpp>

#include <ferry/migration/error.hpp>

namespace ferry::migration {

static ErrorCode validation_error(StorageProvider provider, const nlohmann::json& config) {
    try {
        validate_provider_config(provider, config);
    } catch (const MigrationError& ex) {
        return ex.code();
    }
    FAIL("validation unexpectedly passed");
    return ErrorCode::kLedgerError;
}

TEST_CASE("required fields per provider", "[ferry][migration][provider]") {
    CHECK(required_fields(StorageProvider::kLocal).size() == 1);
    CHECK(required_fields(StorageProvider::kMinio).size() == 3);
    CHECK(required_fields(StorageProvider::kSftp).size() == 2);
    CHECK(required_fields(StorageProvider::kCloudinary).size() == 3);
    CHECK(required_fields(StorageProvider::kFastly).empty());
    CHECK(required_fields(StorageProvider::kImgix).empty());
}

TEST_CASE("validate_provider_config", "[ferry][migration][provider]") {
    SECTION("complete") {
        CHECK_NOTHROW(validate_provider_config(StorageProvider::kLocal, {{"local_path", "/srv/assets"}}));
        CHECK_NOTHROW(validate_provider_config(StorageProvider::kGcs, {{"bucket", "b"}, {"project_id", "p"}}));
        CHECK_NOTHROW(validate_provider_config(StorageProvider::kAkamai, nlohmann::json::object()));
    }
    SECTION("missing field") {
        CHECK(validation_error(StorageProvider::kS3, {{"bucket", "b"}, {"access_key", "a"}}) ==
              ErrorCode::kMissingTargetField);
        CHECK(validation_error(StorageProvider::kAzure, {{"container", "c"}}) == ErrorCode::kMissingTargetField);
    }
    SECTION("empty or non-string field") {
        CHECK(validation_error(StorageProvider::kLocal, {{"local_path", ""}}) == ErrorCode::kMissingTargetField);
        CHECK(validation_error(StorageProvider::kSsh, {{"host", "h"}, {"username", 5}}) ==
              ErrorCode::kMissingTargetField);
    }
    SECTION("not an object") {
        CHECK(validation_error(StorageProvider::kFastly, nlohmann::json::array()) == ErrorCode::kMissingTargetField);
    }
}

}  // namespace ferry::migration
