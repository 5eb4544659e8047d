// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "mdbx.hpp"

#include <map>
#include <string>
#include <vector>

#include <catch2/catch_test_macros.hpp>

#include <ferry/infra/common/directories.hpp>

namespace ferry::db {

static const std::map<std::string, std::string> kMimeTypes{
    {"images/a.jpg", "image/jpeg"},
    {"images/b.png", "image/png"},
    {"images/c.gif", "image/gif"},
    {"videos/a.mp4", "video/mp4"},
    {"videos/b.webm", "video/webm"},
    {"docs/a.pdf", "application/pdf"},
};

static void populate(::mdbx::env& env, const MapConfig& config) {
    RWTxn txn{env};
    auto map{open_map(*txn, config)};
    for (const auto& [key, value] : kMimeTypes) {
        txn->upsert(map, to_slice(key), to_slice(value));
    }
    txn.commit();
}

TEST_CASE("open_env", "[ferry][db][mdbx]") {
    const TemporaryDirectory tmp_dir;

    SECTION("Empty path") {
        EnvConfig db_config{};
        CHECK_THROWS_AS(open_env(db_config), std::invalid_argument);
    }

    SECTION("Missing data file without create") {
        EnvConfig db_config{.path = tmp_dir.path().string()};
        CHECK_THROWS_AS(open_env(db_config), std::runtime_error);
    }

    SECTION("Create then reopen") {
        EnvConfig db_config{.path = (tmp_dir.path() / "ledger").string(), .create = true};
        {
            auto env{open_env(db_config)};
            populate(env, {"MimeTypes"});
        }
        CHECK(std::filesystem::exists(get_datafile_path(tmp_dir.path() / "ledger")));
        db_config.create = false;
        auto env{open_env(db_config)};
        ROTxn txn{env};
        CHECK(has_map(*txn, "MimeTypes"));
        CHECK_FALSE(has_map(*txn, "Missing"));
    }
}

TEST_CASE("cursor_for_each and cursor_for_prefix", "[ferry][db][mdbx]") {
    const TemporaryDirectory tmp_dir;
    EnvConfig db_config{.path = tmp_dir.path().string(), .create = true, .inmemory = true};
    auto env{open_env(db_config)};
    const MapConfig map_config{"MimeTypes"};
    populate(env, map_config);

    ROTxn txn{env};
    auto cursor{open_cursor(*txn, map_config)};

    SECTION("each walks all records in key order") {
        std::vector<std::string> keys;
        const auto count{cursor_for_each(cursor, [&](std::string_view key, std::string_view) {
            keys.emplace_back(key);
        })};
        CHECK(count == kMimeTypes.size());
        CHECK(keys.front() == "docs/a.pdf");
        CHECK(keys.back() == "videos/b.webm");
    }

    SECTION("prefix visits only matching keys") {
        std::vector<std::string> values;
        const auto count{cursor_for_prefix(cursor, "images/", [&](std::string_view, std::string_view value) {
            values.emplace_back(value);
        })};
        CHECK(count == 3);
        CHECK(values == std::vector<std::string>{"image/jpeg", "image/png", "image/gif"});
    }

    SECTION("prefix without matches") {
        const auto count{cursor_for_prefix(cursor, "audio/", [](std::string_view, std::string_view) {})};
        CHECK(count == 0);
    }
}

TEST_CASE("RWTxn aborts uncommitted changes", "[ferry][db][mdbx]") {
    const TemporaryDirectory tmp_dir;
    EnvConfig db_config{.path = tmp_dir.path().string(), .create = true, .inmemory = true};
    auto env{open_env(db_config)};
    const MapConfig map_config{"MimeTypes"};
    populate(env, map_config);

    {
        RWTxn txn{env};
        auto map{open_map(*txn, map_config)};
        txn->upsert(map, to_slice("audio/a.mp3"), to_slice("audio/mpeg"));
    }

    ROTxn txn{env};
    auto map{open_map(*txn, map_config)};
    CHECK(txn->get(map, to_slice("audio/a.mp3"), ::mdbx::slice{}).empty());
    CHECK(from_slice(txn->get(map, to_slice("docs/a.pdf"))) == "application/pdf");
}

}  // namespace ferry::db
