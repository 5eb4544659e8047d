// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "directories.hpp"

#include <fstream>
#include <stdexcept>

#include <catch2/catch_test_macros.hpp>

namespace ferry {

TEST_CASE("TemporaryDirectory", "[ferry][infra][common][directories]") {
    std::filesystem::path tmp_path;
    {
        TemporaryDirectory tmp_dir;
        tmp_path = tmp_dir.path();
        CHECK(tmp_dir.exists());

        std::filesystem::create_directories(tmp_path / "nested");
        std::ofstream{tmp_path / "nested" / "file.bin"} << "0123456789";
    }
    CHECK_FALSE(std::filesystem::exists(tmp_path));

    SECTION("unique paths do not exist yet") {
        TemporaryDirectory base;
        const auto first{TemporaryDirectory::unique_path(base.path())};
        CHECK(first.parent_path().string() == base.path().string());
        CHECK_FALSE(std::filesystem::exists(first));
    }

    SECTION("invalid base path") {
        CHECK_THROWS_AS(TemporaryDirectory::unique_path(""), std::invalid_argument);
        TemporaryDirectory base;
        CHECK_THROWS_AS(TemporaryDirectory::unique_path(base.path() / "missing"), std::invalid_argument);
    }
}

TEST_CASE("Directory refuses to shadow a file", "[ferry][infra][common][directories]") {
    TemporaryDirectory tmp_dir;
    std::ofstream{tmp_dir.path() / "ledger"} << "not a directory";
    Directory directory{tmp_dir.path() / "ledger"};
    CHECK_FALSE(directory.exists());
    CHECK_THROWS_AS(directory.create(), std::invalid_argument);
}

TEST_CASE("DataDirectory", "[ferry][infra][common][directories]") {
    TemporaryDirectory tmp_dir;
    const auto base{tmp_dir.path() / "data"};

    SECTION("deploy creates the tree") {
        DataDirectory data_dir{base};
        CHECK_FALSE(data_dir.exists());
        data_dir.deploy();
        CHECK(data_dir.exists());
        CHECK(data_dir.ledger().exists());
        CHECK(data_dir.storage().exists());
        CHECK(data_dir.logs().exists());
        CHECK(data_dir.ledger().path().string() == (base / "ledger").string());
    }

    SECTION("log files") {
        DataDirectory data_dir{base};
        CHECK(data_dir.log_file("ferry.log").string() == (base / "logs" / "ferry.log").string());
        CHECK(data_dir.log_file("/var/log/ferry.log").string() == "/var/log/ferry.log");
    }
}

}  // namespace ferry
