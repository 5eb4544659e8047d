// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "directories.hpp"

#include <cstdlib>
#include <random>
#include <stdexcept>
#include <string>
#include <system_error>

namespace ferry {

namespace fs = std::filesystem;

Directory::Directory(const fs::path& directory_path, bool must_create)
    : path_{directory_path.empty() ? fs::current_path() : directory_path} {
    if (must_create) {
        create();
    }
}

bool Directory::exists() const { return fs::is_directory(path_); }

void Directory::create() {
    if (exists()) return;
    if (fs::exists(path_)) {
        throw std::invalid_argument{"Path " + path_.string() + " exists and is not a directory"};
    }
    std::error_code ec;
    fs::create_directories(path_, ec);
    if (ec) {
        throw std::invalid_argument{"Directory " + path_.string() + " could not be created: " + ec.message()};
    }
}

TemporaryDirectory::~TemporaryDirectory() {
    std::error_code ec;
    fs::remove_all(path_, ec);
}

fs::path TemporaryDirectory::unique_path(const fs::path& base_path) {
    if (base_path.empty()) {
        throw std::invalid_argument{"Temporary base path is empty"};
    }
    const auto base{fs::absolute(base_path)};
    if (!fs::is_directory(base)) {
        throw std::invalid_argument{"Path " + base.string() + " does not exist or is not a directory"};
    }

    thread_local std::mt19937_64 generator{std::random_device{}()};
    for (int i{0}; i < 1000; ++i) {
        auto candidate{base / ("ferry-" + std::to_string(generator() % 1'000'000'000'000ULL))};
        if (!fs::exists(candidate)) {
            return candidate;
        }
    }
    throw std::runtime_error{"Unable to find a unique non-existent path under " + base.string()};
}

static const char* non_empty_env(const char* name) {
    const char* value{std::getenv(name)};  // NOLINT(concurrency-mt-unsafe)
    return value && *value ? value : nullptr;
}

fs::path DataDirectory::get_default_storage_path() {
    if (const char* data_dir{non_empty_env("FERRY_DATADIR")}) {
        return data_dir;
    }
    if (const char* xdg_data_home{non_empty_env("XDG_DATA_HOME")}) {
        return fs::path{xdg_data_home} / "ferry";
    }
    if (const char* home{non_empty_env("HOME")}) {
        return fs::path{home} / ".local" / "share" / "ferry";
    }
    return fs::current_path() / "ferry";
}

void DataDirectory::deploy() {
    Directory::create();
    ledger_.create();
    storage_.create();
    logs_.create();
}

fs::path DataDirectory::log_file(const fs::path& file) const {
    return file.is_relative() ? logs_.path() / file : file;
}

}  // namespace ferry
