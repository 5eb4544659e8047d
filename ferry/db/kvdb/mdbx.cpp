// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "mdbx.hpp"

#include <stdexcept>

namespace ferry::db {

::mdbx::env_managed open_env(const EnvConfig& config) {
    namespace fs = std::filesystem;

    if (config.path.empty()) {
        throw std::invalid_argument{"Ledger path is empty"};
    }
    const fs::path db_path{config.path};
    if (fs::exists(db_path) && !fs::is_directory(db_path)) {
        throw std::runtime_error{"Ledger path " + db_path.string() + " is not a directory"};
    }

    const fs::path db_file{get_datafile_path(db_path)};
    const bool has_data{fs::exists(db_file) && fs::file_size(db_file) > 0};
    if (!has_data && !config.create) {
        throw std::runtime_error{"Ledger data file " + db_file.string() + " not found"};
    }
    if (has_data && fs::file_size(db_file) > config.max_size) {
        throw std::runtime_error{"Ledger data file " + db_file.string() + " exceeds the max map size of " +
                                 std::to_string(config.max_size) + " bytes"};
    }
    fs::create_directories(db_path);

    // MDBX_NOTLS lets read transactions hop threads: ledger calls come from pooled workers
    auto flags{static_cast<MDBX_env_flags_t>(MDBX_NOTLS | MDBX_NORDAHEAD | MDBX_COALESCE | MDBX_SYNC_DURABLE)};
    if (config.inmemory) {
        flags = static_cast<MDBX_env_flags_t>(flags | MDBX_NOMETASYNC);
    }

    ::mdbx::env_managed::create_parameters create_params{};
    const size_t max_size{config.inmemory ? 64 * kMebi : config.max_size};
    create_params.geometry.make_dynamic(::mdbx::env::geometry::default_value, static_cast<intptr_t>(max_size));
    create_params.geometry.growth_step = static_cast<intptr_t>(config.inmemory ? 2 * kMebi : config.growth_size);
    create_params.geometry.pagesize = static_cast<intptr_t>(config.page_size);

    ::mdbx::env::operate_parameters operate_params{};
    operate_params.mode = ::mdbx::env::operate_parameters::mode_from_flags(flags);
    operate_params.options = ::mdbx::env::operate_parameters::options_from_flags(flags);
    operate_params.durability = ::mdbx::env::operate_parameters::durability_from_flags(flags);
    operate_params.max_maps = config.max_tables;
    operate_params.max_readers = config.max_readers;

    ::mdbx::env_managed env{db_path.native(), create_params, operate_params};
    // Clears reader slots left behind by a crashed ferry process
    env.check_readers();
    return env;
}

::mdbx::map_handle open_map(::mdbx::txn& tx, const MapConfig& config) {
    if (tx.is_readonly()) {
        return tx.open_map(config.name, config.key_mode, config.value_mode);
    }
    return tx.create_map(config.name, config.key_mode, config.value_mode);
}

::mdbx::cursor_managed open_cursor(::mdbx::txn& tx, const MapConfig& config) {
    return tx.open_cursor(open_map(tx, config));
}

bool has_map(::mdbx::txn& tx, const char* map_name) {
    ::mdbx::map_handle main_map{1};
    auto main_crs{tx.open_cursor(main_map)};
    return main_crs.seek(::mdbx::slice{map_name});
}

size_t cursor_for_each(::mdbx::cursor& cursor, WalkFuncRef walker) {
    size_t ret{0};
    auto data{cursor.to_first(/*throw_notfound=*/false)};
    while (data.done) {
        ++ret;
        walker(from_slice(data.key), from_slice(data.value));
        data = cursor.to_next(/*throw_notfound=*/false);
    }
    return ret;
}

size_t cursor_for_prefix(::mdbx::cursor& cursor, std::string_view prefix, WalkFuncRef walker) {
    size_t ret{0};
    auto data{cursor.lower_bound(to_slice(prefix), /*throw_notfound=*/false)};
    while (data.done) {
        const std::string_view key{from_slice(data.key)};
        if (!key.starts_with(prefix)) {
            break;
        }
        ++ret;
        walker(key, from_slice(data.value));
        data = cursor.to_next(/*throw_notfound=*/false);
    }
    return ret;
}

}  // namespace ferry::db
