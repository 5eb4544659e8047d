// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "storage_config_registry.hpp"

#include <string>

#include <ferry/db/tables.hpp>
#include <ferry/infra/common/log.hpp>
#include <ferry/migration/mdbx_codec.hpp>
#include <ferry/migration/provider_config.hpp>

namespace ferry::migration {

using detail::decode_value;
using detail::encode_value;
using detail::with_ledger_errors;

static std::optional<StorageConfiguration> load_configuration(::mdbx::txn& txn, StorageCategory category) {
    auto configurations{db::open_map(txn, db::table::kStorageConfigurations)};
    const std::string key{to_string(category)};
    const auto data{txn.get(configurations, db::to_slice(key), ::mdbx::slice{})};
    if (data.empty()) {
        return std::nullopt;
    }
    return decode_value<StorageConfiguration>(db::from_slice(data));
}

static void store_configuration(::mdbx::txn& txn, const StorageConfiguration& configuration) {
    auto configurations{db::open_map(txn, db::table::kStorageConfigurations)};
    const std::string key{to_string(configuration.category)};
    txn.upsert(configurations, db::to_slice(key), db::to_slice(encode_value(configuration)));
}

std::vector<StorageConfiguration> StorageConfigRegistry::list() {
    return with_ledger_errors("list_configurations", [&]() {
        db::ROTxn txn{env_};
        std::vector<StorageConfiguration> configurations;
        auto cursor{db::open_cursor(*txn, db::table::kStorageConfigurations)};
        db::cursor_for_each(cursor, [&](std::string_view, std::string_view value) {
            configurations.push_back(decode_value<StorageConfiguration>(value));
        });
        return configurations;
    });
}

std::optional<StorageConfiguration> StorageConfigRegistry::find(StorageCategory category) {
    return with_ledger_errors("find_configuration", [&]() {
        db::ROTxn txn{env_};
        return load_configuration(*txn, category);
    });
}

StorageConfiguration StorageConfigRegistry::upsert(StorageCategory category, StorageProvider provider,
                                                   const nlohmann::json& config) {
    validate_provider_config(provider, config);
    return with_ledger_errors("upsert_configuration", [&]() {
        db::RWTxn txn{env_};
        const auto now{now_seconds()};
        const auto existing{load_configuration(*txn, category)};
        StorageConfiguration configuration{
            .category = category,
            .provider = provider,
            .config = config,
            .is_active = true,
            .created_at = existing ? existing->created_at : now,
            .updated_at = now,
        };
        store_configuration(*txn, configuration);
        txn.commit();
        FERRY_INFO_M("Storage configuration updated", {"category", std::string{to_string(category)},
                                                       "provider", std::string{to_string(provider)}});
        return configuration;
    });
}

StorageConfiguration StorageConfigRegistry::get_or_create_default(StorageCategory category,
                                                                  const std::filesystem::path& root) {
    if (auto existing{find(category)}) {
        return std::move(*existing);
    }
    const nlohmann::json config{{"local_path", (root / std::string{to_string(category)}).string()}};
    return upsert(category, StorageProvider::kLocal, config);
}

}  // namespace ferry::migration
