// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "transport.hpp"

#include <utility>

#include <ferry/migration/error.hpp>
#include <ferry/migration/local_transport.hpp>

namespace ferry::migration {

TransportRegistry TransportRegistry::with_builtin_transports() {
    TransportRegistry registry;
    registry.register_factory(StorageProvider::kLocal, &LocalTransport::from_configs);
    return registry;
}

void TransportRegistry::register_factory(StorageProvider provider, TransportFactory factory) {
    factories_[provider] = std::move(factory);
}

std::unique_ptr<Transport> TransportRegistry::create(StorageProvider provider, const StorageConfiguration& source,
                                                     const nlohmann::json& target_config) const {
    const auto it{factories_.find(provider)};
    if (it == factories_.end()) {
        throw MigrationError{ErrorCode::kUnsupportedProvider,
                             "No transport available for provider " + std::string{to_string(provider)}};
    }
    return it->second(source, target_config);
}

}  // namespace ferry::migration
