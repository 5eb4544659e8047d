// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include <ferry/migration/types.hpp>

namespace ferry::migration {

//! \brief Byte-level copy of one file from the source storage to the target provider of a job
class Transport {
  public:
    virtual ~Transport() = default;

    //! \brief Copies the file at source_path and returns its path on the target
    //! \remarks Must tolerate repeated invocation for the same source_path (overwrite)
    //! \throws TransferError (or any std::exception) on failure
    virtual std::string transfer(const std::string& source_path) = 0;
};

//! \brief Builds the transport of a job from the source storage configuration and the target config blob
using TransportFactory =
    std::function<std::unique_ptr<Transport>(const StorageConfiguration& source, const nlohmann::json& target_config)>;

//! \brief Maps target providers to transport factories
//! \remarks Populate before handing to the engine: lookups are not synchronized with registrations
class TransportRegistry {
  public:
    //! \brief Registry preloaded with the built-in transports (currently: local)
    static TransportRegistry with_builtin_transports();

    void register_factory(StorageProvider provider, TransportFactory factory);

    bool supports(StorageProvider provider) const { return factories_.contains(provider); }

    //! \throws MigrationError with kUnsupportedProvider when no factory is registered for provider
    std::unique_ptr<Transport> create(StorageProvider provider, const StorageConfiguration& source,
                                      const nlohmann::json& target_config) const;

  private:
    std::map<StorageProvider, TransportFactory> factories_;
};

}  // namespace ferry::migration
