// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include <ferry/migration/transport.hpp>

namespace ferry::migration {

//! \brief Copies files between two directories of the local filesystem
//! \details <source_root>/<path> is copied to <target_root>/<path>, parent directories are created and an existing
//! target is overwritten. The copy is verified by size.
class LocalTransport : public Transport {
  public:
    LocalTransport(std::filesystem::path source_root, std::filesystem::path target_root);

    //! \brief Factory suitable for TransportRegistry: source must be a local storage, target needs "local_path"
    static std::unique_ptr<Transport> from_configs(const StorageConfiguration& source,
                                                   const nlohmann::json& target_config);

    std::string transfer(const std::string& source_path) override;

    const std::filesystem::path& source_root() const { return source_root_; }
    const std::filesystem::path& target_root() const { return target_root_; }

  private:
    std::filesystem::path source_root_;
    std::filesystem::path target_root_;
};

}  // namespace ferry::migration
