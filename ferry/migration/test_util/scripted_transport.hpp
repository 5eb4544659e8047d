// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include <ferry/migration/error.hpp>
#include <ferry/migration/transport.hpp>

namespace ferry::migration::test_util {

//! \brief Transport whose outcome is scripted per source path
//! \details State is shared, so the same script can back several transport instances (one per runner launch)
class ScriptedTransport : public Transport {
  public:
    struct Script {
        std::map<std::string, int> failures;  // Remaining failures per path, negative means always fail
        std::function<void(size_t)> on_success;  // Invoked with the number of successes so far
        std::vector<std::string> calls;
        size_t successes{0};
        std::mutex mutex;
    };

    explicit ScriptedTransport(std::shared_ptr<Script> script) : script_{std::move(script)} {}

    std::string transfer(const std::string& source_path) override {
        std::function<void(size_t)> hook;
        size_t successes{0};
        {
            std::scoped_lock lock{script_->mutex};
            script_->calls.push_back(source_path);
            auto it{script_->failures.find(source_path)};
            if (it != script_->failures.end() && it->second != 0) {
                if (it->second > 0) --it->second;
                throw TransferError{"scripted failure of " + source_path};
            }
            successes = ++script_->successes;
            hook = script_->on_success;
        }
        if (hook) hook(successes);
        return "target/" + source_path;
    }

  private:
    std::shared_ptr<Script> script_;
};

//! \brief Factory handing out ScriptedTransport instances sharing script
inline TransportFactory scripted_factory(std::shared_ptr<ScriptedTransport::Script> script) {
    return [script](const StorageConfiguration&, const nlohmann::json&) {
        return std::make_unique<ScriptedTransport>(script);
    };
}

}  // namespace ferry::migration::test_util
