// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "orchestrator.hpp"

#include <memory>
#include <utility>

#include <absl/strings/str_join.h>

#include <ferry/infra/common/log.hpp>
#include <ferry/migration/asset_filter.hpp>
#include <ferry/migration/batch_runner.hpp>
#include <ferry/migration/error.hpp>
#include <ferry/migration/provider_config.hpp>

namespace ferry::migration {

MigrationJob Orchestrator::start(const MigrationRequest& request) {
    const auto source{configurations_.find(request.source_category)};
    if (!source || !source->is_active) {
        throw MigrationError{ErrorCode::kUnknownSourceCategory, "No storage configuration for category " +
                                                                    std::string{to_string(request.source_category)}};
    }
    validate_provider_config(request.target_provider, request.target_config);

    const uint32_t batch_size{request.batch_size.value_or(settings_.default_batch_size)};
    if (batch_size == 0) {
        throw MigrationError{ErrorCode::kInvalidBatchSize, "Batch size must be positive"};
    }

    // Building the transport up front rejects unsupported providers before anything is persisted
    auto transport{transports_.create(request.target_provider, *source, request.target_config)};

    const AssetTypeFilter filter{request.asset_types};
    const auto entries{inventory_.list(*source, filter)};

    MigrationJob job{
        .source_category = request.source_category,
        .target_provider = request.target_provider,
        .target_config = request.target_config,
        .asset_type_filter = request.asset_types,
        .update_references = request.update_references,
        .batch_size = batch_size,
    };
    job = ledger_.create_job(std::move(job), entries);
    FERRY_INFO_M("Migration job created", {"job", std::to_string(job.id),
                                           "category", std::string{to_string(job.source_category)},
                                           "target", std::string{to_string(job.target_provider)},
                                           "types", absl::StrJoin(filter.patterns(), ","),
                                           "files", std::to_string(job.total_files),
                                           "bytes", std::to_string(job.total_bytes)});

    try {
        checkpoints_.save(make_checkpoint(job, std::nullopt));
    } catch (const std::exception& ex) {
        FERRY_WARN_M("Initial checkpoint write failed", {"job", std::to_string(job.id), "error", ex.what()});
    }

    scheduler_.launch(std::make_shared<BatchRunner>(job.id, ledger_, checkpoints_, std::move(transport), settings_));
    return job;
}

}  // namespace ferry::migration
