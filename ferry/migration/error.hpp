// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <exception>
#include <stdexcept>
#include <string>

namespace ferry::migration {

enum class ErrorCode {
    kUnknownSourceCategory,  // No storage configuration for the requested category
    kUnknownProvider,        // Provider name not recognized
    kMissingTargetField,     // Target configuration lacks a required field
    kUnsupportedProvider,    // No transport registered for the provider
    kInvalidBatchSize,
    kJobNotFound,
    kNotResumable,           // Job not in {Paused, Failed} or can_resume unset
    kAlreadyRunning,         // A runner is already active for the job
    kLedgerError,            // Durable store unreachable or corrupt
    kCheckpointError,        // Checkpoint writes kept failing
};

//! \brief Validation, state and orchestration failures of the migration engine
class MigrationError : public std::exception {
  public:
    explicit MigrationError(ErrorCode code);
    MigrationError(ErrorCode code, std::string message);
    ~MigrationError() noexcept override = default;

    const char* what() const noexcept override { return message_.c_str(); }
    ErrorCode code() const noexcept { return code_; }

    //! \brief Name of the error code, e.g. "kJobNotFound"
    std::string code_name() const;

  private:
    ErrorCode code_;
    std::string message_;
};

//! \brief Failure of a single file transfer; never fatal to the job
class TransferError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

}  // namespace ferry::migration
