// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <ferry/db/kvdb/mdbx.hpp>
#include <ferry/migration/checkpoint_store.hpp>

namespace ferry::migration {

//! \brief CheckpointStore kept in the Checkpoints table of an MDBX environment
class MdbxCheckpointStore : public CheckpointStore {
  public:
    explicit MdbxCheckpointStore(::mdbx::env& env) : env_{env} {}

    void save(const Checkpoint& checkpoint) override;
    std::optional<Checkpoint> load(JobId job_id) override;

  private:
    ::mdbx::env& env_;
};

}  // namespace ferry::migration
