// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "mdbx_checkpoint_store.hpp"

#include <ferry/db/tables.hpp>
#include <ferry/db/util.hpp>
#include <ferry/migration/mdbx_codec.hpp>

namespace ferry::migration {

void MdbxCheckpointStore::save(const Checkpoint& checkpoint) {
    detail::with_ledger_errors("save_checkpoint", [&]() {
        db::RWTxn txn{env_};
        auto checkpoints{db::open_map(*txn, db::table::kCheckpoints)};
        const auto key{db::job_key(checkpoint.migration_id)};
        txn->upsert(checkpoints, db::to_slice(key), db::to_slice(detail::encode_value(checkpoint)));
        txn.commit();
    });
}

std::optional<Checkpoint> MdbxCheckpointStore::load(JobId job_id) {
    return detail::with_ledger_errors("load_checkpoint", [&]() -> std::optional<Checkpoint> {
        db::ROTxn txn{env_};
        auto checkpoints{db::open_map(*txn, db::table::kCheckpoints)};
        const auto key{db::job_key(job_id)};
        const auto data{txn->get(checkpoints, db::to_slice(key), ::mdbx::slice{})};
        if (data.empty()) {
            return std::nullopt;
        }
        return detail::decode_value<Checkpoint>(db::from_slice(data));
    });
}

}  // namespace ferry::migration
