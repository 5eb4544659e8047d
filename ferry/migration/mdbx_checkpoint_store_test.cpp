// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "mdbx_checkpoint_store.hpp"

#include <catch2/catch_test_macros.hpp>

#include <ferry/db/test_util/temp_ledger.hpp>

namespace ferry::migration {

TEST_CASE("MdbxCheckpointStore", "[ferry][migration][checkpoint]") {
    db::test_util::TempLedger context;
    MdbxCheckpointStore store{context.env()};

    CHECK_FALSE(store.load(1));

    MigrationJob job{.id = 1, .total_files = 10, .migrated_files = 3, .failed_files = 1, .transferred_bytes = 900};
    store.save(make_checkpoint(job, std::nullopt));
    auto loaded{store.load(1)};
    REQUIRE(loaded);
    CHECK(loaded->migration_id == 1);
    CHECK_FALSE(loaded->last_processed_file_id);
    CHECK(loaded->processed_count == 3);
    CHECK(loaded->failed_count == 1);
    CHECK(loaded->bytes_transferred == 900);

    SECTION("last write wins") {
        job.migrated_files = 4;
        job.transferred_bytes = 1200;
        store.save(make_checkpoint(job, 17));
        loaded = store.load(1);
        REQUIRE(loaded);
        CHECK(loaded->last_processed_file_id == 17u);
        CHECK(loaded->processed_count == 4);
        CHECK(loaded->bytes_transferred == 1200);
    }

    SECTION("jobs are independent") {
        store.save(make_checkpoint(MigrationJob{.id = 2}, 5));
        CHECK(store.load(2)->last_processed_file_id == 5u);
        CHECK(store.load(1)->processed_count == 3);
    }
}

}  // namespace ferry::migration
