// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "orchestrator.hpp"

#include <catch2/catch_test_macros.hpp>

#include <ferry/migration/error.hpp>
#include <ferry/migration/test_util/ledger_test_base.hpp>

namespace ferry::migration {

using test_util::LedgerTestBase;

class OrchestratorTest : public LedgerTestBase {
  public:
    OrchestratorTest() {
        transports_.register_factory(StorageProvider::kLocal, test_util::scripted_factory(script_));
        (void)configurations_.upsert(StorageCategory::kAssets, StorageProvider::kLocal,
                                     {{"local_path", "/srv/assets"}});
    }

  protected:
    static MigrationRequest local_request() {
        return MigrationRequest{
            .source_category = StorageCategory::kAssets,
            .target_provider = StorageProvider::kLocal,
            .target_config = {{"local_path", "/mnt/target"}},
        };
    }

    ErrorCode start_error(const MigrationRequest& request) {
        try {
            (void)orchestrator_.start(request);
        } catch (const MigrationError& ex) {
            return ex.code();
        }
        FAIL("start unexpectedly succeeded");
        return ErrorCode::kLedgerError;
    }

    StorageConfigRegistry configurations_{context_.env()};
    TransportRegistry transports_;
    test_util::MemoryInventory inventory_{inventory_entries()};
    JobScheduler scheduler_{2};
    Orchestrator orchestrator_{ledger_, checkpoints_, configurations_, transports_, inventory_, scheduler_, settings_};

  private:
    static std::vector<InventoryEntry> inventory_entries() {
        auto entries{test_util::make_entries(12)};
        entries.push_back(InventoryEntry{.path = "manual.pdf", .size = 5000, .mime_type = "application/pdf"});
        entries.push_back(InventoryEntry{.path = "intro.mp4", .size = 9000, .mime_type = "video/mp4"});
        return entries;
    }
};

TEST_CASE_METHOD(OrchestratorTest, "Orchestrator::start", "[ferry][migration][orchestrator]") {
    auto request{local_request()};
    request.batch_size = 5;
    request.update_references = true;

    const auto created{orchestrator_.start(request)};
    CHECK(created.id == 1);
    CHECK(created.status == MigrationState::kPending);
    CHECK(created.total_files == 14);
    CHECK(created.batch_size == 5);
    CHECK(created.update_references);
    CHECK(created.target_config["local_path"] == "/mnt/target");

    CHECK(scheduler_.wait(created.id) == BatchRunner::Result::kCompleted);
    const auto done{job(created.id)};
    CHECK(done.status == MigrationState::kCompleted);
    CHECK(done.migrated_files == 14);
    CHECK(done.transferred_bytes == created.total_bytes);
    CHECK(checkpoints_.load(created.id)->processed_count == 14);
}

TEST_CASE_METHOD(OrchestratorTest, "Orchestrator::start with asset filter", "[ferry][migration][orchestrator]") {
    auto request{local_request()};
    request.asset_types = {"documents", "videos"};

    const auto created{orchestrator_.start(request)};
    CHECK(created.total_files == 2);
    CHECK(created.total_bytes == 14000);
    CHECK(created.batch_size == settings_.default_batch_size);
    CHECK(created.asset_type_filter == std::vector<std::string>{"documents", "videos"});

    CHECK(scheduler_.wait(created.id) == BatchRunner::Result::kCompleted);
    const auto all{records(created.id)};
    REQUIRE(all.size() == 2);
    CHECK(all[0].source_path == "manual.pdf");
    CHECK(all[1].source_path == "intro.mp4");
}

TEST_CASE_METHOD(OrchestratorTest, "Orchestrator::start validation", "[ferry][migration][orchestrator]") {
    auto request{local_request()};

    SECTION("unknown source category") {
        request.source_category = StorageCategory::kPlugins;
        CHECK(start_error(request) == ErrorCode::kUnknownSourceCategory);
    }
    SECTION("missing target field") {
        request.target_config = {{"path", "/mnt/target"}};
        CHECK(start_error(request) == ErrorCode::kMissingTargetField);
    }
    SECTION("invalid batch size") {
        request.batch_size = 0;
        CHECK(start_error(request) == ErrorCode::kInvalidBatchSize);
    }
    SECTION("unsupported provider") {
        request.target_provider = StorageProvider::kS3;
        request.target_config = {{"bucket", "b"}, {"access_key", "a"}, {"secret_key", "s"}};
        CHECK(start_error(request) == ErrorCode::kUnsupportedProvider);
    }

    // Nothing is persisted on error
    CHECK(ledger_.list_jobs().empty());
    CHECK_FALSE(checkpoints_.load(1));
    CHECK(scheduler_.running_jobs().empty());
}

}  // namespace ferry::migration
