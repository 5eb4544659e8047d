// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "mdbx_transfer_ledger.hpp"

#include <algorithm>

#include <ferry/db/tables.hpp>
#include <ferry/db/util.hpp>
#include <ferry/infra/common/ensure.hpp>
#include <ferry/migration/mdbx_codec.hpp>

namespace ferry::migration {

using detail::decode_value;
using detail::encode_value;
using detail::with_ledger_errors;

namespace {

    std::optional<MigrationJob> load_job(::mdbx::txn& txn, JobId job_id) {
        auto jobs{db::open_map(txn, db::table::kMigrations)};
        const auto key{db::job_key(job_id)};
        const auto data{txn.get(jobs, db::to_slice(key), ::mdbx::slice{})};
        if (data.empty()) {
            return std::nullopt;
        }
        return decode_value<MigrationJob>(db::from_slice(data));
    }

    MigrationJob load_existing_job(::mdbx::txn& txn, JobId job_id) {
        auto job{load_job(txn, job_id)};
        if (!job) {
            throw MigrationError{ErrorCode::kJobNotFound, "Migration job " + std::to_string(job_id) + " not found"};
        }
        return std::move(*job);
    }

    void store_job(::mdbx::txn& txn, const MigrationJob& job) {
        auto jobs{db::open_map(txn, db::table::kMigrations)};
        const auto key{db::job_key(job.id)};
        txn.upsert(jobs, db::to_slice(key), db::to_slice(encode_value(job)));
    }

    FileTransferRecord load_record(::mdbx::txn& txn, JobId job_id, RecordId record_id) {
        auto records{db::open_map(txn, db::table::kTransferRecords)};
        const auto key{db::record_key(job_id, record_id)};
        const auto data{txn.get(records, db::to_slice(key), ::mdbx::slice{})};
        if (data.empty()) {
            throw MigrationError{ErrorCode::kLedgerError, "Transfer record " + std::to_string(record_id) +
                                                              " of job " + std::to_string(job_id) + " not found"};
        }
        return decode_value<FileTransferRecord>(db::from_slice(data));
    }

    void store_record(::mdbx::txn& txn, const FileTransferRecord& record) {
        auto records{db::open_map(txn, db::table::kTransferRecords)};
        const auto key{db::record_key(record.migration_id, record.id)};
        txn.upsert(records, db::to_slice(key), db::to_slice(encode_value(record)));
    }

    //! Walks the records of a job in creation order
    template <typename F>
    void for_each_record(::mdbx::txn& txn, JobId job_id, F&& func) {
        auto cursor{db::open_cursor(txn, db::table::kTransferRecords)};
        const auto prefix{db::job_key(job_id)};
        db::cursor_for_prefix(cursor, prefix, [&](std::string_view, std::string_view value) {
            func(decode_value<FileTransferRecord>(value));
        });
    }

    //! First record id a scan for eligible records of the job has to look at
    RecordId load_scan_floor(::mdbx::txn& txn, JobId job_id) {
        auto floors{db::open_map(txn, db::table::kTransferScanFloor)};
        const auto key{db::job_key(job_id)};
        const auto data{txn.get(floors, db::to_slice(key), ::mdbx::slice{})};
        return data.empty() ? 0 : db::decode_u64(db::from_slice(data));
    }

    //! Moves the scan floor of the job past its leading run of Completed or Skipped records
    void advance_scan_floor(::mdbx::txn& txn, JobId job_id) {
        const RecordId floor{load_scan_floor(txn, job_id)};
        RecordId next_floor{floor};
        auto cursor{db::open_cursor(txn, db::table::kTransferRecords)};
        const auto prefix{db::job_key(job_id)};
        auto data{cursor.lower_bound(db::to_slice(db::record_key(job_id, floor)), /*throw_notfound=*/false)};
        while (data.done) {
            if (!db::from_slice(data.key).starts_with(prefix)) break;
            const auto record{decode_value<FileTransferRecord>(db::from_slice(data.value))};
            if (record.status != FileTransferState::kCompleted && record.status != FileTransferState::kSkipped) {
                next_floor = record.id;
                break;
            }
            next_floor = record.id + 1;
            data = cursor.to_next(/*throw_notfound=*/false);
        }
        if (next_floor != floor) {
            auto floors{db::open_map(txn, db::table::kTransferScanFloor)};
            const auto key{db::job_key(job_id)};
            txn.upsert(floors, db::to_slice(key), db::to_slice(db::encode_u64(next_floor)));
        }
    }

    LedgerTally compute_tally(::mdbx::txn& txn, JobId job_id, uint32_t max_attempts) {
        LedgerTally tally;
        for_each_record(txn, job_id, [&](const FileTransferRecord& record) {
            switch (record.status) {
                case FileTransferState::kPending:
                    ++tally.pending;
                    break;
                case FileTransferState::kTransferring:
                case FileTransferState::kVerifying:
                    ++tally.in_flight;
                    break;
                case FileTransferState::kCompleted:
                    ++tally.completed;
                    tally.transferred_bytes += record.bytes_transferred;
                    break;
                case FileTransferState::kFailed:
                    ++tally.failed;
                    break;
                case FileTransferState::kSkipped:
                    ++tally.skipped;
                    break;
            }
            if (record.is_eligible(max_attempts)) {
                ++tally.eligible;
            }
        });
        return tally;
    }

    void apply_state_side_effects(MigrationJob& job, MigrationState desired, const std::optional<std::string>& error) {
        job.status = desired;
        switch (desired) {
            case MigrationState::kInProgress:
                job.completed_at.reset();
                job.error.reset();
                break;
            case MigrationState::kPaused:
                job.can_resume = true;
                job.current_file.reset();
                break;
            case MigrationState::kCompleted:
                job.completed_at = now_seconds();
                job.current_file.reset();
                break;
            case MigrationState::kFailed:
                job.completed_at = now_seconds();
                job.current_file.reset();
                job.can_resume = true;
                job.error = error;
                break;
            case MigrationState::kCancelled:
                job.completed_at = now_seconds();
                job.current_file.reset();
                job.can_resume = false;
                break;
            case MigrationState::kPending:
                break;
        }
    }

    void check_counters(const MigrationJob& job) {
        ensure_invariant(job.migrated_files + job.failed_files <= job.total_files, [&]() {
            return "job " + std::to_string(job.id) + " counters exceed total: migrated=" +
                   std::to_string(job.migrated_files) + " failed=" + std::to_string(job.failed_files) +
                   " total=" + std::to_string(job.total_files);
        });
    }

}  // namespace

MigrationJob MdbxTransferLedger::create_job(MigrationJob job, const std::vector<InventoryEntry>& entries) {
    return with_ledger_errors("create_job", [&]() {
        db::RWTxn txn{env_};
        job.id = db::increment_map_sequence(*txn, db::table::kMigrations.name) + 1;
        job.status = MigrationState::kPending;
        job.total_files = entries.size();
        job.total_bytes = 0;
        job.migrated_files = 0;
        job.failed_files = 0;
        job.transferred_bytes = 0;
        job.current_file.reset();
        job.started_at = now_seconds();
        job.completed_at.reset();
        job.can_resume = true;
        job.error.reset();

        const RecordId first_record_id{
            db::increment_map_sequence(*txn, db::table::kTransferRecords.name, entries.size()) + 1};
        for (size_t i{0}; i < entries.size(); ++i) {
            const auto& entry{entries[i]};
            FileTransferRecord record{
                .id = first_record_id + i,
                .migration_id = job.id,
                .media_id = entry.media_id,
                .source_path = entry.path,
                .file_size = entry.size,
            };
            job.total_bytes += entry.size;
            store_record(*txn, record);
        }
        store_job(*txn, job);
        txn.commit();
        return job;
    });
}

std::optional<MigrationJob> MdbxTransferLedger::read_job(JobId job_id) {
    return with_ledger_errors("read_job", [&]() {
        db::ROTxn txn{env_};
        return load_job(*txn, job_id);
    });
}

std::vector<MigrationJob> MdbxTransferLedger::list_jobs() {
    return with_ledger_errors("list_jobs", [&]() {
        db::ROTxn txn{env_};
        std::vector<MigrationJob> jobs;
        auto cursor{db::open_cursor(*txn, db::table::kMigrations)};
        db::cursor_for_each(cursor, [&](std::string_view, std::string_view value) {
            jobs.push_back(decode_value<MigrationJob>(value));
        });
        return jobs;
    });
}

std::optional<MigrationJob> MdbxTransferLedger::transition(JobId job_id, const std::vector<MigrationState>& expected,
                                                           MigrationState desired,
                                                           const std::optional<std::string>& error) {
    return with_ledger_errors("transition", [&]() -> std::optional<MigrationJob> {
        db::RWTxn txn{env_};
        auto job{load_job(*txn, job_id)};
        if (!job || std::ranges::find(expected, job->status) == expected.end()) {
            return std::nullopt;
        }
        apply_state_side_effects(*job, desired, error);
        store_job(*txn, *job);
        txn.commit();
        return job;
    });
}

std::vector<FileTransferRecord> MdbxTransferLedger::fetch_eligible(JobId job_id, size_t limit,
                                                                   uint32_t max_attempts) {
    return with_ledger_errors("fetch_eligible", [&]() {
        db::ROTxn txn{env_};
        std::vector<FileTransferRecord> batch;
        if (limit == 0) return batch;
        // Records below the scan floor are settled for good, so each batch skips them
        const auto start{db::record_key(job_id, load_scan_floor(*txn, job_id))};
        auto cursor{db::open_cursor(*txn, db::table::kTransferRecords)};
        const auto prefix{db::job_key(job_id)};
        auto data{cursor.lower_bound(db::to_slice(start), /*throw_notfound=*/false)};
        while (data.done && batch.size() < limit) {
            const auto key{db::from_slice(data.key)};
            if (!key.starts_with(prefix)) break;
            auto record{decode_value<FileTransferRecord>(db::from_slice(data.value))};
            if (record.is_eligible(max_attempts)) {
                batch.push_back(std::move(record));
            }
            data = cursor.to_next(/*throw_notfound=*/false);
        }
        return batch;
    });
}

FileTransferRecord MdbxTransferLedger::claim(JobId job_id, RecordId record_id) {
    return with_ledger_errors("claim", [&]() {
        db::RWTxn txn{env_};
        auto job{load_existing_job(*txn, job_id)};
        auto record{load_record(*txn, job_id, record_id)};
        ensure_invariant(record.status == FileTransferState::kPending || record.status == FileTransferState::kFailed,
                         [&]() {
                             return "record " + std::to_string(record_id) + " cannot be claimed from status " +
                                    std::string{to_string(record.status)};
                         });
        if (record.status == FileTransferState::kFailed && job.failed_files > 0) {
            --job.failed_files;  // The earlier failure no longer is the current outcome of this record
        }
        record.status = FileTransferState::kTransferring;
        ++record.attempt_count;
        record.started_at = now_seconds();
        if (job.status == MigrationState::kInProgress) {
            job.current_file = record.source_path;
        }
        store_record(*txn, record);
        store_job(*txn, job);
        txn.commit();
        return record;
    });
}

MigrationJob MdbxTransferLedger::record_success(JobId job_id, RecordId record_id, const std::string& target_path) {
    return with_ledger_errors("record_success", [&]() {
        db::RWTxn txn{env_};
        auto job{load_existing_job(*txn, job_id)};
        auto record{load_record(*txn, job_id, record_id)};
        ensure_invariant(record.status == FileTransferState::kTransferring ||
                             record.status == FileTransferState::kVerifying,
                         [&]() { return "record " + std::to_string(record_id) + " is not in flight"; });
        record.status = FileTransferState::kCompleted;
        record.target_path = target_path;
        record.bytes_transferred = record.file_size;
        record.last_error.reset();
        record.completed_at = now_seconds();
        ++job.migrated_files;
        job.transferred_bytes += record.file_size;
        check_counters(job);
        store_record(*txn, record);
        store_job(*txn, job);
        advance_scan_floor(*txn, job_id);
        txn.commit();
        return job;
    });
}

MigrationJob MdbxTransferLedger::record_failure(JobId job_id, RecordId record_id, const std::string& error) {
    return with_ledger_errors("record_failure", [&]() {
        db::RWTxn txn{env_};
        auto job{load_existing_job(*txn, job_id)};
        auto record{load_record(*txn, job_id, record_id)};
        ensure_invariant(record.status == FileTransferState::kTransferring ||
                             record.status == FileTransferState::kVerifying,
                         [&]() { return "record " + std::to_string(record_id) + " is not in flight"; });
        record.status = FileTransferState::kFailed;
        record.last_error = error;
        ++job.failed_files;
        check_counters(job);
        store_record(*txn, record);
        store_job(*txn, job);
        txn.commit();
        return job;
    });
}

std::vector<FileTransferRecord> MdbxTransferLedger::list_records(JobId job_id,
                                                                 std::optional<FileTransferState> status) {
    return with_ledger_errors("list_records", [&]() {
        db::ROTxn txn{env_};
        std::vector<FileTransferRecord> records;
        for_each_record(*txn, job_id, [&](FileTransferRecord record) {
            if (!status || record.status == *status) {
                records.push_back(std::move(record));
            }
        });
        return records;
    });
}

LedgerTally MdbxTransferLedger::tally(JobId job_id) {
    return with_ledger_errors("tally", [&]() {
        db::ROTxn txn{env_};
        return compute_tally(*txn, job_id, kMaxTransferAttempts);
    });
}

size_t MdbxTransferLedger::requeue_interrupted(JobId job_id, const std::string& error) {
    return with_ledger_errors("requeue_interrupted", [&]() {
        db::RWTxn txn{env_};
        auto job{load_existing_job(*txn, job_id)};
        std::vector<FileTransferRecord> interrupted;
        for_each_record(*txn, job_id, [&](FileTransferRecord record) {
            if (record.status == FileTransferState::kTransferring || record.status == FileTransferState::kVerifying) {
                interrupted.push_back(std::move(record));
            }
        });
        for (auto& record : interrupted) {
            record.status = FileTransferState::kFailed;
            record.last_error = error;
            store_record(*txn, record);
            ++job.failed_files;
        }
        job.current_file.reset();
        check_counters(job);
        store_job(*txn, job);
        txn.commit();
        return interrupted.size();
    });
}

std::optional<MigrationJob> MdbxTransferLedger::finalize(JobId job_id) {
    return with_ledger_errors("finalize", [&]() -> std::optional<MigrationJob> {
        db::RWTxn txn{env_};
        auto job{load_job(*txn, job_id)};
        if (!job || job->status != MigrationState::kInProgress) {
            return std::nullopt;
        }
        const auto tally{compute_tally(*txn, job_id, kMaxTransferAttempts)};
        job->migrated_files = tally.completed;
        job->failed_files = tally.failed;
        job->transferred_bytes = tally.transferred_bytes;
        apply_state_side_effects(*job, MigrationState::kCompleted, std::nullopt);
        check_counters(*job);
        store_job(*txn, *job);
        txn.commit();
        return job;
    });
}

}  // namespace ferry::migration
