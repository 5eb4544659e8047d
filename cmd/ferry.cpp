// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include <filesystem>
#include <iostream>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>
#include <magic_enum.hpp>
#include <nlohmann/json.hpp>

#include <ferry/db/ledger.hpp>
#include <ferry/infra/cli/common.hpp>
#include <ferry/infra/common/directories.hpp>
#include <ferry/infra/common/log.hpp>
#include <ferry/infra/common/terminal.hpp>
#include <ferry/infra/concurrency/signal_handler.hpp>
#include <ferry/migration/error.hpp>
#include <ferry/migration/migration_service.hpp>

using namespace ferry;
using namespace ferry::migration;

namespace fs = std::filesystem;

//! Maps persisted names to enum values for CLI::CheckedTransformer
template <typename E>
static std::map<std::string, E> name_mapping(const std::vector<E>& values) {
    std::map<std::string, E> mapping;
    for (const auto value : values) {
        mapping.emplace(std::string{to_string(value)}, value);
    }
    return mapping;
}

static std::vector<FileTransferState> all_file_transfer_states() {
    std::vector<FileTransferState> states;
    for (const auto state : magic_enum::enum_values<FileTransferState>()) {
        states.push_back(state);
    }
    return states;
}

//! Pretty on a terminal, one line per document when piped
static void print_json(const nlohmann::json& json) {
    std::cout << json.dump(is_terminal(stdout) ? 2 : -1) << "\n";
}

static nlohmann::json parse_json_object(const std::string& text, const std::string& option) {
    auto json{nlohmann::json::parse(text, nullptr, /*allow_exceptions=*/false)};
    if (json.is_discarded() || !json.is_object()) {
        throw std::invalid_argument{option + " must be a JSON object"};
    }
    return json;
}

//! Waits for the runner of job_id and prints the final job snapshot
static int wait_and_report(MigrationService& service, JobId job_id) {
    const auto result{service.wait(job_id)};
    if (result) {
        FERRY_INFO_M("Migration runner exited", {"job", std::to_string(job_id),
                                                 "result", std::string{magic_enum::enum_name(*result)}});
    }
    print_json(service.status(job_id).value());
    return result == BatchRunner::Result::kFailed ? 1 : 0;
}

int main(int argc, char* argv[]) {
    CLI::App cli("Ferry storage migration tool");
    cli.get_formatter()->column_width(50);
    cli.require_subcommand(1);

    log::Settings log_settings;
    MigrationSettings settings;
    fs::path data_dir_path;

    cmd::common::add_option_data_dir(cli, data_dir_path);
    cmd::common::add_option_num_workers(cli, settings.num_workers);
    cli.add_option("--max-attempts", settings.max_attempts, "Transfer attempts per file before giving up")
        ->check(CLI::Range(1u, 100u))
        ->capture_default_str();
    cmd::common::add_logging_options(cli, log_settings);

    const auto category_names{name_mapping(all_storage_categories())};
    const auto provider_names{name_mapping(all_storage_providers())};
    const auto state_names{name_mapping(all_file_transfer_states())};

    /*
     * Subcommands
     */
    StorageCategory category{StorageCategory::kAssets};
    StorageProvider provider{StorageProvider::kLocal};
    std::string config_text;
    JobId job_id{0};

    auto* cmd_config_set = cli.add_subcommand("config-set", "Set the storage configuration of a category");
    cmd_config_set->add_option("--category", category, "Storage category")
        ->required()
        ->transform(CLI::CheckedTransformer(category_names, CLI::ignore_case));
    cmd_config_set->add_option("--provider", provider, "Storage provider")
        ->required()
        ->transform(CLI::CheckedTransformer(provider_names, CLI::ignore_case));
    cmd_config_set->add_option("--config", config_text, "Provider configuration as JSON object")->required();

    auto* cmd_config_list = cli.add_subcommand("config-list", "List the storage configurations");

    MigrationRequest request;
    std::string target_config_text;
    uint32_t batch_size{0};
    auto* cmd_start = cli.add_subcommand("start", "Start a migration and wait for it");
    cmd_start->add_option("--category", request.source_category, "Source storage category")
        ->required()
        ->transform(CLI::CheckedTransformer(category_names, CLI::ignore_case));
    cmd_start->add_option("--provider", request.target_provider, "Target storage provider")
        ->required()
        ->transform(CLI::CheckedTransformer(provider_names, CLI::ignore_case));
    cmd_start->add_option("--target-config", target_config_text, "Target configuration as JSON object")->required();
    cmd_start->add_option("--types", request.asset_types, "Asset types to migrate (images, videos, documents, all)")
        ->delimiter(',');
    cmd_start->add_flag("--update-references", request.update_references, "Update asset references after migration");
    auto* batch_size_opt = cmd_start->add_option("--batch-size", batch_size, "Files fetched per batch")
                               ->check(CLI::Range(1u, 10000u));

    auto* cmd_status = cli.add_subcommand("status", "Print a migration job");
    auto* cmd_cancel = cli.add_subcommand("cancel", "Cancel a pending or running migration");
    auto* cmd_resume = cli.add_subcommand("resume", "Resume a paused or failed migration and wait for it");
    auto* cmd_checkpoint = cli.add_subcommand("checkpoint", "Print the latest checkpoint of a migration");
    FileTransferState file_state{FileTransferState::kPending};
    auto* cmd_files = cli.add_subcommand("files", "List the transfer records of a migration");
    auto* file_state_opt = cmd_files->add_option("--status", file_state, "Only records in this status")
                               ->transform(CLI::CheckedTransformer(state_names, CLI::ignore_case));
    for (auto* subcommand : {cmd_status, cmd_cancel, cmd_resume, cmd_checkpoint, cmd_files}) {
        subcommand->add_option("--job", job_id, "Migration job id")->required();
    }

    auto* cmd_jobs = cli.add_subcommand("jobs", "List all migration jobs");
    auto* cmd_recover = cli.add_subcommand("recover", "Pause migrations interrupted by a crash");
    cmd_recover->add_flag("--relaunch-pending", settings.relaunch_pending, "Also run migrations never started");

    try {
        cli.parse(argc, argv);

        auto console_settings{log_settings};
        console_settings.log_file.clear();
        log::init(console_settings);
        log::set_thread_name("main-thread");

        DataDirectory data_dir{data_dir_path};
        data_dir.deploy();
        if (!log_settings.log_file.empty()) {
            log_settings.log_file = data_dir.log_file(log_settings.log_file);
            log::init(log_settings);
        }

        // A signal makes every runner pause at the next file boundary
        SignalHandler::init();

        settings.ledger_dir = data_dir.ledger().path();
        auto env{db::open_ledger_env(settings.ledger_dir)};
        MigrationService service{env, settings};

        if (*cmd_config_set) {
            print_json(service.configurations().upsert(category, provider,
                                                       parse_json_object(config_text, "--config")));
        } else if (*cmd_config_list) {
            print_json(service.configurations().list());
        } else if (*cmd_start) {
            (void)service.configurations().get_or_create_default(request.source_category, data_dir.storage().path());
            request.target_config = parse_json_object(target_config_text, "--target-config");
            if (*batch_size_opt) request.batch_size = batch_size;
            const auto job{service.start(request)};
            FERRY_INFO_M("Migration started", {"job", std::to_string(job.id),
                                               "files", std::to_string(job.total_files)});
            return wait_and_report(service, job.id);
        } else if (*cmd_status) {
            const auto job{service.status(job_id)};
            if (!job) {
                throw MigrationError{ErrorCode::kJobNotFound, "Migration job " + std::to_string(job_id) + " not found"};
            }
            print_json(*job);
        } else if (*cmd_cancel) {
            const bool cancelled{service.cancel(job_id)};
            print_json({{"id", job_id}, {"cancelled", cancelled}});
            return cancelled ? 0 : 1;
        } else if (*cmd_resume) {
            (void)service.resume(job_id);
            return wait_and_report(service, job_id);
        } else if (*cmd_checkpoint) {
            const auto checkpoint{service.get_checkpoint(job_id)};
            print_json(checkpoint ? nlohmann::json(*checkpoint) : nlohmann::json{});
        } else if (*cmd_files) {
            std::optional<FileTransferState> filter;
            if (*file_state_opt) filter = file_state;
            print_json(service.list_files(job_id, filter));
        } else if (*cmd_jobs) {
            print_json(service.list_jobs());
        } else if (*cmd_recover) {
            const auto report{service.recover()};
            print_json({{"paused", report.paused},
                        {"relaunched", report.relaunched},
                        {"requeued_records", report.requeued_records}});
            for (const auto relaunched : report.relaunched) {
                (void)service.wait(relaunched);
            }
        }
        return 0;
    } catch (const CLI::ParseError& ex) {
        return cli.exit(ex);
    } catch (const MigrationError& ex) {
        FERRY_ERROR_M("Migration request rejected", {"code", ex.code_name(), "error", ex.what()});
        return 2;
    } catch (const std::exception& ex) {
        FERRY_CRIT_M("Unrecoverable failure", {"error", ex.what()});
        return -1;
    }
}
