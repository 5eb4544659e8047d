// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "common.hpp"

#include <map>
#include <string>

#include <ferry/infra/common/directories.hpp>

namespace ferry::cmd::common {

void add_logging_options(CLI::App& cli, log::Settings& log_settings) {
    const std::map<std::string, log::Level> level_mapping{
        {"critical", log::Level::kCritical},
        {"error", log::Level::kError},
        {"warning", log::Level::kWarning},
        {"info", log::Level::kInfo},
        {"debug", log::Level::kDebug},
        {"trace", log::Level::kTrace},
    };
    const std::map<std::string, log::ColorMode> color_mapping{
        {"auto", log::ColorMode::kAuto},
        {"always", log::ColorMode::kAlways},
        {"never", log::ColorMode::kNever},
    };
    auto& log_opts = *cli.add_option_group("Log", "Logging options (log lines go to stderr)");
    log_opts.add_option("--log.verbosity", log_settings.log_verbosity, "Sets log verbosity")
        ->transform(CLI::CheckedTransformer(level_mapping, CLI::ignore_case))
        ->default_val(log::Level::kInfo);
    log_opts.add_option("--log.colors", log_settings.log_colors, "When to paint log lines")
        ->transform(CLI::CheckedTransformer(color_mapping, CLI::ignore_case))
        ->default_val(log::ColorMode::kAuto);
    log_opts.add_flag("--log.localtime{false}", log_settings.log_utc, "Prints log timings in the local timezone");
    log_opts.add_flag("--log.threads", log_settings.log_threads, "Prints thread names");
    log_opts.add_option("--log.file", log_settings.log_file,
                        "Tee all log lines to this file (relative paths land in <datadir>/logs)");
}

void add_option_data_dir(CLI::App& cli, std::filesystem::path& data_dir) {
    cli.add_option("--datadir", data_dir, "The path to the migration data directory")
        ->default_val(DataDirectory::get_default_storage_path().string());
}

void add_option_num_workers(CLI::App& cli, uint32_t& num_workers) {
    cli.add_option("--workers", num_workers, "The number of worker threads running migrations")
        ->check(CLI::Range(1u, 64u))
        ->capture_default_str();
}

}  // namespace ferry::cmd::common
