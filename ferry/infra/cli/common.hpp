// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>

#include <CLI/CLI.hpp>

#include <ferry/infra/common/log.hpp>

namespace ferry::cmd::common {

//! \brief Set up options to populate log settings after cli.parse()
void add_logging_options(CLI::App& cli, log::Settings& log_settings);

//! \brief Set up option for the data directory path
void add_option_data_dir(CLI::App& cli, std::filesystem::path& data_dir);

//! \brief Set up option for the number of worker threads running migrations
void add_option_num_workers(CLI::App& cli, uint32_t& num_workers);

}  // namespace ferry::cmd::common
