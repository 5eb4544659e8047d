// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "log.hpp"

#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <utility>

#include <absl/time/clock.h>
#include <absl/time/time.h>

#include <ferry/infra/common/terminal.hpp>

namespace ferry::log {

//! Thread names are padded or cut to this width so that messages line up
static constexpr size_t kThreadNameWidth{11};

//! Messages are padded to this width so that key-value pairs line up
static constexpr int kMessageWidth{36};

static Settings settings_{};
static bool colored_output_{false};
static absl::TimeZone time_zone_{absl::UTCTimeZone()};
static std::mutex out_mutex_;
static std::unique_ptr<std::ofstream> file_;
thread_local std::string thread_name_;

void init(const Settings& settings) {
    settings_ = settings;
    file_.reset();
    if (!settings_.log_file.empty()) {
        tee_file(settings_.log_file);
    }
    switch (settings_.log_colors) {
        case ColorMode::kAuto:
            colored_output_ = is_terminal(stderr);
            break;
        case ColorMode::kAlways:
            colored_output_ = true;
            break;
        case ColorMode::kNever:
            colored_output_ = false;
            break;
    }
    // The same line goes to the file, which must stay free of escape sequences
    colored_output_ = colored_output_ && !file_;
    time_zone_ = settings_.log_utc ? absl::UTCTimeZone() : absl::LocalTimeZone();
}

void tee_file(const std::filesystem::path& path) {
    auto file{std::make_unique<std::ofstream>(path, std::ios::out | std::ios::app)};
    if (!file->is_open()) {
        throw std::runtime_error{"Could not open log file " + path.string()};
    }
    file_ = std::move(file);
}

Level get_verbosity() { return settings_.log_verbosity; }

void set_verbosity(Level level) { settings_.log_verbosity = level; }

bool test_verbosity(Level level) { return level <= settings_.log_verbosity; }

void set_thread_name(const char* name) {
    thread_name_ = name;
    thread_name_.resize(kThreadNameWidth, ' ');
}

std::string get_thread_name() {
    if (thread_name_.empty()) {
        std::ostringstream id;
        id << std::this_thread::get_id();
        thread_name_ = id.str();
    }
    return thread_name_;
}

static std::pair<std::string_view, std::string_view> level_tag(Level level) {
    switch (level) {
        case Level::kTrace:
            return {"TRACE", color::kGrey};
        case Level::kDebug:
            return {"DEBUG", color::kCyan};
        case Level::kInfo:
            return {" INFO", color::kGreen};
        case Level::kWarning:
            return {" WARN", color::kYellow};
        case Level::kError:
            return {"ERROR", color::kRed};
        case Level::kCritical:
            return {" CRIT", color::kRedBackground};
        case Level::kNone:
            break;
    }
    return {"     ", color::kReset};
}

BufferBase::BufferBase(Level level) : should_print_{test_verbosity(level)}, colored_{colored_output_} {
    if (!should_print_) return;

    const auto [tag, tag_color] = level_tag(level);
    ss_ << paint(tag_color) << tag << paint(color::kReset) << " ";
    ss_ << paint(color::kWhite) << "[" << absl::FormatTime("%m-%d|%H:%M:%E3S", absl::Now(), time_zone_) << "] "
        << paint(color::kReset);
    if (settings_.log_threads) {
        ss_ << "[" << get_thread_name() << "] ";
    }
}

BufferBase::BufferBase(Level level, std::string_view msg, const Args& args) : BufferBase(level) {
    append(msg, args);
}

void BufferBase::append(std::string_view msg, const Args& args) {
    if (!should_print_) return;
    ss_ << std::left << std::setw(kMessageWidth) << std::setfill(' ') << msg;
    for (size_t i{0}; i + 1 < args.size(); i += 2) {
        ss_ << paint(color::kGreen) << args[i] << paint(color::kReset) << "=" << paint(color::kWhite) << args[i + 1]
            << paint(color::kReset) << " ";
    }
    if (args.size() % 2 != 0) {
        ss_ << args.back();  // Dangling key
    }
}

void BufferBase::flush() {
    if (!should_print_) return;

    const std::string line{ss_.str()};
    std::scoped_lock lock{out_mutex_};
    std::cerr << line << '\n';
    if (file_) {
        *file_ << line << '\n';
        file_->flush();
    }
}

}  // namespace ferry::log
