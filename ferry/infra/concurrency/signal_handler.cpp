// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "signal_handler.hpp"

#include <unistd.h>

#include <cstdlib>
#include <cstring>
#include <map>
#include <utility>

namespace ferry {

inline constexpr int kHandledSignals[]{SIGINT, SIGTERM, SIGHUP};

std::atomic_int SignalHandler::sig_code_{0};
std::atomic_uint32_t SignalHandler::sig_count_{0};
std::atomic_bool SignalHandler::signalled_{false};
std::function<void(int)> SignalHandler::custom_handler_;
bool SignalHandler::silent_{false};

static std::map<int, struct sigaction> previous_actions;

static const char* sig_name(int sig_code) {
    switch (sig_code) {
        case SIGINT:
            return "SIGINT";
        case SIGTERM:
            return "SIGTERM";
        case SIGHUP:
            return "SIGHUP";
        default:
            return "signal";
    }
}

//! Only write(2) is async-signal-safe among the output functions
static void write_stderr(const char* text) {
    [[maybe_unused]] const auto written{::write(STDERR_FILENO, text, std::strlen(text))};
}

void SignalHandler::init(std::function<void(int)> custom_handler, bool silent) {
    custom_handler_ = std::move(custom_handler);
    silent_ = silent;
    for (const int sig_code : kHandledSignals) {
        struct sigaction action {};
        action.sa_handler = &SignalHandler::handle;
        sigfillset(&action.sa_mask);
        struct sigaction previous {};
        if (::sigaction(sig_code, &action, &previous) == 0) {
            previous_actions.try_emplace(sig_code, previous);
        }
    }
}

void SignalHandler::handle(int sig_code) {
    bool expected{false};
    if (signalled_.compare_exchange_strong(expected, true)) {
        sig_code_ = sig_code;
        if (!silent_) {
            write_stderr("\nGot ");
            write_stderr(sig_name(sig_code));
            write_stderr(". Pausing running migrations at the next file, interrupt twice more to force exit\n");
        }
    }
    if (++sig_count_ >= kForceExitCount) {
        if (!silent_) write_stderr("Forced exit: interrupted transfers are requeued by 'ferry recover'\n");
        std::_Exit(128 + sig_code);
    }
    if (custom_handler_) {
        custom_handler_(sig_code);
    }
}

void SignalHandler::reset() {
    signalled_ = false;
    sig_code_ = 0;
    sig_count_ = 0;
    for (const auto& [sig_code, previous] : previous_actions) {
        ::sigaction(sig_code, &previous, nullptr);
    }
    previous_actions.clear();
    custom_handler_ = {};
}

}  // namespace ferry
