// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <atomic>
#include <csignal>
#include <cstdint>
#include <functional>

namespace ferry {

//! \brief Process-wide interception of SIGINT, SIGTERM and SIGHUP
//! \details The first signal raises the signalled flag, which every Stoppable observes, so running migrations pause
//! at the next file boundary. The third signal terminates the process immediately.
class SignalHandler {
  public:
    //! Number of signals after which the process exits without waiting for runners
    static constexpr uint32_t kForceExitCount{3};

    //! \brief Installs the hook, saving the previous handlers
    //! \param custom_handler invoked from signal context on every signal: it must be async-signal-safe
    static void init(std::function<void(int)> custom_handler = {}, bool silent = false);

    static void handle(int sig_code);

    static bool signalled() { return signalled_; }

    //! Code of the first intercepted signal, 0 if none
    static int signal_code() { return sig_code_; }

    //! \brief Clears the signalled state and restores the previous handlers
    static void reset();

  private:
    static std::atomic_int sig_code_;
    static std::atomic_uint32_t sig_count_;
    static std::atomic_bool signalled_;
    static std::function<void(int)> custom_handler_;
    static bool silent_;
};

}  // namespace ferry
