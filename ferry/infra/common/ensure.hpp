// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <stdexcept>
#include <string>

#include <absl/functional/function_ref.h>

namespace ferry {

//! \brief Throws std::logic_error with message unless condition holds
//! \remarks For programming errors only: callers are not expected to recover
inline void ensure(bool condition, const char* message) {
    if (!condition) [[unlikely]] {
        throw std::logic_error{message};
    }
}

//! \brief Throws std::logic_error flagged as invariant violation unless condition holds
//! \details The message is built only on failure.
//! Usage: `ensure_invariant(a <= b, [&]() { return "a=" + std::to_string(a) + " exceeds b"; });`
inline void ensure_invariant(bool condition, absl::FunctionRef<std::string()> message_builder) {
    if (!condition) [[unlikely]] {
        throw std::logic_error{"Invariant violation: " + message_builder()};
    }
}

}  // namespace ferry
