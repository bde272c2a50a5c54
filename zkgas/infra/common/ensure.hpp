// Copyright 2025 The zkgas Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <concepts>
#include <stdexcept>
#include <string>

namespace zkgas {

//! Throw std::logic_error carrying \p message when an internal invariant does not hold
template <unsigned int N>
inline void ensure(bool invariant, const char (&message)[N]) {
    if (!invariant) [[unlikely]] {
        throw std::logic_error{message};
    }
}

//! Throw std::invalid_argument when a caller breaks a function pre-condition
//! \param describe builds the message only on failure, e.g. `[&] { return "count is " + std::to_string(n); }`
template <std::invocable Describe>
inline void ensure_pre_condition(bool condition, Describe&& describe) {
    if (!condition) [[unlikely]] {
        throw std::invalid_argument{"pre-condition violated: " + std::string{describe()}};
    }
}

}  // namespace zkgas
