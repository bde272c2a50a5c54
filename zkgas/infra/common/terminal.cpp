// Copyright 2025 The zkgas Authors
// SPDX-License-Identifier: Apache-2.0

#include "terminal.hpp"

#include <unistd.h>

#include <cstdio>

#include <absl/strings/str_cat.h>

namespace zkgas {

bool is_terminal(int fd) {
    return ::isatty(fd) == 1;
}

bool is_terminal_stdout() {
    return is_terminal(::fileno(stdout));
}

bool is_terminal_stderr() {
    return is_terminal(::fileno(stderr));
}

std::string colorize(std::string_view text, std::string_view color, bool enabled) {
    if (!enabled || color.empty()) {
        return std::string{text};
    }
    return absl::StrCat(color, text, kColorReset);
}

}  // namespace zkgas
