// Copyright 2025 The zkgas Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <iostream>
#include <string>

namespace zkgas::rpc {

struct Error {
    int code{0};
    std::string message;
};

std::ostream& operator<<(std::ostream& out, const Error& error);

}  // namespace zkgas::rpc
