// Copyright 2025 The zkgas Authors
// SPDX-License-Identifier: Apache-2.0

#include "error.hpp"

namespace zkgas::rpc {

std::ostream& operator<<(std::ostream& out, const Error& error) {
    out << " code: " << error.code << " message: " << error.message;
    return out;
}

}  // namespace zkgas::rpc
