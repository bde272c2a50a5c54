// Copyright 2025 The zkgas Authors
// SPDX-License-Identifier: Apache-2.0

#include "progress.hpp"

namespace zkgas::analysis {

double Progress::percent() const {
    if (total == 0) {
        return 0.0;
    }
    return static_cast<double>(processed) / static_cast<double>(total) * 100.0;
}

}  // namespace zkgas::analysis
