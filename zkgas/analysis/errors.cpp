// Copyright 2025 The zkgas Authors
// SPDX-License-Identifier: Apache-2.0

#include "errors.hpp"

namespace zkgas::analysis {

InvalidRangeError::InvalidRangeError(BlockNum head_block_num, uint64_t count)
    : std::out_of_range("cannot analyze " + std::to_string(count) + " blocks: chain head is block " +
                        std::to_string(head_block_num) + " so only " + std::to_string(head_block_num + 1) +
                        " blocks exist"),
      head_block_num_{head_block_num},
      count_{count} {}

}  // namespace zkgas::analysis
