// Copyright 2025 The zkgas Authors
// SPDX-License-Identifier: Apache-2.0

#include "block_id.hpp"

#include <stdexcept>

#include <absl/strings/match.h>
#include <absl/strings/numbers.h>

#include <zkgas/rpc/json/types.hpp>

namespace zkgas::rpc {

std::string BlockNumOrTag::to_string() const {
    if (is_number()) {
        return to_quantity(number());
    }
    return tag();
}

void BlockNumOrTag::parse(std::string_view block_num_or_tag) {
    if (block_num_or_tag == kEarliestBlockId) {
        value_ = kEarliestBlockNum;
    } else if (block_num_or_tag == kLatestBlockId ||
               block_num_or_tag == kPendingBlockId ||
               block_num_or_tag == kFinalizedBlockId ||
               block_num_or_tag == kSafeBlockId) {
        value_ = std::string{block_num_or_tag};
    } else if (absl::StartsWithIgnoreCase(block_num_or_tag, "0x")) {
        value_ = from_quantity(block_num_or_tag);
    } else {
        BlockNum block_num{0};
        if (!absl::SimpleAtoi(block_num_or_tag, &block_num)) {
            throw std::invalid_argument{"invalid block identifier: " + std::string{block_num_or_tag}};
        }
        value_ = block_num;
    }
}

std::ostream& operator<<(std::ostream& out, const BlockNumOrTag& block_id) {
    out << block_id.to_string();
    return out;
}

}  // namespace zkgas::rpc
