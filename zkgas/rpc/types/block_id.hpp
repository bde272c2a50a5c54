// Copyright 2025 The zkgas Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <iostream>
#include <string>
#include <string_view>
#include <variant>

#include <zkgas/core/common/base.hpp>

namespace zkgas::rpc {

inline constexpr std::string_view kEarliestBlockId{"earliest"};
inline constexpr std::string_view kLatestBlockId{"latest"};
inline constexpr std::string_view kPendingBlockId{"pending"};
inline constexpr std::string_view kSafeBlockId{"safe"};
inline constexpr std::string_view kFinalizedBlockId{"finalized"};

//! Identifies a block either by its number or by one of the JSON-RPC block tags
class BlockNumOrTag {
  public:
    //! Build from the textual form: a block tag, a 0x-prefixed hex quantity or a decimal number
    //! \throws std::invalid_argument if the text is none of the above
    explicit BlockNumOrTag(std::string_view block_num_or_tag) { parse(block_num_or_tag); }
    explicit BlockNumOrTag(BlockNum block_num) noexcept : value_{block_num} {}

    static BlockNumOrTag latest() { return BlockNumOrTag{kLatestBlockId}; }

    bool is_number() const {
        return std::holds_alternative<BlockNum>(value_);
    }

    BlockNum number() const {
        return is_number() ? *std::get_if<BlockNum>(&value_) : 0;
    }

    bool is_tag() const {
        return std::holds_alternative<std::string>(value_);
    }

    std::string tag() const {
        return is_tag() ? *std::get_if<std::string>(&value_) : "";
    }

    //! The representation expected as JSON-RPC parameter, i.e. hex quantity or tag
    std::string to_string() const;

    friend bool operator==(const BlockNumOrTag&, const BlockNumOrTag&) = default;

  private:
    void parse(std::string_view block_num_or_tag);

    std::variant<BlockNum, std::string> value_;
};

std::ostream& operator<<(std::ostream& out, const BlockNumOrTag& block_id);

}  // namespace zkgas::rpc
