// Copyright 2025 The zkgas Authors
// SPDX-License-Identifier: Apache-2.0

#include "block_id.hpp"

#include <sstream>
#include <stdexcept>

#include <catch2/catch_test_macros.hpp>

namespace zkgas::rpc {

TEST_CASE("BlockNumOrTag", "[zkgas][rpc][types]") {
    SECTION("from number") {
        BlockNumOrTag block_id{BlockNum{1'000}};
        CHECK(block_id.is_number());
        CHECK(!block_id.is_tag());
        CHECK(block_id.number() == 1'000);
        CHECK(block_id.tag().empty());
        CHECK(block_id.to_string() == "0x3e8");
    }

    SECTION("from hex quantity") {
        BlockNumOrTag block_id{"0x3e8"};
        CHECK(block_id.is_number());
        CHECK(block_id.number() == 1'000);
        CHECK(block_id == BlockNumOrTag{BlockNum{1'000}});
    }

    SECTION("from decimal") {
        BlockNumOrTag block_id{"1000"};
        CHECK(block_id.is_number());
        CHECK(block_id.number() == 1'000);
    }

    SECTION("earliest is block zero") {
        BlockNumOrTag block_id{kEarliestBlockId};
        CHECK(block_id.is_number());
        CHECK(block_id.number() == kEarliestBlockNum);
        CHECK(block_id.to_string() == "0x0");
    }

    SECTION("tags") {
        for (const auto tag : {kLatestBlockId, kPendingBlockId, kSafeBlockId, kFinalizedBlockId}) {
            BlockNumOrTag block_id{tag};
            CHECK(block_id.is_tag());
            CHECK(!block_id.is_number());
            CHECK(block_id.tag() == tag);
            CHECK(block_id.number() == 0);
            CHECK(block_id.to_string() == tag);
        }
        CHECK(BlockNumOrTag::latest() == BlockNumOrTag{kLatestBlockId});
    }

    SECTION("invalid") {
        CHECK_THROWS_AS(BlockNumOrTag{"newest"}, std::invalid_argument);
        CHECK_THROWS_AS(BlockNumOrTag{""}, std::invalid_argument);
        CHECK_THROWS_AS(BlockNumOrTag{"0xg"}, std::invalid_argument);
    }

    SECTION("stream output") {
        std::ostringstream oss;
        oss << BlockNumOrTag{BlockNum{255}} << " " << BlockNumOrTag::latest();
        CHECK(oss.str() == "0xff latest");
    }
}

}  // namespace zkgas::rpc
