// Copyright 2025 The zkgas Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string>

#include <gmock/gmock.h>

#include <zkgas/rpc/client/transport.hpp>

namespace zkgas::rpc::test_util {

class MockTransport : public Transport {
  public:
    MOCK_METHOD((std::string), post, (const std::string&), (override));
};

}  // namespace zkgas::rpc::test_util
