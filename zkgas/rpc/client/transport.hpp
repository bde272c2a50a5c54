// Copyright 2025 The zkgas Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string>

namespace zkgas::rpc {

//! Carries one serialized JSON-RPC request to the node and brings back the serialized response
class Transport {
  public:
    virtual ~Transport() = default;

    //! Blocking exchange of request and response bodies
    //! \throws boost::system::system_error on network failure or timeout
    //! \throws HttpStatusError if the node does not answer with HTTP 200
    virtual std::string post(const std::string& body) = 0;
};

}  // namespace zkgas::rpc
