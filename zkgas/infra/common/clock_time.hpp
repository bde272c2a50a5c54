// Copyright 2025 The zkgas Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <string>

namespace zkgas::clock_time {

//! Format a Unix timestamp as UTC ISO-8601 with seconds precision, e.g. 2024-01-01T00:00:00Z
std::string to_iso8601_utc(uint64_t unix_timestamp);

//! Format the current instant as UTC ISO-8601 with microseconds precision, e.g. 2024-01-01T00:00:00.123456Z
std::string now_iso8601_utc();

}  // namespace zkgas::clock_time
