// Copyright 2025 The zkgas Authors
// SPDX-License-Identifier: Apache-2.0

#include "clock_time.hpp"

#include <absl/time/clock.h>
#include <absl/time/time.h>

namespace zkgas::clock_time {

std::string to_iso8601_utc(uint64_t unix_timestamp) {
    const absl::Time time{absl::FromUnixSeconds(static_cast<int64_t>(unix_timestamp))};
    return absl::FormatTime("%Y-%m-%dT%H:%M:%SZ", time, absl::UTCTimeZone());
}

std::string now_iso8601_utc() {
    return absl::FormatTime("%Y-%m-%dT%H:%M:%E6SZ", absl::Now(), absl::UTCTimeZone());
}

}  // namespace zkgas::clock_time
