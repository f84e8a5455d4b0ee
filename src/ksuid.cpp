// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#include <modern-ksuid/ksuid.h>

using namespace mksuid;

auto ksuid::from_raw(uint32_t timestamp) -> ksuid {
    std::array<uint8_t, ksuid::payload_bytes> payload;
    impl::fill_random(payload);
    return ksuid::from_raw(timestamp, payload);
}

auto ksuid::from_seconds(int64_t unix_seconds) -> ksuid {
    return ksuid::from_raw(uint32_t(unix_seconds - ksuid_epoch));
}

auto ksuid::generate() -> ksuid {
    return ksuid::from_time(std::chrono::system_clock::now());
}
