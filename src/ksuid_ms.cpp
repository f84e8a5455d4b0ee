// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#include <modern-ksuid/ksuid_ms.h>

using namespace mksuid;

auto ksuid_ms::from_raw(uint64_t timestamp) -> ksuid_ms {
    std::array<uint8_t, ksuid_ms::payload_bytes> payload;
    impl::fill_random(payload);
    return ksuid_ms::from_raw(timestamp, payload);
}

auto ksuid_ms::from_millis(int64_t unix_millis) -> ksuid_ms {
    return ksuid_ms::from_raw(ksuid_ms::pack_millis(unix_millis));
}

auto ksuid_ms::generate() -> ksuid_ms {
    return ksuid_ms::from_time(std::chrono::system_clock::now());
}
