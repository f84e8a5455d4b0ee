// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#include <modern-ksuid/common.h>

#include <system_error>

#if defined(_WIN32)
    #define WIN32_LEAN_AND_MEAN
    #include <windows.h>
    #include <bcrypt.h>

    #pragma comment(lib, "bcrypt.lib")
#else
    #include <cerrno>
    #include <unistd.h>
    #if __has_include(<sys/random.h>)
        #include <sys/random.h>
    #endif
#endif

namespace mksuid::impl {

#if defined(_WIN32)

    void fill_random(std::span<uint8_t> dest) {
        auto status = BCryptGenRandom(nullptr, dest.data(), ULONG(dest.size()), BCRYPT_USE_SYSTEM_PREFERRED_RNG);
        if (status < 0)
            MKSUID_THROW(std::system_error(int(status), std::system_category(), "BCryptGenRandom failed"));
    }

#else

    void fill_random(std::span<uint8_t> dest) {
        //getentropy refuses requests larger than 256 bytes
        constexpr size_t max_chunk = 256;

        while (!dest.empty()) {
            auto chunk = std::min(dest.size(), max_chunk);
            if (getentropy(dest.data(), chunk) != 0)
                MKSUID_THROW(std::system_error(errno, std::system_category(), "getentropy failed"));
            dest = dest.subspan(chunk);
        }
    }

#endif

}
