// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#ifndef HEADER_MODERN_KSUID_COMMON_H_INCLUDED
#define HEADER_MODERN_KSUID_COMMON_H_INCLUDED

// Config macros:
//
// The following macros must be defined identically when using and building this library:
//
// MKSUID_USE_EXCEPTIONS - auto-detected. Set to 1 to force usage of exceptions and 0 to force not using them
// MKSUID_SHARED - set to 1 when using/building a shared library version of the library
//
// The following macro should be set when building the library itself but not when using it:
//
// MKSUID_BUILDING_MKSUID - set 1 if building the library itself.
//
// The following macro is optional when using the library:
//
// MKSUID_USE_FMT - set to 1 to require fmt::formatter support. Fails compilation if <fmt/format.h>
//                  was not included before this library's headers.

#include <cstdint>
#include <cstring>
#include <cstdio>
#include <cstdlib>

#include <concepts>
#include <compare>
#include <array>
#include <span>
#include <string>
#include <string_view>
#include <optional>
#include <limits>
#include <chrono>
#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <istream>
#include <ostream>

#if !defined(MKSUID_USE_EXCEPTIONS)
    #if defined(__GNUC__) && !defined(__EXCEPTIONS)
        #define MKSUID_USE_EXCEPTIONS 0
    #elif defined(__clang__) && !defined(__cpp_exceptions)
        #define MKSUID_USE_EXCEPTIONS 0
    #elif defined(_MSC_VER) && !_HAS_EXCEPTIONS
        #define MKSUID_USE_EXCEPTIONS 0
    #else
        #define MKSUID_USE_EXCEPTIONS 1
    #endif
#endif

#if MKSUID_SHARED
    #if defined(_WIN32) || defined(_WIN64)
        #if MKSUID_BUILDING_MKSUID
            #define MKSUID_EXPORTED __declspec(dllexport)
        #else
            #define MKSUID_EXPORTED __declspec(dllimport)
        #endif
    #elif defined(__GNUC__)
        #define MKSUID_EXPORTED [[gnu::visibility("default")]]
    #else
        #define MKSUID_EXPORTED
    #endif
#else
    #define MKSUID_EXPORTED
#endif


//See https://github.com/llvm/llvm-project/issues/77773 for the sad story of how feature test
//macros are useless with libc++
#if (__cpp_lib_format >= 201907L || (defined(_LIBCPP_VERSION) && _LIBCPP_VERSION >= 170000)) && __has_include(<format>)

    #define MKSUID_SUPPORTS_STD_FORMAT 1

#endif

#if defined(FMT_VERSION) && FMT_VERSION >= 60000 && defined(FMT_THROW)

    #define MKSUID_SUPPORTS_FMT_FORMAT 1

#endif

#if MKSUID_USE_FMT && !MKSUID_SUPPORTS_FMT_FORMAT

    #error "MKSUID_USE_FMT is requested but fmt library (of version >= 6.0) is not detected. Did you forget to include <fmt/format.h> before this header?"

#endif

#if MKSUID_SUPPORTS_STD_FORMAT
    #include <format>
#endif

namespace mksuid
{
    /// KSUID epoch in Unix seconds (2014-05-13T16:53:20Z)
    inline constexpr int64_t ksuid_epoch = 1'400'000'000;

    /// Size of any KSUID in bytes
    inline constexpr size_t ksuid_byte_length = 20;

    /// Number of characters in string representation of any KSUID
    inline constexpr size_t ksuid_char_length = 27;

    namespace impl {
        template<class T, size_t Extent>
        std::true_type is_span_helper(std::span<T, Extent> * x);

        std::false_type is_span_helper(...);

        template<class T>
        constexpr bool is_span = decltype(is_span_helper((T *)nullptr))::value;

        template<class T>
        concept byte_like = std::is_standard_layout_v<T> &&
                            sizeof(T) == sizeof(uint8_t) &&
        requires {
            static_cast<T>(uint8_t{});
            static_cast<uint8_t>(T{});
        };

        static_assert(byte_like<char>);
        static_assert(byte_like<unsigned char>);
        static_assert(byte_like<signed char>);
        static_assert(byte_like<std::byte>);

        template<class T>
        concept char_like = std::is_same_v<T, char> || std::is_same_v<T, wchar_t> ||
                            std::is_same_v<T, char8_t> || std::is_same_v<T, char16_t> || std::is_same_v<T, char32_t>;

        template<class T>
        concept byte_range = !is_span<T> && requires(const T & x) {
            std::span{x};
            requires byte_like<std::remove_cvref_t<decltype(*std::span{x}.begin())>>;
        };

        void invalid_constexpr_call(const char *);

        #if MKSUID_USE_EXCEPTIONS
            #define MKSUID_THROW(x) throw x
        #else
            [[noreturn]] inline void fail(const char* message) {
                fprintf(stderr, "mksuid: fatal error: %s", message);
                abort();
            }
            #define MKSUID_THROW(x) ::mksuid::impl::fail((x).what())
        #endif

        template<std::same_as<size_t> S>
        constexpr size_t hash_combine(S prev, S next) {
            constexpr auto digits = std::numeric_limits<S>::digits;
            static_assert(digits == 64 || digits == 32);

            if constexpr (digits == 64) {
                S x = prev + 0x9e3779b9 + next;
                const S m = 0xe9846af9b1a615d;
                x ^= x >> 32;
                x *= m;
                x ^= x >> 32;
                x *= m;
                x ^= x >> 28;
                return x;
            } else {
                S x = prev + 0x9e3779b9 + next;
                const S m1 = 0x21f0aaad;
                const S m2 = 0x735a2d97;
                x ^= x >> 16;
                x *= m1;
                x ^= x >> 15;
                x *= m2;
                x ^= x >> 15;
                return x;
            }
        }

        template<impl::byte_like Byte, class T>
        constexpr const Byte * read_bytes(const Byte * bytes, T & val) noexcept {
            T tmp = uint8_t(*bytes++);
            for(unsigned i = 0; i < sizeof(T) - 1; ++i)
                tmp = (tmp << 8) | uint8_t(*bytes++);
            val = tmp;
            return bytes;
        }

        template<impl::byte_like Byte, class T>
        constexpr Byte * write_bytes(T val, Byte * bytes) noexcept {
            bytes[sizeof(T) - 1] = Byte(static_cast<uint8_t>(val));
            if constexpr (sizeof(T) > 1) {
                for(unsigned i = 1; i != sizeof(T); ++i) {
                    val >>= 8;
                    bytes[sizeof(T) - i - 1] = Byte(static_cast<uint8_t>(val));
                }
            }
            return bytes + sizeof(T);
        }

        // Copies a caller supplied payload that must be exactly Size bytes long.
        // Fixed size spans are checked at compile time, dynamic ones at runtime.
        template<size_t Size, impl::byte_like Byte, size_t Extent>
        constexpr void copy_payload(std::span<Byte, Extent> src, uint8_t * dest) {
            if constexpr (Extent == std::dynamic_extent) {
                if (src.size() != Size)
                    MKSUID_THROW(std::invalid_argument("ksuid payload has invalid size"));
            } else {
                static_assert(Extent == Size, "ksuid payload has invalid size");
            }
            std::transform(src.begin(), src.end(), dest, [](auto b) { return static_cast<uint8_t>(b); });
        }

        // Fills dest from the operating system CSPRNG. Never falls back to anything weaker.
        MKSUID_EXPORTED void fill_random(std::span<uint8_t> dest);
    }

    /// Interface shared by all KSUID flavors
    template<class T>
    concept ksuid_like = std::regular<T> && std::totally_ordered<T> && requires(const T & val) {
        requires T::timestamp_bytes + T::payload_bytes == ksuid_byte_length;
        { val.bytes() } -> std::same_as<const std::array<uint8_t, ksuid_byte_length> &>;
        { val.payload() } -> std::same_as<std::span<const uint8_t, T::payload_bytes>>;
        { val.timestamp() } -> std::convertible_to<std::chrono::sys_time<std::chrono::milliseconds>>;
        { val.timestamp_seconds() } -> std::same_as<int64_t>;
        { T::from_bytes(val.bytes()) } -> std::same_as<T>;
        { T::from_chars(std::string_view{}) } -> std::same_as<std::optional<T>>;
        { val.to_chars() } -> std::same_as<std::array<char, ksuid_char_length>>;
        { val.to_string() } -> std::same_as<std::string>;
    };
}

#endif
