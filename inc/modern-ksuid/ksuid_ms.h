// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#ifndef HEADER_MODERN_KSUID_KSUID_MS_H_INCLUDED
#define HEADER_MODERN_KSUID_KSUID_MS_H_INCLUDED

#include <modern-ksuid/base62.h>

namespace mksuid {

    /**
     * K-Sortable Unique ID with 4 millisecond timestamp resolution.
     *
     * Layout: 5 byte big-endian timestamp followed by 15 bytes of payload.
     * The upper 4 timestamp bytes are seconds since ksuid_epoch, exactly as in ksuid,
     * and the last one is the number of 4ms units within that second. The result is a
     * valid KSUID: either type can be reconstructed from the other's bytes with reduced
     * precision.
     */
    class ksuid_ms {
    public:
        /// Number of bytes used by timestamp
        static constexpr size_t timestamp_bytes = 5;
        /// Number of bytes used by payload
        static constexpr size_t payload_bytes = 15;

        static_assert(timestamp_bytes + payload_bytes == ksuid_byte_length);

        /// Number of characters in string representation of KSUID
        static constexpr size_t char_length = ksuid_char_length;

    public:
        ///Constructs a zeroed out KSUID
        constexpr ksuid_ms() noexcept = default;

        ///Constructs KSUID from a string literal
        template<impl::char_like T>
        consteval ksuid_ms(const T (&src)[ksuid_ms::char_length + 1]) {
            if (src[ksuid_ms::char_length] != 0 || !impl::base62_decode(src, ksuid_ms::char_length, this->m_bytes))
                impl::invalid_constexpr_call("invalid ksuid string");
        }

        /// Returns a Max KSUID
        static constexpr ksuid_ms max() noexcept
            { return ksuid_ms("aWgEPTl1tmebfsQzFP4bxwgy80V"); }

        /**
         * Constructs KSUID from a span of 20 byte-like objects
         *
         * The bytes are stored verbatim. The sub-second unit is not validated.
         */
        template<impl::byte_like Byte>
        static constexpr ksuid_ms from_bytes(std::span<Byte, ksuid_byte_length> src) noexcept {
            ksuid_ms ret;
            std::transform(src.begin(), src.end(), ret.m_bytes.begin(), [](auto b) { return static_cast<uint8_t>(b); });
            return ret;
        }

        /// Constructs KSUID from anything convertible to a span of 20 byte-like objects
        template<impl::byte_range T>
        requires(decltype(std::span{std::declval<const T &>()})::extent == ksuid_byte_length)
        static constexpr ksuid_ms from_bytes(const T & src) noexcept {
            return ksuid_ms::from_bytes(std::span{src});
        }

        /**
         * Constructs KSUID from a raw timestamp and a payload
         *
         * Only the low 40 bits of timestamp are used: (seconds since ksuid_epoch << 8) | 4ms units.
         * The payload must be exactly payload_bytes long. This is checked at compile time
         * for fixed size spans. Dynamically sized payload of a wrong size raises std::invalid_argument.
         */
        template<impl::byte_like Byte, size_t Extent>
        static constexpr ksuid_ms from_raw(uint64_t timestamp, std::span<Byte, Extent> payload) {
            ksuid_ms ret;
            auto data = ret.m_bytes.data();
            data = impl::write_bytes(uint8_t(timestamp >> 32), data);
            data = impl::write_bytes(uint32_t(timestamp), data);
            impl::copy_payload<ksuid_ms::payload_bytes>(payload, data);
            return ret;
        }

        template<impl::byte_range T>
        static constexpr ksuid_ms from_raw(uint64_t timestamp, const T & payload) {
            return ksuid_ms::from_raw(timestamp, std::span{payload});
        }

        /// Constructs KSUID from a raw timestamp and a random payload
        MKSUID_EXPORTED static auto from_raw(uint64_t timestamp) -> ksuid_ms;

        /**
         * Constructs KSUID from Unix time in milliseconds and a payload
         *
         * The sub-second part is truncated to a multiple of 4ms. Times before ksuid_epoch
         * or more than 2^32 seconds after it wrap around silently.
         */
        template<class P>
        static constexpr ksuid_ms from_millis(int64_t unix_millis, const P & payload) {
            return ksuid_ms::from_raw(ksuid_ms::pack_millis(unix_millis), payload);
        }

        /// Constructs KSUID from Unix time in milliseconds and a random payload
        MKSUID_EXPORTED static auto from_millis(int64_t unix_millis) -> ksuid_ms;

        /// Constructs KSUID from Unix time in seconds and a payload
        template<class P>
        static constexpr ksuid_ms from_seconds(int64_t unix_seconds, const P & payload) {
            return ksuid_ms::from_millis(unix_seconds * 1'000, payload);
        }

        /// Constructs KSUID from Unix time in seconds and a random payload
        static auto from_seconds(int64_t unix_seconds) -> ksuid_ms {
            return ksuid_ms::from_millis(unix_seconds * 1'000);
        }

        /// Constructs KSUID from a time point and a payload
        template<class Duration, class P>
        static constexpr ksuid_ms from_time(std::chrono::sys_time<Duration> when, const P & payload) {
            return ksuid_ms::from_millis(std::chrono::time_point_cast<std::chrono::milliseconds>(when).time_since_epoch().count(), payload);
        }

        /// Constructs KSUID from a time point and a random payload
        template<class Duration>
        static ksuid_ms from_time(std::chrono::sys_time<Duration> when) {
            return ksuid_ms::from_millis(std::chrono::time_point_cast<std::chrono::milliseconds>(when).time_since_epoch().count());
        }

        /// Generates a KSUID for the current time with a random payload
        MKSUID_EXPORTED static auto generate() -> ksuid_ms;

        /// Resets the object to a Nil KSUID
        constexpr void clear() noexcept {
            *this = ksuid_ms();
        }

        constexpr friend auto operator==(const ksuid_ms & lhs, const ksuid_ms & rhs) noexcept -> bool = default;
        constexpr friend auto operator<=>(const ksuid_ms & lhs, const ksuid_ms & rhs) noexcept -> std::strong_ordering = default;

        /// All 20 bytes of the KSUID
        constexpr auto bytes() const noexcept -> const std::array<uint8_t, ksuid_byte_length> &
            { return this->m_bytes; }

        /// Payload portion of the KSUID
        constexpr auto payload() const noexcept -> std::span<const uint8_t, ksuid_ms::payload_bytes>
            { return std::span(this->m_bytes).subspan<ksuid_ms::timestamp_bytes, ksuid_ms::payload_bytes>(); }

        /**
         * Raw 40 bit timestamp
         *
         * The upper 32 bits are seconds since ksuid_epoch and the lower 8 the number of 4ms units
         */
        constexpr auto timestamp_raw() const noexcept -> uint64_t {
            uint64_t ret;
            impl::read_bytes(this->m_bytes.data(), ret);
            return ret >> ((sizeof(uint64_t) - ksuid_ms::timestamp_bytes) * 8);
        }

        /// Timestamp as a time point
        constexpr auto timestamp() const noexcept -> std::chrono::sys_time<std::chrono::milliseconds> {
            auto raw = int64_t(this->timestamp_raw());
            int64_t seconds = (raw >> 8) + ksuid_epoch;
            //units above 249 only come from bytes that were not produced by ksuid_ms
            int64_t millis = ((raw & 0xFF) << 2) % 1'000;
            return std::chrono::sys_time<std::chrono::milliseconds>(std::chrono::milliseconds(seconds * 1'000 + millis));
        }

        /// Timestamp as Unix time in milliseconds
        constexpr auto timestamp_millis() const noexcept -> int64_t
            { return this->timestamp().time_since_epoch().count(); }

        /// Timestamp as Unix time in seconds
        constexpr auto timestamp_seconds() const noexcept -> int64_t
            { return std::chrono::floor<std::chrono::seconds>(this->timestamp()).time_since_epoch().count(); }


        /// Parses KSUID from a span of characters
        template<impl::char_like T, size_t Extent>
        static constexpr std::optional<ksuid_ms> from_chars(std::span<const T, Extent> src) {
            ksuid_ms ret;
            if (!impl::base62_decode(src.data(), src.size(), ret.m_bytes))
                return std::nullopt;
            return ret;
        }

        /// Parses KSUID from anything convertible to a span of characters
        template<impl::char_range T>
        static constexpr auto from_chars(const T & src)
            { return ksuid_ms::from_chars(impl::as_chars(src)); }

        /// Parses KSUID from a base62 string, throws bad_ksuid_string on failure
        static auto from_base62(std::string_view src) -> ksuid_ms {
            ksuid_ms ret;
            if (auto res = impl::base62_decode(src.data(), src.size(), ret.m_bytes); !res)
                MKSUID_THROW(bad_ksuid_string(res));
            return ret;
        }


        /// Formats KSUID into a span of characters
        template<impl::char_like T, size_t Extent>
        [[nodiscard]]
        constexpr auto to_chars(std::span<T, Extent> dest) const noexcept ->
            std::conditional_t<Extent == std::dynamic_extent, bool, void> {

            if constexpr (Extent == std::dynamic_extent) {
                if (dest.size() < ksuid_ms::char_length)
                    return false;
            } else {
                static_assert(Extent >= ksuid_ms::char_length, "destination is too small");
            }

            impl::base62_encode(this->m_bytes, dest.data());

            if constexpr (Extent == std::dynamic_extent)
                return true;
        }

        /// Formats KSUID into anything convertible to a span of characters
        template<impl::writable_char_range T>
        [[nodiscard]]
        constexpr auto to_chars(T & dest) const noexcept {
            return this->to_chars(std::span{dest});
        }

        /// Returns a character array with formatted KSUID
        template<impl::char_like T = char>
        constexpr auto to_chars() const noexcept -> std::array<T, ksuid_ms::char_length> {
            std::array<T, ksuid_ms::char_length> ret;
            this->to_chars(ret);
            return ret;
        }

        template<impl::char_like T = char>
    #if __cpp_lib_constexpr_string >= 201907L
        constexpr
    #endif
        /// Returns a string with formatted KSUID
        auto to_string() const -> std::basic_string<T>
        {
            std::basic_string<T> ret(ksuid_ms::char_length, T(0));
            (void)to_chars(ret);
            return ret;
        }

        /// Returns the canonical base62 string
        auto to_base62() const -> std::string
            { return this->to_string(); }

        /// Prints KSUID into an ostream
        template<impl::char_like T>
        friend std::basic_ostream<T> & operator<<(std::basic_ostream<T> & str, const ksuid_ms & val) {
            return impl::write_ksuid(str, val);
        }

        /// Reads KSUID from an istream
        template<impl::char_like T>
        friend std::basic_istream<T> & operator>>(std::basic_istream<T> & str, ksuid_ms & val) {
            return impl::read_ksuid(str, val);
        }

        /// Returns hash code for the KSUID
        friend constexpr size_t hash_value(const ksuid_ms & val) noexcept {
            return impl::hash_ksuid_bytes(val.m_bytes);
        }

    private:
        static constexpr uint64_t pack_millis(int64_t unix_millis) noexcept {
            int64_t seconds = unix_millis / 1'000 - ksuid_epoch;
            int64_t units = (unix_millis % 1'000) >> 2;
            return uint64_t(((seconds << 8) & 0xFF'FFFF'FF00) | units);
        }

    private:
        std::array<uint8_t, ksuid_byte_length> m_bytes{};
    };

    static_assert(sizeof(ksuid_ms) == ksuid_byte_length);
    static_assert(ksuid_like<ksuid_ms>);
}

/// std::hash specialization for ksuid_ms
template<>
struct std::hash<mksuid::ksuid_ms> {

    constexpr size_t operator()(const mksuid::ksuid_ms & val) const noexcept {
        return hash_value(val);
    }
};


#if MKSUID_SUPPORTS_STD_FORMAT

/// ksuid_ms formatter for std::format
template<class CharT>
struct std::formatter<::mksuid::ksuid_ms, CharT> :
    public ::mksuid::impl::ksuid_formatter_base<std::formatter<::mksuid::ksuid_ms, CharT>, ::mksuid::ksuid_ms, CharT>
{
    [[noreturn]] void raise_exception(const char * message) {
        MKSUID_THROW(std::format_error(message));
    }
};

#endif

#if MKSUID_SUPPORTS_FMT_FORMAT

/// ksuid_ms formatter for fmt::format
template<class CharT>
struct fmt::formatter<::mksuid::ksuid_ms, CharT> :
    public ::mksuid::impl::ksuid_formatter_base<fmt::formatter<::mksuid::ksuid_ms, CharT>, ::mksuid::ksuid_ms, CharT>
{
    void raise_exception(const char * message) {
        FMT_THROW(fmt::format_error(message));
    }
};

#endif

#endif
