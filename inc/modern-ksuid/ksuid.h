// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#ifndef HEADER_MODERN_KSUID_KSUID_H_INCLUDED
#define HEADER_MODERN_KSUID_KSUID_H_INCLUDED

#include <modern-ksuid/base62.h>

namespace mksuid {

    /**
     * K-Sortable Unique ID with one second timestamp resolution.
     *
     * Layout: 4 byte big-endian count of seconds since ksuid_epoch followed by 16 bytes of payload.
     * This is the layout used by Segment's reference implementation.
     */
    class ksuid {
    public:
        /// Number of bytes used by timestamp
        static constexpr size_t timestamp_bytes = 4;
        /// Number of bytes used by payload
        static constexpr size_t payload_bytes = 16;

        static_assert(timestamp_bytes + payload_bytes == ksuid_byte_length);

        /// Number of characters in string representation of KSUID
        static constexpr size_t char_length = ksuid_char_length;

    public:
        ///Constructs a zeroed out KSUID
        constexpr ksuid() noexcept = default;

        ///Constructs KSUID from a string literal
        template<impl::char_like T>
        consteval ksuid(const T (&src)[ksuid::char_length + 1]) {
            if (src[ksuid::char_length] != 0 || !impl::base62_decode(src, ksuid::char_length, this->m_bytes))
                impl::invalid_constexpr_call("invalid ksuid string");
        }

        /// Returns a Max KSUID
        static constexpr ksuid max() noexcept
            { return ksuid("aWgEPTl1tmebfsQzFP4bxwgy80V"); }

        /**
         * Constructs KSUID from a span of 20 byte-like objects
         *
         * The bytes are stored verbatim.
         */
        template<impl::byte_like Byte>
        static constexpr ksuid from_bytes(std::span<Byte, ksuid_byte_length> src) noexcept {
            ksuid ret;
            std::transform(src.begin(), src.end(), ret.m_bytes.begin(), [](auto b) { return static_cast<uint8_t>(b); });
            return ret;
        }

        /// Constructs KSUID from anything convertible to a span of 20 byte-like objects
        template<impl::byte_range T>
        requires(decltype(std::span{std::declval<const T &>()})::extent == ksuid_byte_length)
        static constexpr ksuid from_bytes(const T & src) noexcept {
            return ksuid::from_bytes(std::span{src});
        }

        /**
         * Constructs KSUID from a raw timestamp (seconds since ksuid_epoch) and a payload
         *
         * The payload must be exactly payload_bytes long. This is checked at compile time
         * for fixed size spans. Dynamically sized payload of a wrong size raises std::invalid_argument.
         */
        template<impl::byte_like Byte, size_t Extent>
        static constexpr ksuid from_raw(uint32_t timestamp, std::span<Byte, Extent> payload) {
            ksuid ret;
            auto data = impl::write_bytes(timestamp, ret.m_bytes.data());
            impl::copy_payload<ksuid::payload_bytes>(payload, data);
            return ret;
        }

        template<impl::byte_range T>
        static constexpr ksuid from_raw(uint32_t timestamp, const T & payload) {
            return ksuid::from_raw(timestamp, std::span{payload});
        }

        /// Constructs KSUID from a raw timestamp (seconds since ksuid_epoch) and a random payload
        MKSUID_EXPORTED static auto from_raw(uint32_t timestamp) -> ksuid;

        /**
         * Constructs KSUID from Unix time in seconds and a payload
         *
         * Times before ksuid_epoch or more than 2^32 seconds after it wrap around silently.
         */
        template<class P>
        static constexpr ksuid from_seconds(int64_t unix_seconds, const P & payload) {
            return ksuid::from_raw(uint32_t(unix_seconds - ksuid_epoch), payload);
        }

        /// Constructs KSUID from Unix time in seconds and a random payload
        MKSUID_EXPORTED static auto from_seconds(int64_t unix_seconds) -> ksuid;

        /// Constructs KSUID from a time point and a payload
        template<class Duration, class P>
        static constexpr ksuid from_time(std::chrono::sys_time<Duration> when, const P & payload) {
            return ksuid::from_seconds(std::chrono::floor<std::chrono::seconds>(when).time_since_epoch().count(), payload);
        }

        /// Constructs KSUID from a time point and a random payload
        template<class Duration>
        static ksuid from_time(std::chrono::sys_time<Duration> when) {
            return ksuid::from_seconds(std::chrono::floor<std::chrono::seconds>(when).time_since_epoch().count());
        }

        /// Generates a KSUID for the current time with a random payload
        MKSUID_EXPORTED static auto generate() -> ksuid;

        /// Resets the object to a Nil KSUID
        constexpr void clear() noexcept {
            *this = ksuid();
        }

        constexpr friend auto operator==(const ksuid & lhs, const ksuid & rhs) noexcept -> bool = default;
        constexpr friend auto operator<=>(const ksuid & lhs, const ksuid & rhs) noexcept -> std::strong_ordering = default;

        /// All 20 bytes of the KSUID
        constexpr auto bytes() const noexcept -> const std::array<uint8_t, ksuid_byte_length> &
            { return this->m_bytes; }

        /// Payload portion of the KSUID
        constexpr auto payload() const noexcept -> std::span<const uint8_t, ksuid::payload_bytes>
            { return std::span(this->m_bytes).subspan<ksuid::timestamp_bytes, ksuid::payload_bytes>(); }

        /// Raw timestamp: seconds since ksuid_epoch
        constexpr auto timestamp_raw() const noexcept -> uint32_t {
            uint32_t ret;
            impl::read_bytes(this->m_bytes.data(), ret);
            return ret;
        }

        /// Timestamp as a time point
        constexpr auto timestamp() const noexcept -> std::chrono::sys_seconds
            { return std::chrono::sys_seconds(std::chrono::seconds(this->timestamp_seconds())); }

        /// Timestamp as Unix time in seconds
        constexpr auto timestamp_seconds() const noexcept -> int64_t
            { return int64_t(this->timestamp_raw()) + ksuid_epoch; }


        /// Parses KSUID from a span of characters
        template<impl::char_like T, size_t Extent>
        static constexpr std::optional<ksuid> from_chars(std::span<const T, Extent> src) {
            ksuid ret;
            if (!impl::base62_decode(src.data(), src.size(), ret.m_bytes))
                return std::nullopt;
            return ret;
        }

        /// Parses KSUID from anything convertible to a span of characters
        template<impl::char_range T>
        static constexpr auto from_chars(const T & src)
            { return ksuid::from_chars(impl::as_chars(src)); }

        /// Parses KSUID from a base62 string, throws bad_ksuid_string on failure
        static auto from_base62(std::string_view src) -> ksuid {
            ksuid ret;
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
                if (dest.size() < ksuid::char_length)
                    return false;
            } else {
                static_assert(Extent >= ksuid::char_length, "destination is too small");
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
        constexpr auto to_chars() const noexcept -> std::array<T, ksuid::char_length> {
            std::array<T, ksuid::char_length> ret;
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
            std::basic_string<T> ret(ksuid::char_length, T(0));
            (void)to_chars(ret);
            return ret;
        }

        /// Returns the canonical base62 string
        auto to_base62() const -> std::string
            { return this->to_string(); }

        /// Prints KSUID into an ostream
        template<impl::char_like T>
        friend std::basic_ostream<T> & operator<<(std::basic_ostream<T> & str, const ksuid & val) {
            return impl::write_ksuid(str, val);
        }

        /// Reads KSUID from an istream
        template<impl::char_like T>
        friend std::basic_istream<T> & operator>>(std::basic_istream<T> & str, ksuid & val) {
            return impl::read_ksuid(str, val);
        }

        /// Returns hash code for the KSUID
        friend constexpr size_t hash_value(const ksuid & val) noexcept {
            return impl::hash_ksuid_bytes(val.m_bytes);
        }

    private:
        std::array<uint8_t, ksuid_byte_length> m_bytes{};
    };

    static_assert(sizeof(ksuid) == ksuid_byte_length);
    static_assert(ksuid_like<ksuid>);
}

/// std::hash specialization for ksuid
template<>
struct std::hash<mksuid::ksuid> {

    constexpr size_t operator()(const mksuid::ksuid & val) const noexcept {
        return hash_value(val);
    }
};


#if MKSUID_SUPPORTS_STD_FORMAT

/// ksuid formatter for std::format
template<class CharT>
struct std::formatter<::mksuid::ksuid, CharT> :
    public ::mksuid::impl::ksuid_formatter_base<std::formatter<::mksuid::ksuid, CharT>, ::mksuid::ksuid, CharT>
{
    [[noreturn]] void raise_exception(const char * message) {
        MKSUID_THROW(std::format_error(message));
    }
};

#endif

#if MKSUID_SUPPORTS_FMT_FORMAT

/// ksuid formatter for fmt::format
template<class CharT>
struct fmt::formatter<::mksuid::ksuid, CharT> :
    public ::mksuid::impl::ksuid_formatter_base<fmt::formatter<::mksuid::ksuid, CharT>, ::mksuid::ksuid, CharT>
{
    void raise_exception(const char * message) {
        FMT_THROW(fmt::format_error(message));
    }
};

#endif

#endif
