// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#ifndef HEADER_MODERN_KSUID_BASE62_H_INCLUDED
#define HEADER_MODERN_KSUID_BASE62_H_INCLUDED

#include <modern-ksuid/common.h>

#include <bit>
#include <vector>

namespace mksuid {

    /// Outcome of decoding a base62 KSUID string
    enum class decode_status {
        ok,
        /// a character is not part of the base62 alphabet
        invalid_character,
        /// the decoded byte sequence is not 20 bytes long
        unexpected_length
    };

    struct decode_result {
        decode_status status;
        /**
         * For decode_status::invalid_character the position of the offending character.
         * For decode_status::unexpected_length the decoded length in bytes.
         * Otherwise ksuid_byte_length.
         */
        size_t value;

        constexpr explicit operator bool() const noexcept
            { return this->status == decode_status::ok; }
    };

    /// Exception thrown by the throwing parse functions
    class bad_ksuid_string : public std::invalid_argument {
    public:
        explicit bad_ksuid_string(decode_result res):
            std::invalid_argument(bad_ksuid_string::describe(res)),
            m_result(res)
        {}

        auto result() const noexcept -> decode_result
            { return m_result; }

    private:
        static auto describe(decode_result res) -> std::string {
            switch(res.status) {
            case decode_status::invalid_character:
                return "invalid ksuid string: character at position " + std::to_string(res.value) + " is not base62";
            case decode_status::unexpected_length:
                return "invalid ksuid string: unexpected decoded length " + std::to_string(res.value);
            case decode_status::ok:
                break;
            }
            return "invalid ksuid string";
        }
    private:
        decode_result m_result;
    };

    namespace impl {

        template<char_like C> struct base62_char_traits {
            static constexpr unsigned max = 128;

            static constexpr C cl_br = C(u8'}');
        };

        template<> struct base62_char_traits<char> {
            static constexpr unsigned max = ('a' == u8'a' ? 128 : 256);

            static constexpr char cl_br = '}';
        };

        template<> struct base62_char_traits<wchar_t> {
            static constexpr unsigned max = (L'a' == u8'a' ? 128 : 256);

            static constexpr wchar_t cl_br = L'}';
        };


        #define MKSUID_BASE62_ALPHABET(...) \
                __VA_ARGS__##"0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz"

        template<class C, size_t N>
        static consteval auto make_reverse_base62_alphabet(const C (&chars)[N]) {
            using tr = base62_char_traits<C>;

            std::array<uint8_t, tr::max> ret;
            for (size_t i = 0; i < std::size(ret); ++i)
                ret[i] = uint8_t(std::find(std::begin(chars), std::end(chars) - 1, C(i)) - std::begin(chars));
            return ret;
        }

        class base62_alphabet {
        private:
            static constexpr const char narrow[] = MKSUID_BASE62_ALPHABET();
            static constexpr const wchar_t wide[] = MKSUID_BASE62_ALPHABET(L);
            static constexpr const char8_t utf[] = MKSUID_BASE62_ALPHABET(u8);

            static constexpr auto reverse_narrow = make_reverse_base62_alphabet(narrow);
            static constexpr auto reverse_wide = make_reverse_base62_alphabet(wide);
            static constexpr auto reverse_utf = make_reverse_base62_alphabet(utf);

        public:
            static constexpr size_t size = std::size(utf) - 1;

        public:
            template<impl::char_like C>
            static constexpr C encode(uint8_t idx) noexcept {
                if constexpr (std::is_same_v<C, char32_t> ||
                              std::is_same_v<C, char16_t> ||
                              std::is_same_v<C, char8_t> ||
                              (std::is_same_v<C, wchar_t> && L'a' == u8'a') ||
                              (std::is_same_v<C, wchar_t> && 'a' == u8'a')) {
                    return C(utf[idx]);
                } else if constexpr (std::is_same_v<C, wchar_t>) {
                    return wide[idx];
                } else {
                    return narrow[idx];
                }
            }

            template<impl::char_like C>
            static constexpr uint8_t decode(C c) noexcept {
                if constexpr (std::is_same_v<C, char32_t> ||
                              std::is_same_v<C, char16_t> ||
                              std::is_same_v<C, char8_t> ||
                              (std::is_same_v<C, wchar_t> && L'a' == u8'a') ||
                              (std::is_same_v<C, wchar_t> && 'a' == u8'a')) {

                    if (unsigned(c) >= std::size(reverse_utf))
                        return size;
                    return reverse_utf[unsigned(c)];

                } else if constexpr (std::is_same_v<C, wchar_t>) {

                    if (unsigned(c) >= std::size(reverse_wide))
                        return size;
                    return reverse_wide[unsigned(c)];

                } else {

                    if (unsigned(c) >= std::size(reverse_narrow))
                        return size;
                    return reverse_narrow[unsigned(c)];
                }
            }
        };

        static_assert(base62_alphabet::size == 62);

        #undef MKSUID_BASE62_ALPHABET

        // 160-bit unsigned number, most significant part first
        class base62_number {
        private:
            static constexpr size_t part_count = ksuid_byte_length / sizeof(uint32_t);
        public:
            constexpr base62_number() = default;

            constexpr base62_number(std::span<const uint8_t, ksuid_byte_length> src) {
                const uint8_t * data = src.data();
                for (auto & part: m_parts)
                    data = read_bytes(data, part);
            }

            constexpr void get_bytes(std::span<uint8_t, ksuid_byte_length> dst) const {
                uint8_t * data = dst.data();
                for (auto part: m_parts)
                    data = write_bytes(part, data);
            }

            // Returns whatever did not fit into 160 bits
            constexpr uint32_t push_base62_digit(uint8_t digit) {
                uint64_t carry = digit;
                for (size_t i = part_count; i != 0; --i) {
                    uint64_t val = uint64_t(m_parts[i - 1]) * base62_alphabet::size + carry;
                    m_parts[i - 1] = uint32_t(val);
                    carry = val >> 32;
                }
                return uint32_t(carry);
            }

            constexpr uint8_t pop_base62_digit() {
                uint64_t rem = 0;
                for (auto & part: m_parts) {
                    uint64_t val = (rem << 32) | part;
                    part = uint32_t(val / base62_alphabet::size);
                    rem = val % base62_alphabet::size;
                }
                return uint8_t(rem);
            }

            constexpr size_t significant_bytes() const {
                for (size_t i = 0; i < part_count; ++i) {
                    if (m_parts[i] != 0)
                        return (part_count - i - 1) * sizeof(uint32_t) + (std::bit_width(m_parts[i]) + 7) / 8;
                }
                return 0;
            }
        private:
            std::array<uint32_t, part_count> m_parts{};
        };

        // Minimal big-endian length of an arbitrarily long digit string.
        // Only used to report numbers that do not fit into 160 bits.
        template<char_like C>
        constexpr size_t base62_significant_bytes(const C * str, size_t len) {
            std::vector<uint32_t> parts; //least significant first
            for (size_t i = 0; i < len; ++i) {
                uint64_t carry = base62_alphabet::decode(str[i]);
                for (auto & part: parts) {
                    uint64_t val = uint64_t(part) * base62_alphabet::size + carry;
                    part = uint32_t(val);
                    carry = val >> 32;
                }
                if (carry)
                    parts.push_back(uint32_t(carry));
            }
            if (parts.empty())
                return 0;
            return (parts.size() - 1) * sizeof(uint32_t) + (std::bit_width(parts.back()) + 7) / 8;
        }

        template<char_like C>
        constexpr void base62_encode(std::span<const uint8_t, ksuid_byte_length> src, C * str) noexcept {
            base62_number num(src);
            for (size_t i = ksuid_char_length; i != 0; --i)
                str[i - 1] = base62_alphabet::encode<C>(num.pop_base62_digit());
        }

        /*
         * Every leading '0' digit stands for one zero byte and the rest of the string for the
         * minimal big-endian bytes of its value. Zero bytes beyond ksuid_byte_length are dropped
         * so anything shorter than ksuid_byte_length after that is rejected.
         */
        template<char_like C>
        constexpr auto base62_decode(const C * str, size_t len, std::span<uint8_t, ksuid_byte_length> dest) -> decode_result {
            for (size_t i = 0; i < len; ++i) {
                if (base62_alphabet::decode(str[i]) >= base62_alphabet::size)
                    return {decode_status::invalid_character, i};
            }

            size_t zeros = 0;
            while (zeros < len && base62_alphabet::decode(str[zeros]) == 0)
                ++zeros;

            base62_number num;
            for (size_t i = zeros; i < len; ++i) {
                if (num.push_base62_digit(base62_alphabet::decode(str[i])) != 0)
                    return {decode_status::unexpected_length, base62_significant_bytes(str + zeros, len - zeros)};
            }

            size_t length = zeros + num.significant_bytes();
            if (length < ksuid_byte_length)
                return {decode_status::unexpected_length, length};

            num.get_bytes(dest);
            return {decode_status::ok, ksuid_byte_length};
        }

        template<class T>
        concept char_range = !is_span<T> && requires(const T & x) {
            std::span{x};
            requires char_like<std::remove_cvref_t<decltype(*std::span{x}.begin())>>;
        };

        // String literals carry their terminating null which is not part of the text
        template<char_range T>
        constexpr auto as_chars(const T & src) noexcept {
            using C = std::remove_cvref_t<decltype(*std::span{src}.begin())>;
            std::span<const C> ret{src};
            if constexpr (std::is_array_v<T>) {
                if (!ret.empty() && ret.back() == C(0))
                    ret = ret.first(ret.size() - 1);
            }
            return ret;
        }

        template<class T>
        concept writable_char_range = !is_span<T> && requires(T & x) {
            std::span{x};
            requires char_like<std::remove_reference_t<decltype(*std::span{x}.begin())>>;
            requires !std::is_const_v<std::remove_reference_t<decltype(*std::span{x}.begin())>>;
        };

        template<ksuid_like Id, char_like T>
        auto write_ksuid(std::basic_ostream<T> & str, const Id & val) -> std::basic_ostream<T> & {
            std::array<T, ksuid_char_length> buf;
            val.to_chars(buf);
            std::copy(buf.begin(), buf.end(), std::ostreambuf_iterator<T>(str));
            return str;
        }

        template<ksuid_like Id, char_like T>
        auto read_ksuid(std::basic_istream<T> & str, Id & val) -> std::basic_istream<T> & {
            std::array<T, ksuid_char_length> buf;
            auto * strbuf = str.rdbuf();
            for(T & c: buf) {
                auto res = strbuf->sbumpc();
                if (res == std::char_traits<T>::eof()) {
                    str.setstate(std::ios_base::eofbit | std::ios_base::failbit);
                    return str;
                }
                c = T(res);
            }
            if (auto maybe_val = Id::from_chars(buf))
                val = *maybe_val;
            else
                str.setstate(std::ios_base::failbit);
            return str;
        }

        constexpr size_t hash_ksuid_bytes(const std::array<uint8_t, ksuid_byte_length> & bytes) noexcept {
            const uint8_t * data = bytes.data();
            size_t ret = 0;
            for(unsigned i = 0; i < ksuid_byte_length / sizeof(uint32_t); ++i) {
                uint32_t temp;
                data = read_bytes(data, temp);
                ret = hash_combine(ret, size_t(temp));
            }
            return ret;
        }

        template<class Derived, ksuid_like Id, class CharT>
        struct ksuid_formatter_base {
            template<class ParseContext>
            constexpr auto parse(ParseContext & ctx) -> typename ParseContext::iterator {
                using tr = base62_char_traits<CharT>;

                auto it = ctx.begin();
                if (it != ctx.end() && *it != tr::cl_br)
                    static_cast<Derived *>(this)->raise_exception("Invalid format args");
                return it;
            }

            template <typename FormatContext>
            auto format(const Id & val, FormatContext & ctx) const -> decltype(ctx.out())  {
                std::array<CharT, ksuid_char_length> buf;
                val.to_chars(buf);
                return std::copy(buf.begin(), buf.end(), ctx.out());
            }
        };
    }
}

#endif
