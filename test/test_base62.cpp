// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#include <doctest/doctest.h>

#include <modern-ksuid/ksuid.h>

#include "test_util.h"

using namespace mksuid;
using namespace std::literals;

namespace {

    auto decode(std::string_view str) -> std::pair<decode_result, std::array<uint8_t, 20>> {
        std::array<uint8_t, 20> bytes{};
        auto res = impl::base62_decode(str.data(), str.size(), bytes);
        return {res, bytes};
    }

    auto encode(const std::array<uint8_t, 20> & bytes) -> std::string {
        std::string ret(27, '\0');
        impl::base62_encode(bytes, ret.data());
        return ret;
    }

    constexpr std::array<uint8_t, 20> operator""_bytes(const char * str, size_t len) {
        std::array<uint8_t, 20> ret{};
        auto digit = [](char c) { return uint8_t(c <= '9' ? c - '0' : c - 'a' + 10); };
        for (size_t i = 0; i + 1 < len && i / 2 < ret.size(); i += 2)
            ret[i / 2] = uint8_t(digit(str[i]) << 4 | digit(str[i + 1]));
        return ret;
    }
}

TEST_SUITE("base62") {

static_assert(ksuid::from_chars("aWgEPTl1tmebfsQzFP4bxwgy80V") == ksuid::max());
static_assert(!ksuid::from_chars("zzzzzzzzzzzzzzzzzzzzzzzzzzz"));

TEST_CASE("encode") {
    CHECK(encode({}) == "000000000000000000000000000");
    CHECK(encode("ffffffffffffffffffffffffffffffffffffffff"_bytes) == "aWgEPTl1tmebfsQzFP4bxwgy80V");
    CHECK(encode("0d35c433e1933e37f275708763adc7745af5e7f2"_bytes) == "1srOrx2ZWZBpBUvZwXKQmoEYga2");
    CHECK(encode("0e7e1e35bdd5d6b6363a3e67974aa25ac819ad1e"_bytes) == "24CtFf3hyVZHdSkQy0nMBa1OjOA");
    CHECK(encode("00419a021c4d8ab569c94ecc8ba7dff021afd8d3"_bytes) == "02GY99XXwBHbeBundUPJoqYpvet");
    CHECK(encode("0000000000000000000000000000000000000001"_bytes) == "000000000000000000000000001");
}

TEST_CASE("decode") {
    {
        auto [res, bytes] = decode("1srOrx2ZWZBpBUvZwXKQmoEYga2");
        CHECK(res);
        CHECK(res.status == decode_status::ok);
        CHECK(bytes == "0d35c433e1933e37f275708763adc7745af5e7f2"_bytes);
    }
    {
        auto [res, bytes] = decode("aWgEPTl1tmebfsQzFP4bxwgy80V");
        CHECK(res);
        CHECK(bytes == "ffffffffffffffffffffffffffffffffffffffff"_bytes);
    }
    {
        auto [res, bytes] = decode("000000000000000000000000000");
        CHECK(res);
        CHECK(bytes == std::array<uint8_t, 20>{});
    }
}

TEST_CASE("leading zeros") {
    {
        auto [res, bytes] = decode("02GY99XXwBHbeBundUPJoqYpvet");
        CHECK(res);
        CHECK(bytes == "00419a021c4d8ab569c94ecc8ba7dff021afd8d3"_bytes);
    }
    {
        auto [res, bytes] = decode("04X6IIDacKaayM4WWom0flpf3mY");
        CHECK(res);
        CHECK(bytes == "008334041c40551ae20f7bc7db2397deeaae8a16"_bytes);
    }
    {
        //six zero digits plus 16 significant bytes: the extra zero bytes are dropped
        auto [res, bytes] = decode("000000pryYUMiBILyxOCoroLz6w");
        CHECK(res);
        CHECK(bytes == "000000001b7d20e59156e80c7aad50c707cbd4fa"_bytes);
        CHECK(encode(bytes) == "000000pryYUMiBILyxOCoroLz6w");
    }
    {
        auto [res, bytes] = decode("01srOrx2ZWZBpBUvZwXKQmoEYga2");
        CHECK(res);
        CHECK(bytes == "0d35c433e1933e37f275708763adc7745af5e7f2"_bytes);
    }
    {
        auto [res, bytes] = decode("0000000000000000000000000000000000");
        CHECK(res);
        CHECK(bytes == std::array<uint8_t, 20>{});
    }
}

TEST_CASE("invalid character") {
    auto [res1, bytes1] = decode("1srOrx2ZWZBpBUvZwXKQm-EYga2");
    CHECK(!res1);
    CHECK(res1.status == decode_status::invalid_character);
    CHECK(res1.value == 21);

    auto [res2, bytes2] = decode("!srOrx2ZWZBpBUvZwXKQmoEYga2");
    CHECK(res2.status == decode_status::invalid_character);
    CHECK(res2.value == 0);

    auto [res3, bytes3] = decode("ZBpBUvZwXKQmo EYga2");
    CHECK(res3.status == decode_status::invalid_character);
    CHECK(res3.value == 13);

    std::u32string wide = U"1srOrx2ZWZBpBUvZwXKQmoEYga٢";
    std::array<uint8_t, 20> bytes{};
    auto res4 = impl::base62_decode(wide.data(), wide.size(), bytes);
    CHECK(res4.status == decode_status::invalid_character);
    CHECK(res4.value == 26);
}

TEST_CASE("unexpected length") {
    auto [res1, bytes1] = decode("ZBpBUvZwXKQmoEYga2");
    CHECK(res1.status == decode_status::unexpected_length);
    CHECK(res1.value == 14);

    auto [res2, bytes2] = decode("1srOrx2ZWZBpBUvZwXKQmoEYga");
    CHECK(res2.status == decode_status::unexpected_length);
    CHECK(res2.value == 19);

    auto [res3, bytes3] = decode("");
    CHECK(res3.status == decode_status::unexpected_length);
    CHECK(res3.value == 0);

    auto [res4, bytes4] = decode("zzzzzzzzzzzzzzzzzzzzzzzzzzz");
    CHECK(res4.status == decode_status::unexpected_length);
    CHECK(res4.value == 21);

    auto [res7, bytes7] = decode("aWgEPTl1tmebfsQzFP4bxwgy80W");
    CHECK(res7.status == decode_status::unexpected_length);
    CHECK(res7.value == 21);

    auto [res5, bytes5] = decode("1srOrx2ZWZBpBUvZwXKQmoEYga21srOrx2ZWZBpBUvZwXKQmoEYga2");
    CHECK(res5.status == decode_status::unexpected_length);
    CHECK(res5.value == 40);

    auto [res6, bytes6] = decode("1srOrx2ZWZBpBUvZwXKQmoEYga21srOrx2ZWZBpBUvZwXKQmoEYga22");
    CHECK(res6.status == decode_status::unexpected_length);
    CHECK(res6.value == 41);
}

TEST_CASE("exception") {
    try {
        (void)ksuid::from_base62("ZBpBUvZwXKQmoEYga2");
        FAIL("exception expected");
    } catch (bad_ksuid_string & ex) {
        CHECK(ex.result().status == decode_status::unexpected_length);
        CHECK(ex.result().value == 14);
        CHECK(ex.what() == "invalid ksuid string: unexpected decoded length 14"s);
    }

    try {
        (void)ksuid::from_base62("1srOrx2ZWZBpBUvZwXKQm-EYga2");
        FAIL("exception expected");
    } catch (std::invalid_argument & ex) {
        CHECK(ex.what() == "invalid ksuid string: character at position 21 is not base62"s);
    }
}

TEST_CASE("round trip") {
    for (int i = 0; i < 100; ++i) {
        auto k = ksuid::generate();
        auto str = k.to_string();
        CHECK(str.size() == 27);
        CHECK(ksuid::from_chars(str) == k);
    }
}

}
