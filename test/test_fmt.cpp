// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#define MKSUID_USE_FMT 1

#include <doctest/doctest.h>

#include <fmt/format.h>
#include <fmt/xchar.h>
#include <modern-ksuid/ksuid.h>
#include <modern-ksuid/ksuid_ms.h>

using namespace mksuid;
using namespace std::literals;

static_assert(MKSUID_SUPPORTS_FMT_FORMAT);

TEST_SUITE("fmt") {

TEST_CASE("format ksuid") {

    CHECK(fmt::format("{}", ksuid()) == "000000000000000000000000000");
    CHECK(fmt::format("{}", ksuid("1srOrx2ZWZBpBUvZwXKQmoEYga2")) == "1srOrx2ZWZBpBUvZwXKQmoEYga2");
    CHECK(fmt::format("[{}]", ksuid::max()) == "[aWgEPTl1tmebfsQzFP4bxwgy80V]");
    CHECK(fmt::format(L"{}", ksuid("1srOrx2ZWZBpBUvZwXKQmoEYga2")) == L"1srOrx2ZWZBpBUvZwXKQmoEYga2");
}

TEST_CASE("format ksuid_ms") {

    CHECK(fmt::format("{}", ksuid_ms()) == "000000000000000000000000000");
    CHECK(fmt::format("{}", ksuid_ms("1srOrr5XBtUfy3uh30U52a40aNj")) == "1srOrr5XBtUfy3uh30U52a40aNj");
}

TEST_CASE("format args") {

    CHECK_THROWS_AS((void)fmt::format(fmt::runtime("{:x}"), ksuid()), fmt::format_error);
}

}
