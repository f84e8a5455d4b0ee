// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#ifndef HEADER_TEST_UTIL_H_INCLUDED
#define HEADER_TEST_UTIL_H_INCLUDED

#include <doctest/doctest.h>

#include <iterator>
#include <array>
#include <string_view>
#include <cstdint>

template<class T>
auto get_ends(const T & seq) {
    return std::make_pair(std::begin(seq), std::end(seq));
}

inline doctest::String bytes_to_string(const uint8_t * data, size_t size) {
    constexpr char digits[] = "0123456789abcdef";
    doctest::String ret;
    for (size_t i = 0; i < size; ++i) {
        char buf[3] = {digits[data[i] >> 4], digits[data[i] & 0xF], 0};
        ret += buf;
    }
    return ret;
}

namespace std {

    template<class T, size_t N>
    doctest::String toString(const std::array<T, N> & arr) {
        using doctest::toString;

        if constexpr (std::is_same_v<std::remove_const_t<T>, char>) {
            return toString(std::string_view(arr.data(), arr.size()));
        } else if constexpr (std::is_same_v<std::remove_const_t<T>, uint8_t>) {
            return bytes_to_string(arr.data(), arr.size());
        } else {
            doctest::String ret = "[";
            for (size_t i = 0; i < N; ++i) {
                if (i > 0)
                    ret += ", ";
                ret += toString(arr[i]);
            }
            ret += "]";
            return ret;
        }
    }
}

#define CHECK_EQUAL_SEQ(seq1, seq2) {\
    const auto & s1 = seq1; \
    const auto & s2 = seq2; \
    auto [c1, e1] = get_ends(s1); \
    auto [c2, e2] = get_ends(s2); \
    \
    for (size_t i = 0; ; ++i, ++c1, ++c2) {\
        if (c1 == e1) { \
            if (c2 == e2) \
                break; \
            \
            FAIL_CHECK("First sequence is shorter (length: ", i, ") than second"); \
            break; \
        } \
        if (c2 == e2) { \
            FAIL_CHECK("Second sequence is shorter (length: ", i, ") than first"); \
            break; \
        } \
        \
        if (*c1 != *c2) { \
            FAIL_CHECK("Discrepancy at index ", i, ", first: ", int(*c1), ", second: ", int(*c2));\
            break;\
        }\
    }\
    CHECK(true); \
}

#endif
