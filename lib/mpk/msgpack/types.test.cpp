/* This file is part of Micro Pack project.
 * Copyright (c) 2026 The Micro Pack Authors
 * This code is distributed under the license specified in the LICENSE file. */

#include <mpk/common/test.hpp>
#include <mpk/msgpack/types.hpp>

using namespace micro_pack;
using namespace micro_pack::msgpack;

suite msgpack_types_suite = [] {
    "msgpack::types"_test = [] {
        "classify covers every byte"_test = [] {
            size_t fixed = 0;
            for (size_t b = 0; b <= 0xFF; ++b) {
                const auto t = classify(static_cast<uint8_t>(b));
                if (b < 0x80)
                    expect(t == tag::positive_fixint);
                else if (b < 0x90)
                    expect(t == tag::fixmap);
                else if (b < 0xA0)
                    expect(t == tag::fixarray);
                else if (b < 0xC0)
                    expect(t == tag::fixstr);
                else if (b >= 0xE0)
                    expect(t == tag::negative_fixint);
                else if (static_cast<uint8_t>(t) == b)
                    ++fixed;
            }
            test_same(size_t { 0xE0 - 0xC0 }, fixed);
        };
        "format"_test = [] {
            test_same(std::string { "never used" }, fmt::format("{}", tag::never_used));
            test_same(std::string { "fixext 16" }, fmt::format("{}", classify(0xD8)));
            test_same(std::string { "negative fixint" }, fmt::format("{}", classify(0xF0)));
        };
    };
};
