/* This file is part of Micro Pack project.
 * Copyright (c) 2026 The Micro Pack Authors
 * This code is distributed under the license specified in the LICENSE file. */

#include <mpk/common/narrow-cast.hpp>
#include <mpk/common/test.hpp>

using namespace micro_pack;

suite narrow_cast_suite = [] {
    "narrow_cast"_test = [] {
        test_same(uint8_t { 24 }, narrow_cast<uint8_t>(uint64_t { 24 }));
        test_same(int8_t { -24 }, narrow_cast<int8_t>(int64_t { -24 }));
        test_same(uint16_t { 255 }, narrow_cast<uint16_t>(int64_t { 255 }));
        test_same(int64_t { 205665 }, narrow_cast<int64_t>(uint64_t { 205665 }));
        test_same(uint32_t { 0xFFFFFFFF }, narrow_cast<uint32_t>(size_t { 0xFFFFFFFF }));
        expect(throws([] { narrow_cast<uint8_t>(256); }));
        expect(throws([] { narrow_cast<int8_t>(-129); }));
        expect(throws([] { narrow_cast<uint64_t>(int64_t { -250 }); }));
        expect(throws([] { narrow_cast<int64_t>(std::numeric_limits<uint64_t>::max()); }));
        expect(throws([] { narrow_cast<uint32_t>(size_t { 0x100000000ULL }); }));
    };
};
