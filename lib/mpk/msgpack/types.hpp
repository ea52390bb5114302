/* This file is part of Micro Pack project.
 * Copyright (c) 2026 The Micro Pack Authors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef MICRO_PACK_MSGPACK_TYPES_HPP
#define MICRO_PACK_MSGPACK_TYPES_HPP

#include <cstdint>
#include <mpk/common/format.hpp>

namespace micro_pack::msgpack {
    // Tags with a payload packed into the tag byte are represented by the first byte of their range
    enum class tag: uint8_t {
        positive_fixint = 0x00,
        fixmap = 0x80,
        fixarray = 0x90,
        fixstr = 0xa0,
        nil = 0xc0,
        never_used = 0xc1,
        s_false = 0xc2,
        s_true = 0xc3,
        bin8 = 0xc4,
        bin16 = 0xc5,
        bin32 = 0xc6,
        ext8 = 0xc7,
        ext16 = 0xc8,
        ext32 = 0xc9,
        float32 = 0xca,
        float64 = 0xcb,
        uint8 = 0xcc,
        uint16 = 0xcd,
        uint32 = 0xce,
        uint64 = 0xcf,
        int8 = 0xd0,
        int16 = 0xd1,
        int32 = 0xd2,
        int64 = 0xd3,
        fixext1 = 0xd4,
        fixext2 = 0xd5,
        fixext4 = 0xd6,
        fixext8 = 0xd7,
        fixext16 = 0xd8,
        str8 = 0xd9,
        str16 = 0xda,
        str32 = 0xdb,
        array16 = 0xdc,
        array32 = 0xdd,
        map16 = 0xde,
        map32 = 0xdf,
        negative_fixint = 0xe0
    };

    static constexpr size_t max_fixstr_size = 0x1F;
    static constexpr size_t max_fixarray_size = 0x0F;
    static constexpr size_t max_fixmap_size = 0x0F;
    static constexpr int64_t max_positive_fixint = 0x7F;
    static constexpr int64_t min_negative_fixint = -0x20;

    constexpr tag classify(const uint8_t b) noexcept
    {
        if (b <= 0x7f)
            return tag::positive_fixint;
        if (b <= 0x8f)
            return tag::fixmap;
        if (b <= 0x9f)
            return tag::fixarray;
        if (b <= 0xbf)
            return tag::fixstr;
        if (b >= 0xe0)
            return tag::negative_fixint;
        return static_cast<tag>(b);
    }

    constexpr uint8_t tag_byte(const tag t, const uint8_t packed=0) noexcept
    {
        return static_cast<uint8_t>(t) | packed;
    }

    static_assert(classify(0x7f) == tag::positive_fixint);
    static_assert(classify(0x85) == tag::fixmap);
    static_assert(classify(0x9f) == tag::fixarray);
    static_assert(classify(0xa3) == tag::fixstr);
    static_assert(classify(0xc1) == tag::never_used);
    static_assert(classify(0xdf) == tag::map32);
    static_assert(classify(0xff) == tag::negative_fixint);
}

namespace fmt {
    template<>
    struct formatter<micro_pack::msgpack::tag>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using micro_pack::msgpack::tag;
            switch (v) {
                case tag::positive_fixint: return fmt::format_to(ctx.out(), "positive fixint");
                case tag::fixmap: return fmt::format_to(ctx.out(), "fixmap");
                case tag::fixarray: return fmt::format_to(ctx.out(), "fixarray");
                case tag::fixstr: return fmt::format_to(ctx.out(), "fixstr");
                case tag::nil: return fmt::format_to(ctx.out(), "nil");
                case tag::never_used: return fmt::format_to(ctx.out(), "never used");
                case tag::s_false: return fmt::format_to(ctx.out(), "false");
                case tag::s_true: return fmt::format_to(ctx.out(), "true");
                case tag::bin8: return fmt::format_to(ctx.out(), "bin 8");
                case tag::bin16: return fmt::format_to(ctx.out(), "bin 16");
                case tag::bin32: return fmt::format_to(ctx.out(), "bin 32");
                case tag::ext8: return fmt::format_to(ctx.out(), "ext 8");
                case tag::ext16: return fmt::format_to(ctx.out(), "ext 16");
                case tag::ext32: return fmt::format_to(ctx.out(), "ext 32");
                case tag::float32: return fmt::format_to(ctx.out(), "float 32");
                case tag::float64: return fmt::format_to(ctx.out(), "float 64");
                case tag::uint8: return fmt::format_to(ctx.out(), "uint 8");
                case tag::uint16: return fmt::format_to(ctx.out(), "uint 16");
                case tag::uint32: return fmt::format_to(ctx.out(), "uint 32");
                case tag::uint64: return fmt::format_to(ctx.out(), "uint 64");
                case tag::int8: return fmt::format_to(ctx.out(), "int 8");
                case tag::int16: return fmt::format_to(ctx.out(), "int 16");
                case tag::int32: return fmt::format_to(ctx.out(), "int 32");
                case tag::int64: return fmt::format_to(ctx.out(), "int 64");
                case tag::fixext1: return fmt::format_to(ctx.out(), "fixext 1");
                case tag::fixext2: return fmt::format_to(ctx.out(), "fixext 2");
                case tag::fixext4: return fmt::format_to(ctx.out(), "fixext 4");
                case tag::fixext8: return fmt::format_to(ctx.out(), "fixext 8");
                case tag::fixext16: return fmt::format_to(ctx.out(), "fixext 16");
                case tag::str8: return fmt::format_to(ctx.out(), "str 8");
                case tag::str16: return fmt::format_to(ctx.out(), "str 16");
                case tag::str32: return fmt::format_to(ctx.out(), "str 32");
                case tag::array16: return fmt::format_to(ctx.out(), "array 16");
                case tag::array32: return fmt::format_to(ctx.out(), "array 32");
                case tag::map16: return fmt::format_to(ctx.out(), "map 16");
                case tag::map32: return fmt::format_to(ctx.out(), "map 32");
                case tag::negative_fixint: return fmt::format_to(ctx.out(), "negative fixint");
                default: return fmt::format_to(ctx.out(), "tag: 0x{:02X}", static_cast<int>(v));
            }
        }
    };
}

#endif // !MICRO_PACK_MSGPACK_TYPES_HPP
