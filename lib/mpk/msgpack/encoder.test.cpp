/* This file is part of Micro Pack project.
 * Copyright (c) 2026 The Micro Pack Authors
 * This code is distributed under the license specified in the LICENSE file. */

#include <limits>
#include <optional>
#include <sstream>
#include <mpk/common/test.hpp>
#include <mpk/logger.hpp>
#include <mpk/msgpack/encoder.hpp>
#include <mpk/msgpack/timestamp.hpp>

using namespace micro_pack;
using namespace micro_pack::msgpack;

namespace {
    size_t printed_calls = 0;

    struct printed {
        int n = 0;
    };
}

namespace fmt {
    template<>
    struct formatter<printed>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            ++printed_calls;
            return fmt::format_to(ctx.out(), "printed({})", v.n);
        }
    };
}

namespace {
    struct ping {
        int n = 0;
    };

    struct pong {
        int n = 0;
    };

    uint8_vector with_prefix(const std::string_view prefix_hex, const size_t sz, const uint8_t fill)
    {
        auto res = uint8_vector::from_hex(prefix_hex);
        res.resize(res.size() + sz, fill);
        return res;
    }
}

suite msgpack_encoder_suite = [] {
    "msgpack::encoder"_test = [] {
        "simple values"_test = [] {
            test_hex("C0", encode(value {}));
            test_hex("C2", encode(value { false }));
            test_hex("C3", encode(value { true }));
        };
        "signed integers at every width boundary"_test = [] {
            const std::vector<std::pair<int64_t, std::string_view>> cases {
                { 0, "00" },
                { 127, "7F" },
                { 128, "D10080" },
                { -1, "FF" },
                { -32, "E0" },
                { -33, "D0DF" },
                { -128, "D080" },
                { -129, "D1FF7F" },
                { 32767, "D17FFF" },
                { 32768, "D200008000" },
                { -32768, "D18000" },
                { -32769, "D2FFFF7FFF" },
                { 2147483647, "D27FFFFFFF" },
                { 2147483648LL, "D30000000080000000" },
                { -2147483648LL, "D280000000" },
                { -2147483649LL, "D3FFFFFFFF7FFFFFFF" },
                { std::numeric_limits<int64_t>::max(), "D37FFFFFFFFFFFFFFF" },
                { std::numeric_limits<int64_t>::min(), "D38000000000000000" }
            };
            for (const auto &[v, hex]: cases)
                test_same(fmt::format("int {}", v), uint8_vector::from_hex(hex), encode(value { v }));
        };
        "unsigned integers at every width boundary"_test = [] {
            const std::vector<std::pair<uint64_t, std::string_view>> cases {
                { 0, "CC00" },
                { 1, "CC01" },
                { 255, "CCFF" },
                { 256, "CD0100" },
                { 65535, "CDFFFF" },
                { 65536, "CE00010000" },
                { 4294967295ULL, "CEFFFFFFFF" },
                { 4294967296ULL, "CF0000000100000000" },
                { std::numeric_limits<uint64_t>::max(), "CFFFFFFFFFFFFFFFFF" }
            };
            for (const auto &[v, hex]: cases)
                test_same(fmt::format("uint {}", v), uint8_vector::from_hex(hex), encode(value { v }));
        };
        "narrow host integers keep their signedness"_test = [] {
            test_hex("05", encode(value { int8_t { 5 } }));
            test_hex("CC05", encode(value { uint8_t { 5 } }));
            test_hex("CD0100", encode(value { uint16_t { 256 } }));
            test_hex("D1FF00", encode(value { int16_t { -256 } }));
        };
        "floats are never downcast"_test = [] {
            test_hex("CA3FC00000", encode(value { 1.5F }));
            test_hex("CB3FF8000000000000", encode(value { 1.5 }));
            test_hex("CB4012000000000000", encode(value { 4.5 }));
        };
        "text lengths"_test = [] {
            test_hex("A0", encode(value { "" }));
            test_hex("A3666F6F", encode(value { "foo" }));
            test_same(with_prefix("BF", 31, 'a'), encode(value { std::string(31, 'a') }));
            test_same(with_prefix("D920", 32, 'a'), encode(value { std::string(32, 'a') }));
            test_same(with_prefix("D9FF", 255, 'a'), encode(value { std::string(255, 'a') }));
            test_same(with_prefix("DA0100", 256, 'a'), encode(value { std::string(256, 'a') }));
            test_same(with_prefix("DAFFFF", 65535, 'a'), encode(value { std::string(65535, 'a') }));
            test_same(with_prefix("DB00010000", 65536, 'a'), encode(value { std::string(65536, 'a') }));
        };
        "binary lengths"_test = [] {
            test_hex("C400", encode(value { uint8_vector {} }));
            test_same(with_prefix("C401", 1, 0xAB), encode(value { uint8_vector(1, 0xAB) }));
            test_same(with_prefix("C4FF", 255, 0xAB), encode(value { uint8_vector(255, 0xAB) }));
            test_same(with_prefix("C50100", 256, 0xAB), encode(value { uint8_vector(256, 0xAB) }));
            test_same(with_prefix("C600010000", 65536, 0xAB), encode(value { uint8_vector(65536, 0xAB) }));
        };
        "array and map prefixes"_test = [] {
            test_hex("90", encode(value { array {} }));
            test_same(with_prefix("9F", 15, 0xC0), encode(value { array(15) }));
            test_same(with_prefix("DC0010", 16, 0xC0), encode(value { array(16) }));
            test_same(with_prefix("DCFFFF", 65535, 0xC0), encode(value { array(65535) }));
            test_same(with_prefix("DD00010000", 65536, 0xC0), encode(value { array(65536) }));
            test_hex("80", encode(value { map {} }));
            map m15 {};
            for (int i = 0; i < 15; ++i)
                m15.emplace_back(i, nullptr);
            const auto enc15 = encode(value { m15 });
            test_same(size_t { 1 + 15 * 2 }, enc15.size());
            test_same(uint8_t { 0x8F }, enc15[0]);
            auto m16 = m15;
            m16.emplace_back(15, nullptr);
            const auto enc16 = encode(value { m16 });
            test_hex("DE0010", uint8_vector { enc16.subbuf(0, 3) });
        };
        "extension lengths"_test = [] {
            const auto ext_hex = [](const size_t sz) {
                return encode(value { ext { 7, uint8_vector(sz, 0x11) } });
            };
            test_hex("C70007", ext_hex(0));
            test_same(with_prefix("D407", 1, 0x11), ext_hex(1));
            test_same(with_prefix("D507", 2, 0x11), ext_hex(2));
            test_same(with_prefix("C70307", 3, 0x11), ext_hex(3));
            test_same(with_prefix("D607", 4, 0x11), ext_hex(4));
            test_same(with_prefix("D707", 8, 0x11), ext_hex(8));
            test_same(with_prefix("D807", 16, 0x11), ext_hex(16));
            test_same(with_prefix("C71107", 17, 0x11), ext_hex(17));
            test_same(with_prefix("C8010007", 256, 0x11), ext_hex(256));
            test_same(with_prefix("C90001000007", 65536, 0x11), ext_hex(65536));
            test_hex("D4FF00", encode(value { ext { -1, uint8_vector::from_hex("00") } }));
        };
        "fluent emitter"_test = [] {
            vector_writer w {};
            encoder enc { w };
            enc.array(3).map(1).text("foo").text("bar").int64(123).float64(4.5);
            test_hex("9381A3666F6FA36261727BCB4012000000000000", w.bytes());
        };
        "too big containers"_test = [] {
            vector_writer w {};
            encoder enc { w };
            expect(throws<too_big_error>([&] { enc.array(0x100000000ULL); }));
            expect(throws<too_big_error>([&] { enc.map(0x100000000ULL); }));
            expect(nothrow([&] { enc.array(0xFFFFFFFFULL); }));
            test_hex("DDFFFFFFFF", w.bytes());
        };
        "worked example"_test = [] {
            const value v { array { map { { "foo", "bar" } }, 123, 4.5 } };
            test_hex("9381A3666F6FA36261727BCB4012000000000000", encode(v));
        };
        "pre-transformers run in order"_test = [] {
            const encode_options opts {
                .transformers = {
                    [](const value &v) -> std::optional<value> {
                        if (v.is<int64_t>())
                            return value { v.int64() * 2 };
                        return {};
                    },
                    [](const value &v) -> std::optional<value> {
                        if (v.is<int64_t>())
                            return value { v.int64() + 1 };
                        return {};
                    }
                }
            };
            test_hex("0B", encode(value { 5 }, opts));
            test_hex("A178", encode(value { "x" }, opts));
            test_hex("920305", encode(value { array { 1, 2 } }, opts));
        };
        "compose"_test = [] {
            const auto twice_plus_one = compose({
                [](const value &v) -> std::optional<value> { return value { v.int64() * 2 }; },
                [](const value &v) -> std::optional<value> { return value { v.int64() + 1 }; }
            });
            test_same(value { 7 }, *twice_plus_one(value { 3 }));
            const auto noop = compose(std::vector<encode_transformer> {});
            expect(!noop(value { 3 }));
        };
        "application extension resolver"_test = [] {
            const encode_options opts {
                .extensions = {
                    [](const value &v) -> std::optional<ext> {
                        if (const auto *p = v.object_if<ping>(); p)
                            return ext { 3, uint8_vector { static_cast<uint8_t>(p->n) } };
                        return {};
                    }
                }
            };
            test_hex("D40309", encode(value { object { ping { 9 } } }, opts));
        };
        "resolvers must respect type ranges"_test = [] {
            const encode_options opts {
                .extensions = {
                    [](const value &v) -> std::optional<ext> {
                        if (v.object_if<ping>())
                            return ext { -5, uint8_vector {} };
                        return {};
                    }
                }
            };
            expect(throws<msgpack::error>([&] { encode(value { object { ping {} } }, opts); }));
        };
        "standard timestamp resolver"_test = [] {
            test_hex("D6FF00000001", encode(value { object { timestamp { 1, 0 } } }));
            const encode_options opts { .disable_standard_extensions = true };
            expect(throws<unsupported_type_error>([&] { encode(value { object { timestamp { 1, 0 } } }, opts); }));
        };
        "objects without a conversion are rejected"_test = [] {
            expect(throws<unsupported_type_error>([] { encode(value { object { ping {} } }); }));
            expect(throws<unsupported_type_error>([] { encode(value { array { 1, object { ping {} } } }); }));
        };
        "late transformers restart the pipeline"_test = [] {
            const encode_options opts {
                .transformers = {
                    [](const value &v) -> std::optional<value> {
                        if (v.is<int64_t>())
                            return value { v.int64() + 100 };
                        return {};
                    }
                },
                .late_transformers = {
                    [](const value &v) -> std::optional<value> {
                        if (const auto *p = v.object_if<ping>(); p)
                            return value { p->n };
                        return {};
                    }
                }
            };
            // the late transformer output goes through the pre-transformers again
            test_hex("6A", encode(value { object { ping { 6 } } }, opts));
        };
        "late transformers format objects only when tracing"_test = [] {
            const encode_options opts {
                .late_transformers = {
                    [](const value &v) -> std::optional<value> {
                        if (const auto *p = v.object_if<printed>(); p)
                            return value { p->n };
                        return {};
                    }
                }
            };
            const auto prev = logger::tracing_enabled();
            logger::tracing_enabled() = false;
            printed_calls = 0;
            test_hex("05", encode(value { object { printed { 5 } } }, opts));
            test_same(size_t { 0 }, printed_calls);
            logger::tracing_enabled() = true;
            test_hex("05", encode(value { object { printed { 5 } } }, opts));
            test_same(size_t { 1 }, printed_calls);
            logger::tracing_enabled() = prev;
        };
        "late transformer cycles terminate"_test = [] {
            size_t calls = 0;
            const encode_options opts {
                .late_transformers = {
                    [&](const value &v) -> std::optional<value> {
                        ++calls;
                        if (const auto *p = v.object_if<ping>(); p)
                            return value { object { pong { p->n } } };
                        return {};
                    },
                    [&](const value &v) -> std::optional<value> {
                        ++calls;
                        if (const auto *p = v.object_if<pong>(); p)
                            return value { object { ping { p->n } } };
                        return {};
                    }
                }
            };
            expect(throws<unsupported_type_error>([&] { encode(value { object { ping { 1 } } }, opts); }));
            test_same(size_t { 2 }, calls);
        };
        "stream sink"_test = [] {
            std::ostringstream os {};
            encode(os, value { array { 1, "a" } });
            test_same(std::string { "\x92\x01\xA1" "a" }, os.str());
        };
        "stream sink failures propagate"_test = [] {
            std::ostringstream os {};
            os.setstate(std::ios::badbit);
            expect(throws<stream_error>([&] { encode(os, value { 1 }); }));
            std::ostringstream good_os {};
            stream_writer w { good_os };
            w.write(uint8_vector::from_hex("0102"));
            test_same(size_t { 2 }, w.position());
            good_os.setstate(std::ios::badbit);
            std::optional<std::string> msg {};
            try {
                w.write(uint8_vector::from_hex("030405"));
            } catch (const stream_error &ex) {
                msg = ex.what();
            }
            expect(msg && msg->starts_with("msgpack: failed to write 3 bytes at stream position 2, stream state: bad")) << msg.value_or("");
        };
    };
};
