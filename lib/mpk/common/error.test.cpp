/* This file is part of Micro Pack project.
 * Copyright (c) 2026 The Micro Pack Authors
 * This code is distributed under the license specified in the LICENSE file. */

#include <optional>
#include <mpk/common/error.hpp>
#include <mpk/common/test.hpp>
#include <mpk/logger.hpp>

using namespace micro_pack;

template<typename F>
void expect_throws_msg(const F &f, const std::string &prefix, const std::source_location &src_loc=std::source_location::current())
{
    expect(boost::ut::throws<error>(f)) << "no exception has been thrown";
    std::optional<std::string> msg {};
    try {
        f();
    } catch (const error &ex) {
        msg = ex.what();
    }
    expect(static_cast<bool>(msg)) << "exception message is empty";
    if (msg) {
        const auto descr = fmt::format("'{}' does not start with '{}' from {}:{}", *msg, prefix, src_loc.file_name(), src_loc.line());
        test_same(descr, true, msg->starts_with(prefix));
    }
}

suite common_error_suite = [] {
    "common::error"_test = [] {
        "message"_test = [] {
            expect_throws_msg([] { throw error("Hello!"); }, "Hello!");
            expect_throws_msg([] { throw error(fmt::format("Hello {}!", "world")); }, "Hello world!");
        };
        "buffer"_test = [] {
            const auto buf = uint8_vector::from_hex("DEADBEEF");
            expect_throws_msg([&] { throw error(fmt::format("Hello {}!", buf)); }, "Hello DEADBEEF!");
        };
        "caused by"_test = [] {
            const std::runtime_error cause { "disk is full" };
            expect_throws_msg([&] { throw error("write failed", cause); }, "write failed caused by");
        };
        "message is independent of tracing"_test = [] {
            const auto prev = logger::tracing_enabled();
            for (const auto tracing: { false, true }) {
                logger::tracing_enabled() = tracing;
                expect_throws_msg([] { throw error("traced"); }, "traced");
            }
            logger::tracing_enabled() = prev;
        };
        "catchable as std::exception"_test = [] {
            expect(throws<std::exception>([] { throw error("any"); }));
        };
    };
};
