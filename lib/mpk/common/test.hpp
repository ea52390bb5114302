/* This file is part of Micro Pack project.
 * Copyright (c) 2026 The Micro Pack Authors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef MICRO_PACK_COMMON_TEST_HPP
#define MICRO_PACK_COMMON_TEST_HPP

#include <algorithm>
#include <cmath>
#include <iostream>
#include <source_location>
#define BOOST_UT_DISABLE_MODULE 1
#include <boost/ut.hpp>
#include "bytes.hpp"
#include "format.hpp"

namespace micro_pack {
    using namespace boost::ut;

    struct test_printer: boost::ut::printer {
        template<class T>
        test_printer& operator<<(T &&t) {
            if constexpr (std::is_convertible_v<T, buffer>) {
                std::cerr << fmt::format("{}", static_cast<buffer>(t));
            } else {
                std::cerr << std::forward<T>(t);
            }
            return *this;
        }

        test_printer& operator<<(const std::string_view sv) {
            std::cerr << sv;
            return *this;
        }
    };

    template<typename X, typename Y>
    concept convertible_to_y = requires (X x, Y y)
    {
        { std::is_trivially_constructible_v<X, Y> };
    };

    template<typename T>
    bool test_same(const T &x, const T &y, const std::source_location &loc=std::source_location::current())
    {
        const auto res = x == y;
        expect(res, loc) << fmt::format("{} != {}", x, y);
        return res;
    }

    template<typename X, convertible_to_y<X> Y>
    bool test_same(const X &x, const Y &y, const std::source_location &loc=std::source_location::current())
    {
        const auto res = x == static_cast<X>(y);
        expect(res, loc) << fmt::format("{} != {}", x, y);
        return res;
    }

    // compares encoded bytes with their expected hex form and reports both in hex on a mismatch
    inline bool test_hex(const std::string_view exp_hex, const buffer act, const std::source_location &loc=std::source_location::current())
    {
        const auto exp = uint8_vector::from_hex(exp_hex);
        const auto res = std::ranges::equal(exp, act);
        expect(res, loc) << fmt::format("{} != {}", exp_hex, act);
        return res;
    }

    template<typename T, typename Y>
    bool test_same(const std::string &name, const T &x, const Y &y, const std::source_location &loc=std::source_location::current())
    {
        const auto res = x == static_cast<T>(y);
        expect(res, loc) << fmt::format("{}: {} != {}", name, x, y);
        return res;
    }
}

template <class... Ts>
inline auto boost::ut::cfg<boost::ut::override, Ts...> = boost::ut::runner<boost::ut::reporter<micro_pack::test_printer>> {};

#endif // !MICRO_PACK_COMMON_TEST_HPP
