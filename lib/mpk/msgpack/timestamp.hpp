/* This file is part of Micro Pack project.
 * Copyright (c) 2026 The Micro Pack Authors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef MICRO_PACK_MSGPACK_TIMESTAMP_HPP
#define MICRO_PACK_MSGPACK_TIMESTAMP_HPP

#include <chrono>
#include <compare>
#include <optional>
#include <boost/container_hash/hash.hpp>
#include <mpk/msgpack/transformer.hpp>

namespace micro_pack::msgpack {
    // a point in time as seconds since the Unix epoch plus a non-negative nanosecond adjustment
    struct timestamp {
        static constexpr int8_t ext_type = -1;
        static constexpr uint32_t nsec_per_sec = 1'000'000'000;

        int64_t sec = 0;
        uint32_t nsec = 0;

        static timestamp from_time_point(std::chrono::system_clock::time_point tp);

        timestamp() =default;

        timestamp(const int64_t s, const uint32_t ns):
            sec { s }, nsec { ns }
        {
            if (nsec >= nsec_per_sec) [[unlikely]]
                throw invalid_timestamp_error { fmt::format("nanoseconds {} must be less than {}", nsec, nsec_per_sec) };
        }

        std::chrono::system_clock::time_point to_time_point() const;

        bool operator==(const timestamp &o) const =default;
        std::strong_ordering operator<=>(const timestamp &o) const =default;
    };

    // the standard resolvers for the timestamp extension
    extern std::optional<ext> encode_timestamp(const value &v);
    extern decoded decode_timestamp(buffer payload);
}

namespace std {
    template<>
    struct hash<micro_pack::msgpack::timestamp> {
        size_t operator()(const micro_pack::msgpack::timestamp &ts) const
        {
            size_t seed = 0;
            boost::hash_combine(seed, ts.sec);
            boost::hash_combine(seed, ts.nsec);
            return seed;
        }
    };
}

namespace fmt {
    template<>
    struct formatter<micro_pack::msgpack::timestamp>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "timestamp({}.{:09})", v.sec, v.nsec);
        }
    };
}

#endif // !MICRO_PACK_MSGPACK_TIMESTAMP_HPP
