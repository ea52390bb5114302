/* This file is part of Micro Pack project.
 * Copyright (c) 2026 The Micro Pack Authors
 * This code is distributed under the license specified in the LICENSE file. */

#include <mpk/msgpack/timestamp.hpp>

namespace micro_pack::msgpack {
    static constexpr int64_t max_ts64_sec = 1LL << 34;

    timestamp timestamp::from_time_point(const std::chrono::system_clock::time_point tp)
    {
        const auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(tp.time_since_epoch()).count();
        auto s = ns / nsec_per_sec;
        auto rem = ns % nsec_per_sec;
        // the nanosecond part is always non-negative so times before the epoch borrow a second
        if (rem < 0) {
            rem += nsec_per_sec;
            --s;
        }
        return { s, static_cast<uint32_t>(rem) };
    }

    std::chrono::system_clock::time_point timestamp::to_time_point() const
    {
        using clock_duration = std::chrono::system_clock::duration;
        static constexpr auto min_sec = std::chrono::duration_cast<std::chrono::seconds>(clock_duration::min()).count();
        static constexpr auto max_sec = std::chrono::duration_cast<std::chrono::seconds>(clock_duration::max()).count();
        // the nanosecond part may add up to one more second
        if (sec < min_sec || sec >= max_sec) [[unlikely]]
            throw invalid_timestamp_error { fmt::format("{} seconds are outside of the system clock range [{}, {})", sec, min_sec, max_sec) };
        return std::chrono::system_clock::time_point {
            std::chrono::duration_cast<clock_duration>(std::chrono::seconds { sec })
                + std::chrono::duration_cast<clock_duration>(std::chrono::nanoseconds { nsec })
        };
    }

    std::optional<ext> encode_timestamp(const value &v)
    {
        const auto *ts = v.object_if<timestamp>();
        if (!ts)
            return {};
        uint8_vector payload {};
        if (ts->sec >= 0 && ts->sec < max_ts64_sec) {
            if (ts->nsec == 0 && ts->sec <= std::numeric_limits<uint32_t>::max()) {
                payload << buffer::from(host_to_net(static_cast<uint32_t>(ts->sec)));
            } else {
                const auto packed = static_cast<uint64_t>(ts->nsec) << 34 | static_cast<uint64_t>(ts->sec);
                payload << buffer::from(host_to_net(packed));
            }
        } else {
            payload << buffer::from(host_to_net(ts->nsec));
            payload << buffer::from(host_to_net(ts->sec));
        }
        return ext { timestamp::ext_type, std::move(payload) };
    }

    decoded decode_timestamp(const buffer payload)
    {
        switch (payload.size()) {
            case 4:
                return { value { object { timestamp { payload.to_host<uint32_t>(), 0 } } }, true };
            case 8: {
                const auto packed = payload.to_host<uint64_t>();
                const auto nsec = static_cast<uint32_t>(packed >> 34);
                if (nsec >= timestamp::nsec_per_sec) [[unlikely]]
                    throw invalid_timestamp_error { fmt::format("nanoseconds {} must be less than {}", nsec, timestamp::nsec_per_sec) };
                return { value { object { timestamp { static_cast<int64_t>(packed & (max_ts64_sec - 1)), nsec } } }, true };
            }
            case 12: {
                const auto nsec = payload.subbuf(0, 4).to_host<uint32_t>();
                const auto sec = payload.subbuf(4, 8).to_host<int64_t>();
                if (nsec >= timestamp::nsec_per_sec) [[unlikely]]
                    throw invalid_timestamp_error { fmt::format("nanoseconds {} must be less than {}", nsec, timestamp::nsec_per_sec) };
                return { value { object { timestamp { sec, nsec } } }, true };
            }
            default:
                throw invalid_timestamp_error { fmt::format("unsupported payload size {}", payload.size()) };
        }
    }
}
