/* This file is part of Micro Pack project.
 * Copyright (c) 2026 The Micro Pack Authors
 * This code is distributed under the license specified in the LICENSE file. */

#include <typeinfo>
#include <boost/interprocess/streams/bufferstream.hpp>
#include <boost/stacktrace.hpp>
#include "error.hpp"
#include "format.hpp"
#include <mpk/logger.hpp>

namespace micro_pack {
    base_error::base_error(const std::string_view msg):
        _msg { msg }
    {
        // skips top 3 frames: safe_dump, base_error, and error
        boost::stacktrace::safe_dump_to(3, _trace.data(), _trace.size());
    }

    const char *base_error::what() const noexcept
    {
        // the stack is symbolized only when tracing
        if (logger::tracing_enabled()) {
            thread_local std::array<char, 0x2000> buf {};
            boost::interprocess::obufferstream os { buf.data(), buf.size() - 1 };
            os << boost::stacktrace::stacktrace::from_dump(_trace.data(), _trace.size());
            // the bufferstream's constructor arguments ensure that there is always at least one byte available.
            buf[os.buffer().second] = 0;
            logger::trace("the stack of {}: {}", _msg, buf.data());
        }
        return _msg.c_str();
    }

    error::error(const std::string_view msg)
        : base_error { msg }
    {
    }

    error::error(const std::string_view msg, const std::exception &ex)
        : error { fmt::format("{} caused by {}: {}", msg, typeid(ex).name(), ex.what()) }
    {
    }
}
