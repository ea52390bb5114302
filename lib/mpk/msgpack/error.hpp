/* This file is part of Micro Pack project.
 * Copyright (c) 2026 The Micro Pack Authors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef MICRO_PACK_MSGPACK_ERROR_HPP
#define MICRO_PACK_MSGPACK_ERROR_HPP

#include <cstdint>
#include <ios>
#include <string_view>
#include <mpk/common/error.hpp>
#include <mpk/common/format.hpp>

namespace micro_pack::msgpack {
    struct error: micro_pack::error {
        using micro_pack::error::error;
    };

    // the source had no bytes at all for the requested field
    struct eof_error: error {
        eof_error():
            error { "msgpack: no more data in the source" }
        {
        }
    };

    // the source ended in the middle of a value
    struct unexpected_eof_error: error {
        unexpected_eof_error():
            error { "msgpack: the value extends beyond the end of the source" }
        {
        }
    };

    // the underlying std::istream or std::ostream failed, these do not set errno
    struct stream_error: error {
        explicit stream_error(const std::string_view op, const size_t num_bytes, const size_t pos, const std::ios_base::iostate state):
            error { fmt::format("msgpack: failed to {} {} bytes at stream position {}, stream state:{}{}{}", op, num_bytes, pos,
                state & std::ios_base::badbit ? " bad" : "", state & std::ios_base::failbit ? " fail" : "",
                state & std::ios_base::eofbit ? " eof" : "") }
        {
        }
    };

    struct invalid_format_error: error {
        explicit invalid_format_error(const uint8_t tag_byte):
            error { fmt::format("msgpack: invalid format byte 0x{:02X}", tag_byte) }
        {
        }
    };

    struct invalid_timestamp_error: error {
        explicit invalid_timestamp_error(const std::string_view reason):
            error { fmt::format("msgpack: invalid timestamp: {}", reason) }
        {
        }
    };

    struct duplicate_key_error: error {
        explicit duplicate_key_error(const std::string_view key):
            error { fmt::format("msgpack: duplicate map key: {}", key) }
        {
        }
    };

    struct unsupported_key_type_error: error {
        explicit unsupported_key_type_error(const std::string_view type_name):
            error { fmt::format("msgpack: a value of type {} cannot be a map key", type_name) }
        {
        }
    };

    struct unsupported_extension_type_error: error {
        explicit unsupported_extension_type_error(const int8_t ext_type):
            error { fmt::format("msgpack: unsupported extension type {}", ext_type) }
        {
        }
    };

    struct nesting_too_deep_error: error {
        explicit nesting_too_deep_error(const size_t max_depth):
            error { fmt::format("msgpack: the value has more than {} levels of nesting", max_depth) }
        {
        }
    };

    struct unsupported_type_error: error {
        explicit unsupported_type_error(const std::string_view type_name):
            error { fmt::format("msgpack: no encoding available for a value of type {}", type_name) }
        {
        }
    };

    struct too_big_error: error {
        explicit too_big_error(const std::string_view what, const size_t size):
            error { fmt::format("msgpack: {} of size {} is too big to be encoded", what, size) }
        {
        }
    };
}

#endif // !MICRO_PACK_MSGPACK_ERROR_HPP
