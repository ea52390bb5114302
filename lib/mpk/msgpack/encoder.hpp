/* This file is part of Micro Pack project.
 * Copyright (c) 2026 The Micro Pack Authors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef MICRO_PACK_MSGPACK_ENCODER_HPP
#define MICRO_PACK_MSGPACK_ENCODER_HPP

#include <array>
#include <ostream>
#include <mpk/msgpack/transformer.hpp>
#include <mpk/msgpack/types.hpp>
#include <mpk/msgpack/writer.hpp>

namespace micro_pack::msgpack {
    /*
     * Emits the canonical, minimal-width encoding of each item into a writer.
     * The fluent methods write exactly one item or a container prefix;
     * encode walks a value tree through the transformer pipeline configured in the options.
     */
    struct encoder {
        static constexpr size_t max_size = 0xFFFFFFFFULL;

        explicit encoder(writer &w, const encode_options &opts=encode_options::defaults()):
            _writer { w }, _opts { opts }
        {
        }

        encoder &nil()
        {
            _encode_head(tag::nil);
            return *this;
        }

        encoder &boolean(const bool b)
        {
            _encode_head(b ? tag::s_true : tag::s_false);
            return *this;
        }

        encoder &int64(int64_t i);
        encoder &uint64(uint64_t u);

        encoder &float32(const float f)
        {
            _encode_fixed(tag::float32, f);
            return *this;
        }

        encoder &float64(const double d)
        {
            _encode_fixed(tag::float64, d);
            return *this;
        }

        encoder &text(std::string_view s);
        encoder &binary(buffer bytes);
        encoder &array(size_t sz);
        encoder &map(size_t sz);
        encoder &ext(int8_t type, buffer payload);

        encoder &encode(const value &v);
    private:
        writer &_writer;
        const encode_options &_opts;

        void _encode_head(const tag t, const uint8_t packed=0)
        {
            const uint8_t b = tag_byte(t, packed);
            _writer.write(buffer { &b, 1 });
        }

        // writes the tag and the big-endian value as a single chunk
        template<typename T>
        void _encode_fixed(const tag t, const T val)
        {
            std::array<uint8_t, 1 + sizeof(T)> buf;
            buf[0] = tag_byte(t);
            const auto net_val = host_to_net(val);
            memcpy(buf.data() + 1, &net_val, sizeof(net_val));
            _writer.write(buffer { buf.data(), buf.size() });
        }

        void _encode_size(std::optional<tag> t8, tag t16, tag t32, size_t sz, std::string_view what);
        std::optional<msgpack::ext> _resolve_extension(const value &v) const;
        void _encode_canonical(const value &v);
    };

    extern uint8_vector encode(const value &v, const encode_options &opts=encode_options::defaults());
    extern void encode(std::ostream &os, const value &v, const encode_options &opts=encode_options::defaults());
    extern void encode(writer &w, const value &v, const encode_options &opts=encode_options::defaults());
}

#endif // !MICRO_PACK_MSGPACK_ENCODER_HPP
