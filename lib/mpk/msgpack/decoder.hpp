/* This file is part of Micro Pack project.
 * Copyright (c) 2026 The Micro Pack Authors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef MICRO_PACK_MSGPACK_DECODER_HPP
#define MICRO_PACK_MSGPACK_DECODER_HPP

#include <istream>
#include <mpk/msgpack/reader.hpp>
#include <mpk/msgpack/transformer.hpp>
#include <mpk/msgpack/types.hpp>

namespace micro_pack::msgpack {
    struct decoder {
        // the largest number of elements reserved ahead of reading them
        static constexpr size_t max_prealloc = 1000;

        explicit decoder(reader &r, const decode_options &opts=decode_options::defaults());

        // reads exactly one complete value
        decoded read();
    private:
        reader &_reader;
        const decode_options &_opts;

        template<typename T>
        T _read_fixed()
        {
            return _reader.read_view(sizeof(T)).to_host<T>();
        }

        decoded _read_value(size_t depth);
        decoded _read_raw(size_t depth);
        decoded _read_array(size_t sz, size_t depth);
        decoded _read_map(size_t sz, size_t depth);
        decoded _read_ext(size_t sz);
    };

    extern value decode(buffer data, const decode_options &opts=decode_options::defaults());
    extern value decode(std::istream &is, const decode_options &opts=decode_options::defaults());
    extern decoded decode(reader &r, const decode_options &opts=decode_options::defaults());
}

#endif // !MICRO_PACK_MSGPACK_DECODER_HPP
