/* This file is part of Micro Pack project.
 * Copyright (c) 2026 The Micro Pack Authors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef MICRO_PACK_MSGPACK_READER_HPP
#define MICRO_PACK_MSGPACK_READER_HPP

#include <istream>
#include <mpk/common/bytes.hpp>
#include <mpk/msgpack/error.hpp>

namespace micro_pack::msgpack {
    /*
     * A byte source for the decoder.
     * A read that finds no bytes at all throws eof_error.
     * A read that finds some but not all of the requested bytes throws unexpected_eof_error.
     * Views returned by read_view are valid only until the next read.
     */
    struct reader {
        virtual ~reader() =default;
        virtual uint8_t read_byte() =0;
        virtual buffer read_view(size_t num_bytes) =0;
        virtual size_t position() const =0;

        uint8_vector read_copy(const size_t num_bytes)
        {
            return uint8_vector { read_view(num_bytes) };
        }
    };

    // Returns views into the original bytes without copying them
    struct buffer_reader: reader {
        explicit buffer_reader(const buffer bytes):
            _data { bytes }
        {
        }

        uint8_t read_byte() override
        {
            if (_pos >= _data.size()) [[unlikely]]
                throw eof_error {};
            return _data[_pos++];
        }

        buffer read_view(const size_t num_bytes) override
        {
            if (num_bytes == 0)
                return {};
            const auto avail = _data.size() - _pos;
            if (avail == 0) [[unlikely]]
                throw eof_error {};
            if (avail < num_bytes) [[unlikely]]
                throw unexpected_eof_error {};
            const auto res = _data.subbuf(_pos, num_bytes);
            _pos += num_bytes;
            return res;
        }

        size_t position() const override
        {
            return _pos;
        }

        size_t remaining() const
        {
            return _data.size() - _pos;
        }
    private:
        buffer _data;
        size_t _pos = 0;
    };

    /*
     * Reads from a std::istream in chunks of at most chunk_size bytes
     * so that a forged length field cannot force a large allocation up front.
     */
    struct stream_reader: reader {
        static constexpr size_t chunk_size = 4096;

        explicit stream_reader(std::istream &is):
            _is { is }
        {
        }

        uint8_t read_byte() override;
        buffer read_view(size_t num_bytes) override;

        size_t position() const override
        {
            return _pos;
        }
    private:
        std::istream &_is;
        uint8_vector _view_buf {};
        size_t _pos = 0;

        size_t _read_some(uint8_t *out, size_t num_bytes);
    };
}

#endif // !MICRO_PACK_MSGPACK_READER_HPP
