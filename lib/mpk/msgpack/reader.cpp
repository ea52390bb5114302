/* This file is part of Micro Pack project.
 * Copyright (c) 2026 The Micro Pack Authors
 * This code is distributed under the license specified in the LICENSE file. */

#include <algorithm>
#include <mpk/msgpack/reader.hpp>

namespace micro_pack::msgpack {
    size_t stream_reader::_read_some(uint8_t *out, const size_t num_bytes)
    {
        _is.read(reinterpret_cast<char *>(out), static_cast<std::streamsize>(num_bytes));
        if (_is.bad()) [[unlikely]]
            throw stream_error { "read", num_bytes, _pos, _is.rdstate() };
        const auto num_read = static_cast<size_t>(_is.gcount());
        _pos += num_read;
        return num_read;
    }

    uint8_t stream_reader::read_byte()
    {
        uint8_t b;
        if (_read_some(&b, 1) != 1)
            throw eof_error {};
        return b;
    }

    buffer stream_reader::read_view(const size_t num_bytes)
    {
        if (num_bytes == 0)
            return {};
        _view_buf.clear();
        size_t done = 0;
        while (done < num_bytes) {
            const auto chunk = std::min(chunk_size, num_bytes - done);
            _view_buf.resize(done + chunk);
            const auto num_read = _read_some(_view_buf.data() + done, chunk);
            done += num_read;
            if (num_read < chunk) {
                if (done == 0)
                    throw eof_error {};
                throw unexpected_eof_error {};
            }
        }
        return _view_buf;
    }
}
