/* This file is part of Micro Pack project.
 * Copyright (c) 2026 The Micro Pack Authors
 * This code is distributed under the license specified in the LICENSE file. */

#include <mpk/msgpack/error.hpp>
#include <mpk/msgpack/writer.hpp>

namespace micro_pack::msgpack {
    void stream_writer::write(const buffer data)
    {
        if (data.empty())
            return;
        _os.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
        if (!_os) [[unlikely]]
            throw stream_error { "write", data.size(), _pos, _os.rdstate() };
        _pos += data.size();
    }
}
