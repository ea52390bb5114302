/* This file is part of Micro Pack project.
 * Copyright (c) 2026 The Micro Pack Authors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef MICRO_PACK_MSGPACK_WRITER_HPP
#define MICRO_PACK_MSGPACK_WRITER_HPP

#include <ostream>
#include <mpk/common/bytes.hpp>

namespace micro_pack::msgpack {
    struct writer {
        virtual ~writer() =default;
        virtual void write(buffer data) =0;
    };

    struct vector_writer: writer {
        void write(const buffer data) override
        {
            _buf << data;
        }

        [[nodiscard]] uint8_vector &bytes()
        {
            return _buf;
        }

        [[nodiscard]] const uint8_vector &bytes() const
        {
            return _buf;
        }
    private:
        uint8_vector _buf {};
    };

    struct stream_writer: writer {
        explicit stream_writer(std::ostream &os):
            _os { os }
        {
        }

        void write(buffer data) override;

        size_t position() const
        {
            return _pos;
        }
    private:
        std::ostream &_os;
        size_t _pos = 0;
    };
}

#endif // !MICRO_PACK_MSGPACK_WRITER_HPP
