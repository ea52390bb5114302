/* This file is part of Micro Pack project.
 * Copyright (c) 2026 The Micro Pack Authors
 * This code is distributed under the license specified in the LICENSE file. */

#include <boost/container/small_vector.hpp>
#include <mpk/logger.hpp>
#include <mpk/msgpack/encoder.hpp>

namespace micro_pack::msgpack {
    encoder &encoder::int64(const int64_t i)
    {
        if (i >= 0 && i <= max_positive_fixint) {
            _encode_head(tag::positive_fixint, static_cast<uint8_t>(i));
        } else if (i < 0 && i >= min_negative_fixint) {
            _encode_head(static_cast<tag>(static_cast<uint8_t>(i)));
        } else if (i >= std::numeric_limits<int8_t>::min() && i <= std::numeric_limits<int8_t>::max()) {
            _encode_fixed(tag::int8, static_cast<int8_t>(i));
        } else if (i >= std::numeric_limits<int16_t>::min() && i <= std::numeric_limits<int16_t>::max()) {
            _encode_fixed(tag::int16, static_cast<int16_t>(i));
        } else if (i >= std::numeric_limits<int32_t>::min() && i <= std::numeric_limits<int32_t>::max()) {
            _encode_fixed(tag::int32, static_cast<int32_t>(i));
        } else {
            _encode_fixed(tag::int64, i);
        }
        return *this;
    }

    encoder &encoder::uint64(const uint64_t u)
    {
        if (u <= std::numeric_limits<uint8_t>::max()) {
            _encode_fixed(tag::uint8, static_cast<uint8_t>(u));
        } else if (u <= std::numeric_limits<uint16_t>::max()) {
            _encode_fixed(tag::uint16, static_cast<uint16_t>(u));
        } else if (u <= std::numeric_limits<uint32_t>::max()) {
            _encode_fixed(tag::uint32, static_cast<uint32_t>(u));
        } else {
            _encode_fixed(tag::uint64, u);
        }
        return *this;
    }

    encoder &encoder::text(const std::string_view s)
    {
        if (s.size() <= max_fixstr_size)
            _encode_head(tag::fixstr, static_cast<uint8_t>(s.size()));
        else
            _encode_size(tag::str8, tag::str16, tag::str32, s.size(), "a string");
        _writer.write(s);
        return *this;
    }

    encoder &encoder::binary(const buffer bytes)
    {
        _encode_size(tag::bin8, tag::bin16, tag::bin32, bytes.size(), "a byte string");
        _writer.write(bytes);
        return *this;
    }

    encoder &encoder::array(const size_t sz)
    {
        if (sz <= max_fixarray_size)
            _encode_head(tag::fixarray, static_cast<uint8_t>(sz));
        else
            _encode_size({}, tag::array16, tag::array32, sz, "an array");
        return *this;
    }

    encoder &encoder::map(const size_t sz)
    {
        if (sz <= max_fixmap_size)
            _encode_head(tag::fixmap, static_cast<uint8_t>(sz));
        else
            _encode_size({}, tag::map16, tag::map32, sz, "a map");
        return *this;
    }

    encoder &encoder::ext(const int8_t type, const buffer payload)
    {
        switch (payload.size()) {
            case 1: _encode_head(tag::fixext1); break;
            case 2: _encode_head(tag::fixext2); break;
            case 4: _encode_head(tag::fixext4); break;
            case 8: _encode_head(tag::fixext8); break;
            case 16: _encode_head(tag::fixext16); break;
            default: _encode_size(tag::ext8, tag::ext16, tag::ext32, payload.size(), "an extension payload"); break;
        }
        const auto type_byte = static_cast<uint8_t>(type);
        _writer.write(buffer { &type_byte, 1 });
        _writer.write(payload);
        return *this;
    }

    encoder &encoder::encode(const value &orig)
    {
        // the late transformers that have already fired for this value are never retried
        boost::container::small_vector<bool, 8> fired(_opts.late_transformers.size(), false);
        std::optional<value> storage {};
        const value *v = &orig;
        for (;;) {
            for (const auto &xform: _opts.transformers) {
                if (auto res = xform(*v); res) {
                    storage = std::move(*res);
                    v = &*storage;
                }
            }
            if (auto res = _resolve_extension(*v); res) {
                storage = value { std::move(*res) };
                v = &*storage;
            }
            if (!v->is<msgpack::object>())
                break;
            bool applied = false;
            for (size_t i = 0; i < _opts.late_transformers.size() && !applied; ++i) {
                if (fired[i])
                    continue;
                if (auto res = _opts.late_transformers[i](*v); res) {
                    if (logger::tracing_enabled())
                        logger::trace("msgpack: late transformer #{} converted {} into {}", i, v->object().to_string(), res->type_name());
                    fired[i] = true;
                    storage = std::move(*res);
                    v = &*storage;
                    applied = true;
                }
            }
            if (!applied)
                throw unsupported_type_error { v->object().type().name() };
        }
        _encode_canonical(*v);
        return *this;
    }

    void encoder::_encode_size(const std::optional<tag> t8, const tag t16, const tag t32, const size_t sz, const std::string_view what)
    {
        if (t8 && sz <= std::numeric_limits<uint8_t>::max())
            _encode_fixed(*t8, static_cast<uint8_t>(sz));
        else if (sz <= std::numeric_limits<uint16_t>::max())
            _encode_fixed(t16, static_cast<uint16_t>(sz));
        else if (sz <= max_size)
            _encode_fixed(t32, static_cast<uint32_t>(sz));
        else
            throw too_big_error { what, sz };
    }

    std::optional<msgpack::ext> encoder::_resolve_extension(const value &v) const
    {
        for (const auto &resolve: _opts.extensions) {
            if (auto res = resolve(v); res) {
                if (res->type < 0) [[unlikely]]
                    throw error(fmt::format("msgpack: an application extension resolver returned a reserved type {}", res->type));
                return res;
            }
        }
        if (!_opts.disable_standard_extensions) {
            for (const auto &resolve: standard_extension_encoders()) {
                if (auto res = resolve(v); res) {
                    if (res->type >= 0) [[unlikely]]
                        throw error(fmt::format("msgpack: a standard extension resolver returned an application type {}", res->type));
                    return res;
                }
            }
        }
        return {};
    }

    void encoder::_encode_canonical(const value &v)
    {
        std::visit([&](const auto &c) {
            using T = std::decay_t<decltype(c)>;
            if constexpr (std::is_same_v<T, nil_t>) {
                nil();
            } else if constexpr (std::is_same_v<T, bool>) {
                boolean(c);
            } else if constexpr (std::is_same_v<T, int64_t>) {
                int64(c);
            } else if constexpr (std::is_same_v<T, uint64_t>) {
                uint64(c);
            } else if constexpr (std::is_same_v<T, float>) {
                float32(c);
            } else if constexpr (std::is_same_v<T, double>) {
                float64(c);
            } else if constexpr (std::is_same_v<T, std::string>) {
                text(c);
            } else if constexpr (std::is_same_v<T, uint8_vector>) {
                binary(c);
            } else if constexpr (std::is_same_v<T, msgpack::array>) {
                array(c.size());
                for (const auto &item: c)
                    encode(item);
            } else if constexpr (std::is_same_v<T, msgpack::map>) {
                map(c.size());
                for (const auto &[k, item]: c) {
                    encode(k);
                    encode(item);
                }
            } else if constexpr (std::is_same_v<T, msgpack::ext>) {
                ext(c.type, c.data);
            } else {
                throw std::logic_error("msgpack: an object must be resolved before reaching the canonical encoder");
            }
        }, v.content());
    }

    uint8_vector encode(const value &v, const encode_options &opts)
    {
        vector_writer w {};
        encoder { w, opts }.encode(v);
        return std::move(w.bytes());
    }

    void encode(std::ostream &os, const value &v, const encode_options &opts)
    {
        stream_writer w { os };
        encoder { w, opts }.encode(v);
    }

    void encode(writer &w, const value &v, const encode_options &opts)
    {
        encoder { w, opts }.encode(v);
    }
}
