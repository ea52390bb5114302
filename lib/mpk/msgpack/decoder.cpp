/* This file is part of Micro Pack project.
 * Copyright (c) 2026 The Micro Pack Authors
 * This code is distributed under the license specified in the LICENSE file. */

#include <algorithm>
#include <unordered_set>
#include <mpk/logger.hpp>
#include <mpk/msgpack/decoder.hpp>

namespace micro_pack::msgpack {
    decoder::decoder(reader &r, const decode_options &opts):
        _reader { r }, _opts { opts }
    {
        for (const auto &[type, dec]: _opts.extensions) {
            if (type < 0) [[unlikely]]
                throw error(fmt::format("msgpack: extension type {} is reserved and cannot have an application decoder", type));
        }
    }

    decoded decoder::read()
    {
        return _read_value(0);
    }

    decoded decoder::_read_value(const size_t depth)
    {
        if (depth > _opts.max_depth) [[unlikely]]
            throw nesting_too_deep_error { _opts.max_depth };
        auto res = _read_raw(depth);
        for (const auto &xform: _opts.transformers) {
            if (auto next = xform(res); next)
                res = std::move(*next);
        }
        return res;
    }

    decoded decoder::_read_raw(const size_t depth)
    {
        const uint8_t b = _reader.read_byte();
        switch (const auto t = classify(b); t) {
            case tag::positive_fixint: return { value { static_cast<int64_t>(b) }, true };
            case tag::negative_fixint: return { value { static_cast<int64_t>(static_cast<int8_t>(b)) }, true };
            case tag::fixmap: return _read_map(b & 0x0F, depth);
            case tag::fixarray: return _read_array(b & 0x0F, depth);
            case tag::fixstr: return { value { std::string { static_cast<std::string_view>(_reader.read_view(b & 0x1F)) } }, true };
            case tag::nil: return { value {}, true };
            case tag::never_used: throw invalid_format_error { b };
            case tag::s_false: return { value { false }, true };
            case tag::s_true: return { value { true }, true };
            case tag::bin8: return { value { _reader.read_copy(_read_fixed<uint8_t>()) }, false };
            case tag::bin16: return { value { _reader.read_copy(_read_fixed<uint16_t>()) }, false };
            case tag::bin32: return { value { _reader.read_copy(_read_fixed<uint32_t>()) }, false };
            case tag::ext8: return _read_ext(_read_fixed<uint8_t>());
            case tag::ext16: return _read_ext(_read_fixed<uint16_t>());
            case tag::ext32: return _read_ext(_read_fixed<uint32_t>());
            case tag::float32: return { value { _read_fixed<float>() }, true };
            case tag::float64: return { value { _read_fixed<double>() }, true };
            case tag::uint8: return { value { _read_fixed<uint8_t>() }, true };
            case tag::uint16: return { value { _read_fixed<uint16_t>() }, true };
            case tag::uint32: return { value { _read_fixed<uint32_t>() }, true };
            case tag::uint64: return { value { _read_fixed<uint64_t>() }, true };
            case tag::int8: return { value { _read_fixed<int8_t>() }, true };
            case tag::int16: return { value { _read_fixed<int16_t>() }, true };
            case tag::int32: return { value { _read_fixed<int32_t>() }, true };
            case tag::int64: return { value { _read_fixed<int64_t>() }, true };
            case tag::fixext1: return _read_ext(1);
            case tag::fixext2: return _read_ext(2);
            case tag::fixext4: return _read_ext(4);
            case tag::fixext8: return _read_ext(8);
            case tag::fixext16: return _read_ext(16);
            case tag::str8: return { value { std::string { static_cast<std::string_view>(_reader.read_view(_read_fixed<uint8_t>())) } }, true };
            case tag::str16: return { value { std::string { static_cast<std::string_view>(_reader.read_view(_read_fixed<uint16_t>())) } }, true };
            case tag::str32: return { value { std::string { static_cast<std::string_view>(_reader.read_view(_read_fixed<uint32_t>())) } }, true };
            case tag::array16: return _read_array(_read_fixed<uint16_t>(), depth);
            case tag::array32: return _read_array(_read_fixed<uint32_t>(), depth);
            case tag::map16: return _read_map(_read_fixed<uint16_t>(), depth);
            case tag::map32: return _read_map(_read_fixed<uint32_t>(), depth);
            default:
                throw std::logic_error(fmt::format("msgpack: the tag byte 0x{:02X} classified as {} has no handler", b, t));
        }
    }

    decoded decoder::_read_array(const size_t sz, const size_t depth)
    {
        msgpack::array items {};
        items.reserve(std::min(sz, max_prealloc));
        for (size_t i = 0; i < sz; ++i)
            items.emplace_back(_read_value(depth + 1).val);
        return { value { std::move(items) }, false };
    }

    decoded decoder::_read_map(const size_t sz, const size_t depth)
    {
        msgpack::map entries {};
        entries.reserve(std::min(sz, max_prealloc));
        // indices into entries so that the keys are hashed without being copied
        const auto key_hash = [&entries](const size_t idx) { return entries[idx].first.hash(); };
        const auto key_eq = [&entries](const size_t a, const size_t b) { return entries[a].first == entries[b].first; };
        std::unordered_set<size_t, decltype(key_hash), decltype(key_eq)> keys { std::min(sz, max_prealloc), key_hash, key_eq };
        for (size_t i = 0; i < sz; ++i) {
            auto key = _read_value(depth + 1);
            auto val = _read_value(depth + 1);
            if (!key.key_eligible) {
                if (!_opts.drop_unsupported_keys) [[unlikely]]
                    throw unsupported_key_type_error { key.val.type_name() };
                logger::trace("msgpack: dropped a map entry with an ineligible key of type {}", key.val.type_name());
                continue;
            }
            entries.emplace_back(std::move(key.val), std::move(val.val));
            if (!keys.emplace(entries.size() - 1).second) {
                if (!_opts.allow_duplicate_keys) [[unlikely]]
                    throw duplicate_key_error { fmt::format("{}", entries.back().first) };
                logger::trace("msgpack: kept the first entry for the duplicate map key {}", entries.back().first);
                entries.pop_back();
            }
        }
        return { value { std::move(entries) }, false };
    }

    decoded decoder::_read_ext(const size_t sz)
    {
        const auto type = static_cast<int8_t>(_reader.read_byte());
        const auto payload = _reader.read_view(sz);
        if (type >= 0) {
            if (const auto it = _opts.extensions.find(type); it != _opts.extensions.end())
                return it->second(payload);
        } else if (!_opts.disable_standard_extensions) {
            const auto &std_decoders = standard_extension_decoders();
            if (const auto it = std_decoders.find(type); it != std_decoders.end())
                return it->second(payload);
        }
        if (_opts.reject_unknown_extensions) [[unlikely]]
            throw unsupported_extension_type_error { type };
        return { value { msgpack::ext { type, uint8_vector { payload } } }, false };
    }

    decoded decode(reader &r, const decode_options &opts)
    {
        return decoder { r, opts }.read();
    }

    value decode(const buffer data, const decode_options &opts)
    {
        buffer_reader r { data };
        return decoder { r, opts }.read().val;
    }

    value decode(std::istream &is, const decode_options &opts)
    {
        stream_reader r { is };
        return decoder { r, opts }.read().val;
    }
}
