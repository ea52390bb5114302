/* This file is part of Micro Pack project.
 * Copyright (c) 2026 The Micro Pack Authors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef MICRO_PACK_MSGPACK_TRANSFORMERS_HPP
#define MICRO_PACK_MSGPACK_TRANSFORMERS_HPP

#include <string_view>
#include <tuple>
#include <mpk/msgpack/transformer.hpp>

/*
 * Late transformers that turn host containers and records held as objects into arrays and maps.
 * Elements that have no direct value representation become objects themselves
 * and go through the encoder's pipeline again, so nested host types need their own transformers.
 */
namespace micro_pack::msgpack {
    template<typename T>
    value to_value(const T &v)
    {
        if constexpr (std::is_constructible_v<value, const T &>) {
            return value { v };
        } else {
            return value { object { v } };
        }
    }

    template<typename Seq>
    encode_transformer array_transformer()
    {
        return [](const value &v) -> std::optional<value> {
            const auto *seq = v.object_if<Seq>();
            if (!seq)
                return {};
            msgpack::array items {};
            items.reserve(std::size(*seq));
            for (const auto &item: *seq)
                items.emplace_back(to_value(item));
            return value { std::move(items) };
        };
    }

    template<typename Map>
    encode_transformer map_transformer()
    {
        return [](const value &v) -> std::optional<value> {
            const auto *src = v.object_if<Map>();
            if (!src)
                return {};
            msgpack::map entries {};
            entries.reserve(src->size());
            for (const auto &[k, item]: *src)
                entries.emplace_back(to_value(k), to_value(item));
            return value { std::move(entries) };
        };
    }

    template<typename T, typename M>
    struct record_field {
        std::string_view name;
        M T::*member;
    };

    template<typename T, typename M>
    record_field<T, M> field(const std::string_view name, M T::*member)
    {
        return { name, member };
    }

    // converts a record into a map from the given field names to the member values
    template<typename T, typename... M>
    encode_transformer record_transformer(record_field<T, M>... fields)
    {
        return [field_list=std::make_tuple(fields...)](const value &v) -> std::optional<value> {
            const auto *rec = v.object_if<T>();
            if (!rec)
                return {};
            msgpack::map entries {};
            entries.reserve(sizeof...(M));
            std::apply([&](const auto &...f) {
                (entries.emplace_back(value { f.name }, to_value(rec->*(f.member))), ...);
            }, field_list);
            return value { std::move(entries) };
        };
    }
}

#endif // !MICRO_PACK_MSGPACK_TRANSFORMERS_HPP
