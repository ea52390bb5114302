/* This file is part of Micro Pack project.
 * Copyright (c) 2026 The Micro Pack Authors
 * This code is distributed under the license specified in the LICENSE file. */

#include <array>
#include <boost/container_hash/hash.hpp>
#include <mpk/msgpack/value.hpp>

namespace micro_pack::msgpack {
    const char *value::type_name(const kind k)
    {
        static constexpr std::array<const char *, 12> names {
            "nil", "bool", "int64", "uint64", "float32", "float64",
            "text", "binary", "array", "map", "ext", "object"
        };
        const auto idx = static_cast<size_t>(k);
        if (idx >= names.size()) [[unlikely]]
            throw error(fmt::format("unsupported msgpack value kind index: {}", idx));
        return names[idx];
    }

    size_t value::hash() const
    {
        size_t seed = _content.index();
        std::visit([&](const auto &c) {
            using T = std::decay_t<decltype(c)>;
            if constexpr (std::is_same_v<T, nil_t>) {
                // the variant index is enough
            } else if constexpr (std::is_same_v<T, uint8_vector>) {
                boost::hash_combine(seed, std::hash<std::string_view> {}(c.str()));
            } else if constexpr (std::is_same_v<T, msgpack::array>) {
                for (const auto &v: c)
                    boost::hash_combine(seed, v.hash());
            } else if constexpr (std::is_same_v<T, msgpack::map>) {
                for (const auto &[k, v]: c) {
                    boost::hash_combine(seed, k.hash());
                    boost::hash_combine(seed, v.hash());
                }
            } else if constexpr (std::is_same_v<T, msgpack::ext>) {
                boost::hash_combine(seed, c.type);
                boost::hash_combine(seed, std::hash<std::string_view> {}(c.data.str()));
            } else if constexpr (std::is_same_v<T, msgpack::object>) {
                boost::hash_combine(seed, c.hash());
            } else {
                boost::hash_combine(seed, std::hash<T> {}(c));
            }
        }, _content);
        return seed;
    }
}
