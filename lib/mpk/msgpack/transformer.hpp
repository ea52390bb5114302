/* This file is part of Micro Pack project.
 * Copyright (c) 2026 The Micro Pack Authors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef MICRO_PACK_MSGPACK_TRANSFORMER_HPP
#define MICRO_PACK_MSGPACK_TRANSFORMER_HPP

#include <functional>
#include <map>
#include <optional>
#include <vector>
#include <mpk/msgpack/value.hpp>

namespace micro_pack::msgpack {
    // a decoded value and whether it may serve as a map key
    struct decoded {
        value val {};
        bool key_eligible = false;
    };

    // std::nullopt means that the function does not apply to the value
    using encode_transformer = std::function<std::optional<value>(const value &)>;
    using extension_encoder = std::function<std::optional<ext>(const value &)>;
    using extension_decoder = std::function<decoded(buffer payload)>;
    using decode_transformer = std::function<std::optional<decoded>(const decoded &)>;
    using extension_decoder_map = std::map<int8_t, extension_decoder>;

    struct encode_options {
        std::vector<encode_transformer> transformers {};
        std::vector<extension_encoder> extensions {};
        std::vector<encode_transformer> late_transformers {};
        bool disable_standard_extensions = false;

        static const encode_options &defaults()
        {
            static const encode_options opts {};
            return opts;
        }
    };

    struct decode_options {
        static constexpr size_t default_max_depth = 1024;

        extension_decoder_map extensions {};
        std::vector<decode_transformer> transformers {};
        size_t max_depth = default_max_depth;
        bool allow_duplicate_keys = false;
        bool drop_unsupported_keys = false;
        bool reject_unknown_extensions = false;
        bool disable_standard_extensions = false;

        static const decode_options &defaults()
        {
            static const decode_options opts {};
            return opts;
        }
    };

    // the built-in resolvers for the negative extension types
    extern const std::vector<extension_encoder> &standard_extension_encoders();
    extern const extension_decoder_map &standard_extension_decoders();

    // applies the transformers left to right, each one sees the output of the previous one
    extern encode_transformer compose(std::vector<encode_transformer> transformers);
    extern decode_transformer compose(std::vector<decode_transformer> transformers);
}

#endif // !MICRO_PACK_MSGPACK_TRANSFORMER_HPP
