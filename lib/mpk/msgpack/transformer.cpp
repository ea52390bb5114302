/* This file is part of Micro Pack project.
 * Copyright (c) 2026 The Micro Pack Authors
 * This code is distributed under the license specified in the LICENSE file. */

#include <mpk/msgpack/timestamp.hpp>
#include <mpk/msgpack/transformer.hpp>

namespace micro_pack::msgpack {
    const std::vector<extension_encoder> &standard_extension_encoders()
    {
        static const std::vector<extension_encoder> encoders {
            encode_timestamp
        };
        return encoders;
    }

    const extension_decoder_map &standard_extension_decoders()
    {
        static const extension_decoder_map decoders {
            { timestamp::ext_type, decode_timestamp }
        };
        return decoders;
    }

    encode_transformer compose(std::vector<encode_transformer> transformers)
    {
        return [transformers=std::move(transformers)](const value &v) -> std::optional<value> {
            std::optional<value> res {};
            for (const auto &t: transformers) {
                if (auto next = t(res ? *res : v); next)
                    res = std::move(*next);
            }
            return res;
        };
    }

    decode_transformer compose(std::vector<decode_transformer> transformers)
    {
        return [transformers=std::move(transformers)](const decoded &d) -> std::optional<decoded> {
            std::optional<decoded> res {};
            for (const auto &t: transformers) {
                if (auto next = t(res ? *res : d); next)
                    res = std::move(*next);
            }
            return res;
        };
    }
}
