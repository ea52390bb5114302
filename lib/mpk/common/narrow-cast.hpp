/* This file is part of Micro Pack project.
 * Copyright (c) 2026 The Micro Pack Authors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef MICRO_PACK_COMMON_NARROW_CAST_HPP
#define MICRO_PACK_COMMON_NARROW_CAST_HPP

#include <limits>
#include <typeinfo>
#include "error.hpp"
#include "format.hpp"

namespace micro_pack {
    template<typename TO, typename FROM>
    constexpr TO narrow_cast(const FROM from)
    {
        if constexpr (std::numeric_limits<FROM>::is_signed == std::numeric_limits<TO>::is_signed) {
            if (from > std::numeric_limits<TO>::max()) [[unlikely]]
                throw error(fmt::format("can't convert {} {} to {}: the value is too big", typeid(FROM).name(), from, typeid(TO).name()));
            if (from < std::numeric_limits<TO>::min()) [[unlikely]]
                throw error(fmt::format("can't convert {} {} to {}: the value is too small", typeid(FROM).name(), from, typeid(TO).name()));
            return static_cast<TO>(from);
        }
        if constexpr (std::numeric_limits<FROM>::is_signed) {
            if (from < 0) [[unlikely]]
                throw error(fmt::format("can't convert {} {} to {}: the value is negative", typeid(FROM).name(), from, typeid(TO).name()));
            if (std::numeric_limits<FROM>::max() > std::numeric_limits<TO>::max()
                    && from > static_cast<FROM>(std::numeric_limits<TO>::max())) [[unlikely]]
                throw error(fmt::format("can't convert {} {} to {}: the value is too big", typeid(FROM).name(), from, typeid(TO).name()));
            return static_cast<TO>(from);
        }
        if constexpr (std::numeric_limits<FROM>::digits > std::numeric_limits<TO>::digits) {
            if (from > static_cast<FROM>(std::numeric_limits<TO>::max())) [[unlikely]]
                throw error(fmt::format("can't convert {} {} to {}: the value is too big", typeid(FROM).name(), from, typeid(TO).name()));
        }
        return static_cast<TO>(from);
    }
}

#endif // !MICRO_PACK_COMMON_NARROW_CAST_HPP
