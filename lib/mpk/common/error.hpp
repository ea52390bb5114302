/* This file is part of Micro Pack project.
 * Copyright (c) 2026 The Micro Pack Authors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef MICRO_PACK_COMMON_ERROR_HPP
#define MICRO_PACK_COMMON_ERROR_HPP

#include <array>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

namespace micro_pack {
    struct base_error: std::exception {
        static constexpr size_t stacktrace_depth = 0x20;

        explicit base_error(std::string_view msg);
        const char *what() const noexcept override;
    private:
        std::string _msg;
        std::array<std::byte, sizeof(void*) * stacktrace_depth> _trace {};
    };

    struct error: base_error {
        explicit error(std::string_view msg);
        explicit error(std::string_view msg, const std::exception &ex);
    };
}

#endif // !MICRO_PACK_COMMON_ERROR_HPP
