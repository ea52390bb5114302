/* This file is part of Micro Pack project.
 * Copyright (c) 2026 The Micro Pack Authors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef MICRO_PACK_MSGPACK_VALUE_HPP
#define MICRO_PACK_MSGPACK_VALUE_HPP

#include <concepts>
#include <cstdint>
#include <memory>
#include <source_location>
#include <string>
#include <string_view>
#include <typeinfo>
#include <utility>
#include <variant>
#include <vector>
#include <mpk/common/bytes.hpp>
#include <mpk/common/narrow-cast.hpp>
#include <mpk/msgpack/error.hpp>

namespace micro_pack::msgpack {
    struct value;

    using nil_t = std::monostate;

    struct array: std::vector<value> {
        using std::vector<value>::vector;

        inline const value &at(size_t pos, const std::source_location &loc=std::source_location::current()) const;
    };

    // keeps the entries in the order they were added or decoded
    struct map: std::vector<std::pair<value, value>> {
        using std::vector<std::pair<value, value>>::vector;

        inline const value *find(const value &key) const;
        inline const value &at(const value &key, const std::source_location &loc=std::source_location::current()) const;
    };

    // an extension block whose type has no registered decoder
    struct ext {
        int8_t type = 0;
        uint8_vector data {};

        bool operator==(const ext &o) const
        {
            return type == o.type && data == o.data;
        }
    };

    /*
     * An immutable type-erased host value such as a timestamp or an application type.
     * The codec never looks inside; extension resolvers and late transformers do.
     */
    struct object {
        template<typename T>
            requires (!std::is_same_v<std::decay_t<T>, object>)
        explicit object(T &&val):
            _ptr { std::make_shared<const model<std::decay_t<T>>>(std::forward<T>(val)) }
        {
        }

        const std::type_info &type() const noexcept
        {
            return _ptr->type();
        }

        template<typename T>
        bool is() const noexcept
        {
            return _ptr->type() == typeid(T);
        }

        template<typename T>
        const T *get_if() const noexcept
        {
            if (!is<T>())
                return nullptr;
            return &static_cast<const model<T> &>(*_ptr).val;
        }

        template<typename T>
        const T &get(const std::source_location &loc=std::source_location::current()) const
        {
            if (const auto *ptr = get_if<T>(); ptr) [[likely]]
                return *ptr;
            throw error(fmt::format("invalid object access, expecting type {} while the present object is {} in file {} line {}!",
                typeid(T).name(), _ptr->type().name(), loc.file_name(), loc.line()));
        }

        bool operator==(const object &o) const
        {
            return _ptr == o._ptr || _ptr->equals(*o._ptr);
        }

        size_t hash() const
        {
            return _ptr->hash();
        }

        std::string to_string() const
        {
            return _ptr->to_string();
        }
    private:
        struct concept_t {
            virtual ~concept_t() =default;
            virtual const std::type_info &type() const noexcept =0;
            virtual bool equals(const concept_t &o) const =0;
            virtual size_t hash() const =0;
            virtual std::string to_string() const =0;
        };

        template<typename T>
        struct model: concept_t {
            const T val;

            template<typename U>
            explicit model(U &&v):
                val(std::forward<U>(v))
            {
            }

            const std::type_info &type() const noexcept override
            {
                return typeid(T);
            }

            // objects of types without equality are equal only to themselves
            bool equals(const concept_t &o) const override
            {
                if constexpr (std::equality_comparable<T>) {
                    if (o.type() != typeid(T))
                        return false;
                    return val == static_cast<const model<T> &>(o).val;
                } else {
                    return this == &o;
                }
            }

            size_t hash() const override
            {
                if constexpr (requires (const T &v) { { std::hash<T> {}(v) } -> std::convertible_to<size_t>; }) {
                    return std::hash<T> {}(val);
                } else {
                    return typeid(T).hash_code();
                }
            }

            std::string to_string() const override
            {
                if constexpr (fmt::is_formattable<T>::value) {
                    return fmt::format("{}", val);
                } else {
                    return fmt::format("object<{}>", typeid(T).name());
                }
            }
        };

        std::shared_ptr<const concept_t> _ptr;
    };

    struct value {
        enum class kind: uint8_t {
            nil, boolean, int64, uint64, float32, float64, text, binary, array, map, ext, object
        };

        using content_type = std::variant<nil_t, bool, int64_t, uint64_t, float, double, std::string, uint8_vector,
            msgpack::array, msgpack::map, msgpack::ext, msgpack::object>;

        static const char *type_name(kind k);

        value() =default;
        value(const value &) =default;
        value(value &&) =default;

        value(const nil_t)
        {
        }

        value(std::nullptr_t)
        {
        }

        value(const bool b):
            _content { b }
        {
        }

        template<std::signed_integral T>
        value(const T i):
            _content { static_cast<int64_t>(i) }
        {
        }

        template<std::unsigned_integral T>
            requires (!std::is_same_v<T, bool>)
        value(const T u):
            _content { static_cast<uint64_t>(u) }
        {
        }

        value(const float f):
            _content { f }
        {
        }

        value(const double d):
            _content { d }
        {
        }

        value(std::string s):
            _content { std::move(s) }
        {
        }

        value(const std::string_view s):
            _content { std::string { s } }
        {
        }

        value(const char *s):
            _content { std::string { s } }
        {
        }

        value(uint8_vector bytes):
            _content { std::move(bytes) }
        {
        }

        value(msgpack::array a):
            _content { std::move(a) }
        {
        }

        value(msgpack::map m):
            _content { std::move(m) }
        {
        }

        value(msgpack::ext e):
            _content { std::move(e) }
        {
        }

        value(msgpack::object o):
            _content { std::move(o) }
        {
        }

        value &operator=(const value &) =default;
        value &operator=(value &&) =default;

        bool operator==(const value &o) const
        {
            return _content == o._content;
        }

        kind type() const noexcept
        {
            return static_cast<kind>(_content.index());
        }

        const char *type_name() const
        {
            return type_name(type());
        }

        bool is_nil() const noexcept
        {
            return std::holds_alternative<nil_t>(_content);
        }

        template<typename T>
        bool is() const noexcept
        {
            return std::holds_alternative<T>(_content);
        }

        bool boolean(const std::source_location &loc=std::source_location::current()) const
        {
            return _get<bool>(kind::boolean, loc);
        }

        int64_t int64(const std::source_location &loc=std::source_location::current()) const
        {
            return _get<int64_t>(kind::int64, loc);
        }

        uint64_t uint64(const std::source_location &loc=std::source_location::current()) const
        {
            return _get<uint64_t>(kind::uint64, loc);
        }

        float float32(const std::source_location &loc=std::source_location::current()) const
        {
            return _get<float>(kind::float32, loc);
        }

        double float64(const std::source_location &loc=std::source_location::current()) const
        {
            return _get<double>(kind::float64, loc);
        }

        const std::string &text(const std::source_location &loc=std::source_location::current()) const
        {
            return _get<std::string>(kind::text, loc);
        }

        const uint8_vector &binary(const std::source_location &loc=std::source_location::current()) const
        {
            return _get<uint8_vector>(kind::binary, loc);
        }

        const msgpack::array &array(const std::source_location &loc=std::source_location::current()) const
        {
            return _get<msgpack::array>(kind::array, loc);
        }

        const msgpack::map &map(const std::source_location &loc=std::source_location::current()) const
        {
            return _get<msgpack::map>(kind::map, loc);
        }

        const msgpack::ext &ext(const std::source_location &loc=std::source_location::current()) const
        {
            return _get<msgpack::ext>(kind::ext, loc);
        }

        const msgpack::object &object(const std::source_location &loc=std::source_location::current()) const
        {
            return _get<msgpack::object>(kind::object, loc);
        }

        // the host value when this is an object holding a T, nullptr otherwise
        template<typename T>
        const T *object_if() const noexcept
        {
            if (const auto *obj = std::get_if<msgpack::object>(&_content); obj)
                return obj->get_if<T>();
            return nullptr;
        }

        // either integer variant converted to T; throws when the value does not fit
        template<std::integral T>
        T as(const std::source_location &loc=std::source_location::current()) const
        {
            if (const auto *i = std::get_if<int64_t>(&_content); i)
                return narrow_cast<T>(*i);
            return narrow_cast<T>(_get<uint64_t>(kind::uint64, loc));
        }

        size_t hash() const;

        const content_type &content() const noexcept
        {
            return _content;
        }
    private:
        content_type _content {};

        template<typename T>
        const T &_get(const kind exp_type, const std::source_location &loc) const
        {
            if (const auto *ptr = std::get_if<T>(&_content); ptr) [[likely]]
                return *ptr;
            throw error(fmt::format("invalid msgpack value access, expecting type {} while the present value is {} in file {} line {}!",
                type_name(exp_type), type_name(), loc.file_name(), loc.line()));
        }
    };

    inline const value &array::at(const size_t pos, const std::source_location &loc) const
    {
        if (pos < size()) [[likely]]
            return operator[](pos);
        throw error(fmt::format("invalid array index {} for an array of size {} in file {} line {}!",
            pos, size(), loc.file_name(), loc.line()));
    }

    inline const value *map::find(const value &key) const
    {
        for (const auto &[k, v]: *this) {
            if (k == key)
                return &v;
        }
        return nullptr;
    }

    inline const value &map::at(const value &key, const std::source_location &loc) const
    {
        if (const auto *v = find(key); v) [[likely]]
            return *v;
        throw error(fmt::format("a map of size {} has no key of type {} in file {} line {}!",
            size(), key.type_name(), loc.file_name(), loc.line()));
    }
}

namespace std {
    template<>
    struct hash<micro_pack::msgpack::value> {
        size_t operator()(const micro_pack::msgpack::value &v) const
        {
            return v.hash();
        }
    };
}

namespace fmt {
    template<>
    struct formatter<micro_pack::msgpack::value::kind>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}", micro_pack::msgpack::value::type_name(v));
        }
    };

    template<>
    struct formatter<micro_pack::msgpack::ext>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "ext({}, {})", v.type, v.data);
        }
    };

    template<>
    struct formatter<micro_pack::msgpack::object>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}", v.to_string());
        }
    };

    template<>
    struct formatter<micro_pack::msgpack::value>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using namespace micro_pack::msgpack;
            return std::visit([&](const auto &c) {
                using T = std::decay_t<decltype(c)>;
                if constexpr (std::is_same_v<T, nil_t>) {
                    return fmt::format_to(ctx.out(), "nil");
                } else if constexpr (std::is_same_v<T, std::string>) {
                    return fmt::format_to(ctx.out(), "\"{}\"", c);
                } else if constexpr (std::is_same_v<T, micro_pack::uint8_vector>) {
                    return fmt::format_to(ctx.out(), "#{}", c);
                } else if constexpr (std::is_same_v<T, micro_pack::msgpack::array>) {
                    auto out_it = fmt::format_to(ctx.out(), "[");
                    for (auto it = c.begin(); it != c.end(); ++it)
                        out_it = fmt::format_to(out_it, "{}{}", *it, std::next(it) == c.end() ? "" : ", ");
                    return fmt::format_to(out_it, "]");
                } else if constexpr (std::is_same_v<T, micro_pack::msgpack::map>) {
                    auto out_it = fmt::format_to(ctx.out(), "{{");
                    for (auto it = c.begin(); it != c.end(); ++it)
                        out_it = fmt::format_to(out_it, "{}: {}{}", it->first, it->second, std::next(it) == c.end() ? "" : ", ");
                    return fmt::format_to(out_it, "}}");
                } else {
                    return fmt::format_to(ctx.out(), "{}", c);
                }
            }, v.content());
        }
    };
}

#endif // !MICRO_PACK_MSGPACK_VALUE_HPP
