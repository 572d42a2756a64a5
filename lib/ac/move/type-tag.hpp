/* This file is part of Aptos Client project
 * Copyright (c) 2025 Aptos Client developers */
#ifndef APTOS_CLIENT_MOVE_TYPE_TAG_HPP
#define APTOS_CLIENT_MOVE_TYPE_TAG_HPP

#include <memory>
#include <string>
#include <variant>
#include <vector>
#include <ac/move/address.hpp>

namespace aptos_client::move {
    // BCS discriminants of type tags
    enum class type_tag_kind: uint32_t {
        boolean = 0,
        u8 = 1,
        u64 = 2,
        u128 = 3,
        address = 4,
        signer = 5,
        vector = 6,
        structure = 7,
        u16 = 8,
        u32 = 9,
        u256 = 10,
        i8 = 11,
        i16 = 12,
        i32 = 13,
        i64 = 14,
        i128 = 15,
        i256 = 16,
        generic = 254,
        reference = 255
    };

    extern std::string_view kind_name(type_tag_kind kind);

    struct type_tag;
    using type_tag_ptr = std::shared_ptr<const type_tag>;

    // bool, integers, address and signer carry no payload
    struct primitive_tag {
        type_tag_kind kind;

        bool operator==(const primitive_tag &o) const =default;
    };

    struct vector_tag {
        type_tag_ptr elem;

        bool operator==(const vector_tag &o) const;
    };

    struct struct_tag {
        address addr {};
        std::string module {};
        std::string name {};
        std::vector<type_tag> params {};

        static struct_tag from_bcs(bcs::decoder &dec);
        void to_bcs(bcs::encoder &enc) const;
        bool operator==(const struct_tag &o) const;
        // true when the tag names addr::module::name regardless of its type parameters
        bool is(const address &a, std::string_view mod, std::string_view nm) const;
        std::string to_string() const;
    };

    struct reference_tag {
        type_tag_ptr ref;

        bool operator==(const reference_tag &o) const;
    };

    // T<index>: a type parameter of an enclosing generic function
    struct generic_tag {
        uint32_t index = 0;

        bool operator==(const generic_tag &o) const =default;
    };

    /*
     * A Move type. Immutable once constructed, so nested tags are shared.
     * Generic and reference tags only appear in function signatures and never on chain;
     * their BCS payloads are the index as a little-endian u32 and the referenced tag.
     */
    struct type_tag {
        using value_type = std::variant<primitive_tag, vector_tag, struct_tag, reference_tag, generic_tag>;

        value_type val;

        // throws type_tag_error
        static type_tag parse(std::string_view text);
        static type_tag from_bcs(bcs::decoder &dec);

        static type_tag primitive(type_tag_kind kind);
        static type_tag vector(const type_tag &elem);
        static type_tag reference(const type_tag &ref);
        static type_tag generic(uint32_t index);
        static type_tag structure(const address &addr, std::string module, std::string name, std::vector<type_tag> params={});

        type_tag_kind kind() const;
        void to_bcs(bcs::encoder &enc) const;
        std::string to_string() const;

        bool operator==(const type_tag &o) const
        {
            return val == o.val;
        }

        template<typename T>
        const T *get_if() const noexcept
        {
            return std::get_if<T>(&val);
        }
    };

    extern type_tag string_tag();
    extern type_tag option_tag(const type_tag &inner);
    extern type_tag object_tag(const type_tag &inner);
    extern type_tag aptos_coin_tag();

    // checks for well-known 0x1 structs used by the argument marshaller
    extern bool is_string_tag(const struct_tag &st);
    extern bool is_option_tag(const struct_tag &st);
    extern bool is_object_tag(const struct_tag &st);
}

namespace fmt {
    template<>
    struct formatter<aptos_client::move::type_tag>: formatter<int> {
        template<typename FormatContext>
        auto format(const aptos_client::move::type_tag &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}", v.to_string());
        }
    };

    template<>
    struct formatter<aptos_client::move::type_tag_kind>: formatter<int> {
        template<typename FormatContext>
        auto format(const aptos_client::move::type_tag_kind &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}", aptos_client::move::kind_name(v));
        }
    };
}

#endif // !APTOS_CLIENT_MOVE_TYPE_TAG_HPP
