/* This file is part of Aptos Client project
 * Copyright (c) 2025 Aptos Client developers */
#ifndef APTOS_CLIENT_TX_PAYLOAD_HPP
#define APTOS_CLIENT_TX_PAYLOAD_HPP

#include <optional>
#include <variant>
#include <ac/move/type-tag.hpp>

namespace aptos_client::tx {
    using move::address;
    using move::type_tag;

    // address::module
    struct module_id {
        address addr {};
        std::string name {};

        // accepts "0x1::coin"
        static module_id parse(std::string_view text);
        static module_id from_bcs(bcs::decoder &dec);
        void to_bcs(bcs::encoder &enc) const;
        std::string to_string() const;
        bool operator==(const module_id &o) const =default;
    };

    /*
     * A call of a public entry function.
     * The arguments are already BCS-encoded; each is written as a length-prefixed byte string.
     */
    struct entry_function {
        module_id module {};
        std::string function {};
        std::vector<type_tag> type_args {};
        std::vector<uint8_vector> args {};

        // accepts "0x1::coin::transfer"
        static entry_function make(std::string_view name, std::vector<type_tag> type_args={}, std::vector<uint8_vector> args={});
        static entry_function from_bcs(bcs::decoder &dec);
        void to_bcs(bcs::encoder &enc) const;
        bool operator==(const entry_function &o) const =default;
    };

    // The body of a BCS view request: the same layout as an entry function
    struct view_payload: entry_function {
        static view_payload from_bcs(bcs::decoder &dec)
        {
            return { entry_function::from_bcs(dec) };
        }
    };

    struct u128_arg {
        cpp_int val {};

        bool operator==(const u128_arg &o) const =default;
    };

    struct u256_arg {
        cpp_int val {};

        bool operator==(const u256_arg &o) const =default;
    };

    // The restricted set of values a script accepts
    struct script_argument {
        enum class variant_type: uint32_t {
            u8 = 0,
            u64 = 1,
            u128 = 2,
            address = 3,
            u8_vector = 4,
            boolean = 5,
            u16 = 6,
            u32 = 7,
            u256 = 8
        };
        using value_type = std::variant<uint8_t, uint64_t, u128_arg, address, uint8_vector, bool, uint16_t, uint32_t, u256_arg>;

        value_type val;

        static script_argument from_bcs(bcs::decoder &dec);
        void to_bcs(bcs::encoder &enc) const;
        variant_type variant() const;
        bool operator==(const script_argument &o) const =default;
    };

    struct script {
        uint8_vector code {};
        std::vector<type_tag> type_args {};
        std::vector<script_argument> args {};

        static script from_bcs(bcs::decoder &dec);
        void to_bcs(bcs::encoder &enc) const;
        bool operator==(const script &o) const =default;
    };

    struct multisig_payload {
        enum class variant_type: uint32_t {
            entry_function = 0
        };
        using value_type = std::variant<entry_function>;

        value_type val;

        static multisig_payload from_bcs(bcs::decoder &dec);
        void to_bcs(bcs::encoder &enc) const;
        bool operator==(const multisig_payload &o) const =default;
    };

    // Executes on behalf of an on-chain multisig account; an absent payload refers to a stored proposal
    struct multisig {
        address multisig_address {};
        std::optional<multisig_payload> payload {};

        static multisig from_bcs(bcs::decoder &dec);
        void to_bcs(bcs::encoder &enc) const;
        bool operator==(const multisig &o) const =default;
    };

    /*
     * Discriminant 1 belongs to the retired module bundle payload.
     * It cannot be constructed and is rejected when decoded.
     */
    struct transaction_payload {
        enum class variant_type: uint32_t {
            script = 0,
            module_bundle = 1,
            entry_function = 2,
            multisig = 3
        };
        using value_type = std::variant<script, entry_function, multisig>;

        value_type val;

        static transaction_payload from_bcs(bcs::decoder &dec);
        void to_bcs(bcs::encoder &enc) const;
        variant_type variant() const;
        bool operator==(const transaction_payload &o) const =default;
    };
}

namespace fmt {
    template<>
    struct formatter<aptos_client::tx::module_id>: formatter<int> {
        template<typename FormatContext>
        auto format(const aptos_client::tx::module_id &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}", v.to_string());
        }
    };

    template<>
    struct formatter<aptos_client::tx::transaction_payload::variant_type>: formatter<int> {
        template<typename FormatContext>
        auto format(const aptos_client::tx::transaction_payload::variant_type &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using aptos_client::tx::transaction_payload;
            switch (v) {
                case transaction_payload::variant_type::script: return fmt::format_to(ctx.out(), "script");
                case transaction_payload::variant_type::module_bundle: return fmt::format_to(ctx.out(), "module_bundle");
                case transaction_payload::variant_type::entry_function: return fmt::format_to(ctx.out(), "entry_function");
                case transaction_payload::variant_type::multisig: return fmt::format_to(ctx.out(), "multisig");
                default: return fmt::format_to(ctx.out(), "unknown({})", static_cast<uint32_t>(v));
            }
        }
    };
}

#endif // !APTOS_CLIENT_TX_PAYLOAD_HPP
