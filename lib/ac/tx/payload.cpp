/* This file is part of Aptos Client project
 * Copyright (c) 2025 Aptos Client developers */

#include <cctype>
#include <ac/tx/payload.hpp>

namespace aptos_client::tx {
    namespace {
        static bool is_identifier(const std::string_view s)
        {
            return !s.empty() && std::all_of(s.begin(), s.end(), [](const char c) {
                return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
            });
        }

        static std::vector<std::string_view> split_path(std::string_view text)
        {
            std::vector<std::string_view> parts {};
            for (;;) {
                const auto sep = text.find("::");
                if (sep == std::string_view::npos) {
                    parts.emplace_back(text);
                    return parts;
                }
                parts.emplace_back(text.substr(0, sep));
                text = text.substr(sep + 2);
            }
        }

        static module_id make_module_id(const std::string_view addr, const std::string_view name, const std::string_view text)
        {
            if (!is_identifier(name))
                throw value_error(fmt::format("invalid module name in '{}'", text));
            try {
                return { address::from_string_relaxed(addr), std::string { name } };
            } catch (const error &ex) {
                throw value_error(fmt::format("invalid module address in '{}'", text), ex);
            }
        }
    }

    module_id module_id::parse(const std::string_view text)
    {
        const auto parts = split_path(text);
        if (parts.size() != 2)
            throw value_error(fmt::format("a module id must look like 0x1::module but got '{}'", text));
        return make_module_id(parts[0], parts[1], text);
    }

    module_id module_id::from_bcs(bcs::decoder &dec)
    {
        auto addr = address::from_bcs(dec);
        return { std::move(addr), dec.str() };
    }

    void module_id::to_bcs(bcs::encoder &enc) const
    {
        enc.obj(addr).str(name);
    }

    std::string module_id::to_string() const
    {
        return fmt::format("{}::{}", addr.to_string(), name);
    }

    entry_function entry_function::make(const std::string_view name, std::vector<type_tag> type_args, std::vector<uint8_vector> args)
    {
        const auto parts = split_path(name);
        if (parts.size() != 3)
            throw value_error(fmt::format("a function name must look like 0x1::module::function but got '{}'", name));
        if (!is_identifier(parts[2]))
            throw value_error(fmt::format("invalid function name in '{}'", name));
        return { make_module_id(parts[0], parts[1], name), std::string { parts[2] }, std::move(type_args), std::move(args) };
    }

    entry_function entry_function::from_bcs(bcs::decoder &dec)
    {
        entry_function res {};
        res.module = module_id::from_bcs(dec);
        res.function = dec.str();
        res.type_args = dec.seq<type_tag>();
        res.args = dec.seq<uint8_vector>([](bcs::decoder &d) { return d.bytes(); });
        return res;
    }

    void entry_function::to_bcs(bcs::encoder &enc) const
    {
        enc.obj(module).str(function).seq(type_args);
        enc.seq(args, [](bcs::encoder &e, const uint8_vector &arg) { e.bytes(arg); });
    }

    script_argument script_argument::from_bcs(bcs::decoder &dec)
    {
        switch (const auto typ = static_cast<variant_type>(dec.variant()); typ) {
            case variant_type::u8: return { dec.u8() };
            case variant_type::u64: return { dec.u64() };
            case variant_type::u128: return { u128_arg { dec.u128() } };
            case variant_type::address: return { address::from_bcs(dec) };
            case variant_type::u8_vector: return { dec.bytes() };
            case variant_type::boolean: return { dec.boolean() };
            case variant_type::u16: return { dec.u16() };
            case variant_type::u32: return { dec.u32() };
            case variant_type::u256: return { u256_arg { dec.u256() } };
            default:
                if (dec.ok())
                    dec.set_error(fmt::format("unknown script argument variant: {}", static_cast<uint32_t>(typ)));
                return { uint8_t { 0 } };
        }
    }

    void script_argument::to_bcs(bcs::encoder &enc) const
    {
        enc.variant(static_cast<uint32_t>(variant()));
        std::visit([&enc](const auto &v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, uint8_t>)
                enc.u8(v);
            else if constexpr (std::is_same_v<T, uint16_t>)
                enc.u16(v);
            else if constexpr (std::is_same_v<T, uint32_t>)
                enc.u32(v);
            else if constexpr (std::is_same_v<T, uint64_t>)
                enc.u64(v);
            else if constexpr (std::is_same_v<T, u128_arg>)
                enc.u128(v.val);
            else if constexpr (std::is_same_v<T, u256_arg>)
                enc.u256(v.val);
            else if constexpr (std::is_same_v<T, bool>)
                enc.boolean(v);
            else if constexpr (std::is_same_v<T, uint8_vector>)
                enc.bytes(v);
            else
                enc.obj(v);
        }, val);
    }

    script_argument::variant_type script_argument::variant() const
    {
        return static_cast<variant_type>(val.index());
    }

    script script::from_bcs(bcs::decoder &dec)
    {
        script res {};
        res.code = dec.bytes();
        res.type_args = dec.seq<type_tag>();
        res.args = dec.seq<script_argument>();
        return res;
    }

    void script::to_bcs(bcs::encoder &enc) const
    {
        enc.bytes(code).seq(type_args).seq(args);
    }

    multisig_payload multisig_payload::from_bcs(bcs::decoder &dec)
    {
        if (const auto typ = dec.variant(); typ != static_cast<uint32_t>(variant_type::entry_function) && dec.ok())
            dec.set_error(fmt::format("unknown multisig payload variant: {}", typ));
        if (!dec.ok())
            return { entry_function {} };
        return { entry_function::from_bcs(dec) };
    }

    void multisig_payload::to_bcs(bcs::encoder &enc) const
    {
        enc.variant(static_cast<uint32_t>(variant_type::entry_function));
        std::get<entry_function>(val).to_bcs(enc);
    }

    multisig multisig::from_bcs(bcs::decoder &dec)
    {
        multisig res {};
        res.multisig_address = address::from_bcs(dec);
        res.payload = dec.option<multisig_payload>();
        return res;
    }

    void multisig::to_bcs(bcs::encoder &enc) const
    {
        enc.obj(multisig_address).option(payload);
    }

    transaction_payload transaction_payload::from_bcs(bcs::decoder &dec)
    {
        switch (const auto typ = static_cast<variant_type>(dec.variant()); typ) {
            case variant_type::script: return { script::from_bcs(dec) };
            case variant_type::entry_function: return { entry_function::from_bcs(dec) };
            case variant_type::multisig: return { multisig::from_bcs(dec) };
            case variant_type::module_bundle:
                if (dec.ok())
                    dec.set_error("module bundle payloads are no longer supported");
                return { script {} };
            default:
                if (dec.ok())
                    dec.set_error(fmt::format("unknown transaction payload variant: {}", static_cast<uint32_t>(typ)));
                return { script {} };
        }
    }

    void transaction_payload::to_bcs(bcs::encoder &enc) const
    {
        enc.variant(static_cast<uint32_t>(variant()));
        std::visit([&enc](const auto &v) { v.to_bcs(enc); }, val);
    }

    transaction_payload::variant_type transaction_payload::variant() const
    {
        switch (val.index()) {
            case 0: return variant_type::script;
            case 1: return variant_type::entry_function;
            case 2: return variant_type::multisig;
            default: throw error(fmt::format("unexpected transaction payload index: {}", val.index()));
        }
    }
}
