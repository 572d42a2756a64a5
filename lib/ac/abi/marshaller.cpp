/* This file is part of Aptos Client project
 * Copyright (c) 2025 Aptos Client developers */

#include <cmath>
#include <ac/abi/marshaller.hpp>
#include <ac/bcs.hpp>
#include <ac/logger.hpp>

namespace aptos_client::abi {
    using move::type_tag;
    using move::type_tag_kind;

    std::string_view arg_value::type_name() const
    {
        switch (val.index()) {
            case 0: return "null";
            case 1: return "bool";
            case 2: return "int64";
            case 3: return "uint64";
            case 4: return "double";
            case 5: return "big integer";
            case 6: return "string";
            case 7: return "bytes";
            case 8: return "address";
            case 9: return "sequence";
            default: throw error(fmt::format("unexpected arg_value index: {}", val.index()));
        }
    }

    namespace {
        struct int_spec {
            size_t bits;
            bool is_signed;
        };

        static std::optional<int_spec> integer_spec(const type_tag_kind kind)
        {
            switch (kind) {
                case type_tag_kind::u8: return int_spec { 8, false };
                case type_tag_kind::u16: return int_spec { 16, false };
                case type_tag_kind::u32: return int_spec { 32, false };
                case type_tag_kind::u64: return int_spec { 64, false };
                case type_tag_kind::u128: return int_spec { 128, false };
                case type_tag_kind::u256: return int_spec { 256, false };
                case type_tag_kind::i8: return int_spec { 8, true };
                case type_tag_kind::i16: return int_spec { 16, true };
                case type_tag_kind::i32: return int_spec { 32, true };
                case type_tag_kind::i64: return int_spec { 64, true };
                case type_tag_kind::i128: return int_spec { 128, true };
                case type_tag_kind::i256: return int_spec { 256, true };
                default: return {};
            }
        }

        static cpp_int double_to_integer(const double d, const type_tag_kind kind)
        {
            if (!std::isfinite(d) || std::trunc(d) != d)
                throw value_error(fmt::format("{} is not an integer and cannot be converted to {}", d, kind));
            // 2^64 and -2^63 are exact in binary floating point
            if (d >= 0 && d < 18446744073709551616.0)
                return cpp_int { static_cast<uint64_t>(d) };
            if (d < 0 && d >= -9223372036854775808.0)
                return cpp_int { static_cast<int64_t>(d) };
            throw value_error(fmt::format("{} is out of range for {}", d, kind));
        }

        static cpp_int to_integer(const arg_value &arg, const type_tag_kind kind)
        {
            return std::visit([&](const auto &v) -> cpp_int {
                using T = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<T, int64_t> || std::is_same_v<T, uint64_t>) {
                    return cpp_int { v };
                } else if constexpr (std::is_same_v<T, cpp_int>) {
                    return v;
                } else if constexpr (std::is_same_v<T, double>) {
                    return double_to_integer(v, kind);
                } else if constexpr (std::is_same_v<T, std::string>) {
                    try {
                        return big_int_from_string(v);
                    } catch (const error &ex) {
                        throw value_error(fmt::format("cannot convert '{}' to {}", v, kind), ex);
                    }
                } else {
                    throw value_error(fmt::format("cannot convert a {} value to {}", arg.type_name(), kind));
                }
            }, arg.val);
        }

        static move::address to_address(const arg_value &arg)
        {
            if (const auto *a = arg.get_if<move::address>(); a)
                return *a;
            if (const auto *s = arg.get_if<std::string>(); s) {
                try {
                    return move::address::from_string_relaxed(*s);
                } catch (const error &ex) {
                    throw value_error(fmt::format("'{}' is not a valid address", *s), ex);
                }
            }
            throw value_error(fmt::format("cannot convert a {} value to address", arg.type_name()));
        }

        static void encode_integer(bcs::encoder &enc, const cpp_int &val, const type_tag_kind kind)
        {
            switch (kind) {
                case type_tag_kind::u8: enc.u8(val.convert_to<uint8_t>()); break;
                case type_tag_kind::u16: enc.u16(val.convert_to<uint16_t>()); break;
                case type_tag_kind::u32: enc.u32(val.convert_to<uint32_t>()); break;
                case type_tag_kind::u64: enc.u64(val.convert_to<uint64_t>()); break;
                case type_tag_kind::u128: enc.u128(val); break;
                case type_tag_kind::u256: enc.u256(val); break;
                case type_tag_kind::i8: enc.i8(val.convert_to<int8_t>()); break;
                case type_tag_kind::i16: enc.i16(val.convert_to<int16_t>()); break;
                case type_tag_kind::i32: enc.i32(val.convert_to<int32_t>()); break;
                case type_tag_kind::i64: enc.i64(val.convert_to<int64_t>()); break;
                case type_tag_kind::i128: enc.i128(val); break;
                case type_tag_kind::i256: enc.i256(val); break;
                default: throw type_tag_error(fmt::format("{} is not an integer type", kind));
            }
        }

        struct converter {
            const std::vector<type_tag> &generics;
            const marshal_options &opts;

            void convert(bcs::encoder &enc, const type_tag &tag, const arg_value &arg) const
            {
                std::visit([&](const auto &t) {
                    using T = std::decay_t<decltype(t)>;
                    if constexpr (std::is_same_v<T, move::primitive_tag>) {
                        _primitive(enc, t.kind, arg);
                    } else if constexpr (std::is_same_v<T, move::vector_tag>) {
                        _vector(enc, *t.elem, arg);
                    } else if constexpr (std::is_same_v<T, move::struct_tag>) {
                        _structure(enc, t, arg);
                    } else if constexpr (std::is_same_v<T, move::reference_tag>) {
                        convert(enc, *t.ref, arg);
                    } else {
                        convert(enc, _resolve(t), arg);
                    }
                }, tag.val);
            }
        private:
            const type_tag &_resolve(const move::generic_tag &g) const
            {
                if (g.index >= generics.size())
                    throw type_tag_error(fmt::format("generic type parameter T{} is out of bounds: {} type arguments given", g.index, generics.size()));
                return generics[g.index];
            }

            // looks through references and generic parameters
            const type_tag &_unwrap(const type_tag &tag) const
            {
                if (const auto *g = tag.get_if<move::generic_tag>(); g)
                    return _unwrap(_resolve(*g));
                if (const auto *r = tag.get_if<move::reference_tag>(); r)
                    return _unwrap(*r->ref);
                return tag;
            }

            static void _primitive(bcs::encoder &enc, const type_tag_kind kind, const arg_value &arg)
            {
                switch (kind) {
                    case type_tag_kind::boolean: {
                        if (const auto *b = arg.get_if<bool>(); b) {
                            enc.boolean(*b);
                            return;
                        }
                        if (const auto *s = arg.get_if<std::string>(); s && (*s == "true" || *s == "false")) {
                            enc.boolean(*s == "true");
                            return;
                        }
                        throw value_error(fmt::format("cannot convert a {} value to bool", arg.type_name()));
                    }
                    case type_tag_kind::address:
                    case type_tag_kind::signer:
                        enc.obj(to_address(arg));
                        return;
                    default: {
                        const auto spec = integer_spec(kind);
                        if (!spec)
                            throw type_tag_error(fmt::format("unsupported primitive type: {}", kind));
                        const auto val = to_integer(arg, kind);
                        const auto min = spec->is_signed ? big_int_min(spec->bits) : cpp_int { 0 };
                        const auto max = spec->is_signed ? big_int_max(spec->bits) : big_uint_max(spec->bits);
                        if (val < min || val > max)
                            throw value_error(fmt::format("{} is out of range for {}", val, kind));
                        encode_integer(enc, val, kind);
                        return;
                    }
                }
            }

            void _vector(bcs::encoder &enc, const type_tag &elem_tag, const arg_value &arg) const
            {
                const auto &elem = _unwrap(elem_tag);
                if (elem.kind() == type_tag_kind::u8) {
                    // text is taken as its UTF-8 bytes, not as hex
                    if (const auto *s = arg.get_if<std::string>(); s) {
                        enc.str(*s);
                        return;
                    }
                    if (const auto *b = arg.get_if<uint8_vector>(); b) {
                        enc.bytes(*b);
                        return;
                    }
                }
                if (arg.is_null())
                    throw value_error(fmt::format("cannot convert null to vector<{}>", elem));
                const auto *items = arg.get_if<arg_sequence>();
                if (!items)
                    throw value_error(fmt::format("cannot convert a {} value to vector<{}>", arg.type_name(), elem));
                enc.uleb128(items->size());
                for (const auto &item: *items)
                    convert(enc, elem, item);
            }

            void _structure(bcs::encoder &enc, const move::struct_tag &st, const arg_value &arg) const
            {
                if (move::is_object_tag(st)) {
                    enc.obj(to_address(arg));
                    return;
                }
                if (move::is_string_tag(st)) {
                    const auto *s = arg.get_if<std::string>();
                    if (!s)
                        throw value_error(fmt::format("cannot convert a {} value to 0x1::string::String", arg.type_name()));
                    enc.str(*s);
                    return;
                }
                if (move::is_option_tag(st)) {
                    if (st.params.size() != 1)
                        throw type_tag_error(fmt::format("an option must have exactly one type parameter: {}", st.to_string()));
                    if (arg.is_null()) {
                        enc.u8(0);
                        return;
                    }
                    if (const auto *s = arg.get_if<std::string>(); s && opts.compatibility_mode) {
                        _serialized_option(enc, st, *s);
                        return;
                    }
                    enc.u8(1);
                    convert(enc, st.params[0], arg);
                    return;
                }
                throw value_error(fmt::format("arguments of type {} are not supported", st.to_string()));
            }

            void _serialized_option(bcs::encoder &enc, const move::struct_tag &st, const std::string &hex) const
            {
                uint8_vector data {};
                try {
                    data = bytes_from_hex(hex);
                } catch (const error &ex) {
                    throw value_error(fmt::format("a serialized option must be hex but got '{}'", hex), ex);
                }
                bcs::decoder dec { data };
                const auto len = dec.uleb128();
                if (dec.ok() && len == 0) {
                    enc.u8(0);
                } else {
                    enc.u8(1);
                    _reencode(enc, dec, st.params[0]);
                }
                if (!dec.ok())
                    throw value_error(fmt::format("malformed serialized {}: {}", st.to_string(), *dec.error_message()));
                logger::warn("converted a pre-serialized {} argument in compatibility mode", st.to_string());
            }

            // copies one value of the given type from dec to enc, validating it along the way
            void _reencode(bcs::encoder &enc, bcs::decoder &dec, const type_tag &tag) const
            {
                std::visit([&](const auto &t) {
                    using T = std::decay_t<decltype(t)>;
                    if constexpr (std::is_same_v<T, move::primitive_tag>) {
                        _reencode_primitive(enc, dec, t.kind);
                    } else if constexpr (std::is_same_v<T, move::vector_tag>) {
                        const auto len = dec.uleb128();
                        enc.uleb128(len);
                        for (uint32_t i = 0; i < len && dec.ok(); ++i)
                            _reencode(enc, dec, *t.elem);
                    } else if constexpr (std::is_same_v<T, move::struct_tag>) {
                        if (move::is_string_tag(t)) {
                            enc.bytes(dec.bytes());
                        } else if (move::is_object_tag(t)) {
                            enc.fixed_bytes(dec.fixed_bytes(32));
                        } else if (move::is_option_tag(t) && t.params.size() == 1) {
                            const auto len = dec.uleb128();
                            if (len > 1)
                                dec.set_error(fmt::format("an option must hold at most one value but got {}", len));
                            enc.u8(len == 1 ? 1 : 0);
                            if (len == 1)
                                _reencode(enc, dec, t.params[0]);
                        } else {
                            throw value_error(fmt::format("serialized arguments of type {} are not supported", t.to_string()));
                        }
                    } else if constexpr (std::is_same_v<T, move::reference_tag>) {
                        _reencode(enc, dec, *t.ref);
                    } else {
                        _reencode(enc, dec, _resolve(t));
                    }
                }, tag.val);
            }

            static void _reencode_primitive(bcs::encoder &enc, bcs::decoder &dec, const type_tag_kind kind)
            {
                switch (kind) {
                    case type_tag_kind::boolean: enc.boolean(dec.boolean()); break;
                    case type_tag_kind::u8: enc.u8(dec.u8()); break;
                    case type_tag_kind::u16: enc.u16(dec.u16()); break;
                    case type_tag_kind::u32: enc.u32(dec.u32()); break;
                    case type_tag_kind::u64: enc.u64(dec.u64()); break;
                    case type_tag_kind::u128: enc.u128(dec.u128()); break;
                    case type_tag_kind::u256: enc.u256(dec.u256()); break;
                    case type_tag_kind::i8: enc.i8(dec.i8()); break;
                    case type_tag_kind::i16: enc.i16(dec.i16()); break;
                    case type_tag_kind::i32: enc.i32(dec.i32()); break;
                    case type_tag_kind::i64: enc.i64(dec.i64()); break;
                    case type_tag_kind::i128: enc.i128(dec.i128()); break;
                    case type_tag_kind::i256: enc.i256(dec.i256()); break;
                    case type_tag_kind::address: enc.fixed_bytes(dec.fixed_bytes(32)); break;
                    default: throw value_error(fmt::format("serialized arguments of type {} are not supported", kind));
                }
            }
        };
    }

    move::type_tag convert_type_tag(const type_arg &arg)
    {
        if (const auto *s = std::get_if<std::string>(&arg); s)
            return type_tag::parse(*s);
        return std::get<type_tag>(arg);
    }

    std::vector<move::type_tag> convert_type_tags(const std::vector<type_arg> &args)
    {
        std::vector<type_tag> res {};
        res.reserve(args.size());
        for (const auto &a: args)
            res.emplace_back(convert_type_tag(a));
        return res;
    }

    uint8_vector convert_arg(const move::type_tag &tag, const arg_value &arg, const std::vector<move::type_tag> &generics, const marshal_options &opts)
    {
        bcs::encoder enc {};
        converter { generics, opts }.convert(enc, tag, arg);
        return std::move(enc.bcs());
    }
}
