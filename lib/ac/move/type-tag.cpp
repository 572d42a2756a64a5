/* This file is part of Aptos Client project
 * Copyright (c) 2025 Aptos Client developers */

#include <cctype>
#include <charconv>
#include <ac/move/type-tag.hpp>

namespace aptos_client::move {
    namespace {
        // bounds the recursion of the BCS decoder and the text parser
        static constexpr size_t max_nesting = 64;

        struct primitive_info {
            std::string_view name;
            type_tag_kind kind;
        };

        static constexpr std::array<primitive_info, 15> primitives {
            primitive_info { "bool", type_tag_kind::boolean },
            primitive_info { "u8", type_tag_kind::u8 },
            primitive_info { "u16", type_tag_kind::u16 },
            primitive_info { "u32", type_tag_kind::u32 },
            primitive_info { "u64", type_tag_kind::u64 },
            primitive_info { "u128", type_tag_kind::u128 },
            primitive_info { "u256", type_tag_kind::u256 },
            primitive_info { "i8", type_tag_kind::i8 },
            primitive_info { "i16", type_tag_kind::i16 },
            primitive_info { "i32", type_tag_kind::i32 },
            primitive_info { "i64", type_tag_kind::i64 },
            primitive_info { "i128", type_tag_kind::i128 },
            primitive_info { "i256", type_tag_kind::i256 },
            primitive_info { "address", type_tag_kind::address },
            primitive_info { "signer", type_tag_kind::signer }
        };

        static std::optional<type_tag_kind> find_primitive(const std::string_view name)
        {
            for (const auto &p: primitives) {
                if (p.name == name)
                    return p.kind;
            }
            return {};
        }

        static bool is_identifier(const std::string_view s)
        {
            if (s.empty())
                return false;
            return std::all_of(s.begin(), s.end(), [](const char c) {
                return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
            });
        }

        static bool is_space(const char c)
        {
            return c == ' ' || c == '\t' || c == '\n' || c == '\r';
        }

        struct parser {
            explicit parser(const std::string_view text): _text { text }
            {
            }

            type_tag parse()
            {
                auto res = _type(0);
                _skip_space();
                if (_pos != _text.size())
                    throw type_tag_error(fmt::format("unexpected trailing input at position {} in '{}'", _pos, _text));
                return res;
            }
        private:
            std::string_view _text;
            size_t _pos = 0;

            void _skip_space()
            {
                while (_pos < _text.size() && is_space(_text[_pos]))
                    ++_pos;
            }

            std::string_view _word()
            {
                const auto start = _pos;
                while (_pos < _text.size()) {
                    const auto c = _text[_pos];
                    if (c == '<' || c == '>' || c == ',' || c == '&' || is_space(c))
                        break;
                    ++_pos;
                }
                return _text.substr(start, _pos - start);
            }

            type_tag _type(const size_t depth)
            {
                if (depth >= max_nesting)
                    throw type_tag_error(fmt::format("type nesting exceeds {} levels in '{}'", max_nesting, _text));
                _skip_space();
                if (_pos < _text.size() && _text[_pos] == '&') {
                    ++_pos;
                    return type_tag::reference(_type(depth + 1));
                }
                const auto word = _word();
                if (word.empty())
                    throw type_tag_error(fmt::format("expected a type at position {} in '{}'", _pos, _text));
                std::vector<type_tag> params {};
                _skip_space();
                if (_pos < _text.size() && _text[_pos] == '<') {
                    ++_pos;
                    for (;;) {
                        params.emplace_back(_type(depth + 1));
                        _skip_space();
                        if (_pos >= _text.size())
                            throw type_tag_error(fmt::format("missing '>' in '{}'", _text));
                        const auto c = _text[_pos++];
                        if (c == '>')
                            break;
                        if (c != ',')
                            throw type_tag_error(fmt::format("unexpected '{}' in the type parameters of '{}'", c, _text));
                    }
                }
                return _build(word, std::move(params));
            }

            static type_tag _build(const std::string_view word, std::vector<type_tag> params)
            {
                if (const auto kind = find_primitive(word); kind) {
                    if (!params.empty())
                        throw type_tag_error(fmt::format("{} cannot have type parameters", word));
                    return type_tag::primitive(*kind);
                }
                if (word == "vector") {
                    if (params.size() != 1)
                        throw type_tag_error(fmt::format("vector expects 1 type parameter but got {}", params.size()));
                    return type_tag::vector(params.front());
                }
                if (word.find("::") == std::string_view::npos) {
                    // T<n> with no leading zeros
                    if (word.size() > 1 && word[0] == 'T' && !(word.size() > 2 && word[1] == '0')) {
                        uint32_t idx = 0;
                        const auto *end = word.data() + word.size();
                        const auto [ptr, ec] = std::from_chars(word.data() + 1, end, idx);
                        if (ec == std::errc {} && ptr == end) {
                            if (!params.empty())
                                throw type_tag_error(fmt::format("{} cannot have type parameters", word));
                            return type_tag::generic(idx);
                        }
                    }
                    throw type_tag_error(fmt::format("unknown type: '{}'", word));
                }
                return _build_struct(word, std::move(params));
            }

            static type_tag _build_struct(const std::string_view word, std::vector<type_tag> params)
            {
                const auto sep1 = word.find("::");
                const auto sep2 = word.find("::", sep1 + 2);
                if (sep2 == std::string_view::npos || word.find("::", sep2 + 2) != std::string_view::npos)
                    throw type_tag_error(fmt::format("invalid struct type: '{}'", word));
                const auto addr_str = word.substr(0, sep1);
                const auto module = word.substr(sep1 + 2, sep2 - sep1 - 2);
                const auto name = word.substr(sep2 + 2);
                if (!is_identifier(module))
                    throw type_tag_error(fmt::format("invalid module name: '{}'", module));
                if (!is_identifier(name))
                    throw type_tag_error(fmt::format("invalid struct name: '{}'", name));
                try {
                    const auto addr = address::from_string_relaxed(addr_str);
                    return type_tag::structure(addr, std::string { module }, std::string { name }, std::move(params));
                } catch (const address_error &ex) {
                    throw type_tag_error(fmt::format("invalid struct address: '{}'", addr_str), ex);
                }
            }
        };

        static type_tag decode_tag(bcs::decoder &dec, size_t depth);

        static std::vector<type_tag> decode_params(bcs::decoder &dec, const size_t depth)
        {
            return dec.seq<type_tag>([depth](bcs::decoder &d) { return decode_tag(d, depth + 1); });
        }

        static type_tag decode_tag(bcs::decoder &dec, const size_t depth)
        {
            if (depth >= max_nesting) {
                dec.set_error(fmt::format("type tag nesting exceeds {} levels", max_nesting));
                return type_tag::primitive(type_tag_kind::boolean);
            }
            switch (const auto kind = static_cast<type_tag_kind>(dec.variant()); kind) {
                case type_tag_kind::boolean:
                case type_tag_kind::u8:
                case type_tag_kind::u16:
                case type_tag_kind::u32:
                case type_tag_kind::u64:
                case type_tag_kind::u128:
                case type_tag_kind::u256:
                case type_tag_kind::i8:
                case type_tag_kind::i16:
                case type_tag_kind::i32:
                case type_tag_kind::i64:
                case type_tag_kind::i128:
                case type_tag_kind::i256:
                case type_tag_kind::address:
                case type_tag_kind::signer:
                    return type_tag::primitive(kind);
                case type_tag_kind::vector:
                    return type_tag::vector(decode_tag(dec, depth + 1));
                case type_tag_kind::structure: {
                    struct_tag st {};
                    st.addr = address::from_bcs(dec);
                    st.module = dec.str();
                    st.name = dec.str();
                    st.params = decode_params(dec, depth);
                    return type_tag { std::move(st) };
                }
                case type_tag_kind::reference:
                    return type_tag::reference(decode_tag(dec, depth + 1));
                case type_tag_kind::generic:
                    return type_tag::generic(dec.u32());
                default:
                    if (dec.ok())
                        dec.set_error(fmt::format("unknown type tag variant: {}", static_cast<uint32_t>(kind)));
                    return type_tag::primitive(type_tag_kind::boolean);
            }
        }
    }

    std::string_view kind_name(const type_tag_kind kind)
    {
        for (const auto &p: primitives) {
            if (p.kind == kind)
                return p.name;
        }
        switch (kind) {
            case type_tag_kind::vector: return "vector";
            case type_tag_kind::structure: return "struct";
            case type_tag_kind::generic: return "generic";
            case type_tag_kind::reference: return "reference";
            default: return "unknown";
        }
    }

    bool vector_tag::operator==(const vector_tag &o) const
    {
        return *elem == *o.elem;
    }

    bool reference_tag::operator==(const reference_tag &o) const
    {
        return *ref == *o.ref;
    }

    struct_tag struct_tag::from_bcs(bcs::decoder &dec)
    {
        struct_tag st {};
        st.addr = address::from_bcs(dec);
        st.module = dec.str();
        st.name = dec.str();
        st.params = decode_params(dec, 1);
        return st;
    }

    void struct_tag::to_bcs(bcs::encoder &enc) const
    {
        addr.to_bcs(enc);
        enc.str(module).str(name).seq(params);
    }

    bool struct_tag::operator==(const struct_tag &o) const
    {
        return addr == o.addr && module == o.module && name == o.name && params == o.params;
    }

    bool struct_tag::is(const address &a, const std::string_view mod, const std::string_view nm) const
    {
        return addr == a && module == mod && name == nm;
    }

    std::string struct_tag::to_string() const
    {
        std::string res = fmt::format("{}::{}::{}", addr.to_string(), module, name);
        if (!params.empty()) {
            res += '<';
            for (size_t i = 0; i < params.size(); ++i) {
                if (i > 0)
                    res += ',';
                res += params[i].to_string();
            }
            res += '>';
        }
        return res;
    }

    type_tag type_tag::parse(const std::string_view text)
    {
        return parser { text }.parse();
    }

    type_tag type_tag::from_bcs(bcs::decoder &dec)
    {
        return decode_tag(dec, 0);
    }

    type_tag type_tag::primitive(const type_tag_kind kind)
    {
        switch (kind) {
            case type_tag_kind::vector:
            case type_tag_kind::structure:
            case type_tag_kind::generic:
            case type_tag_kind::reference:
                throw type_tag_error(fmt::format("{} is not a primitive type", kind));
            default:
                return type_tag { primitive_tag { kind } };
        }
    }

    type_tag type_tag::vector(const type_tag &elem)
    {
        return type_tag { vector_tag { std::make_shared<const type_tag>(elem) } };
    }

    type_tag type_tag::reference(const type_tag &ref)
    {
        return type_tag { reference_tag { std::make_shared<const type_tag>(ref) } };
    }

    type_tag type_tag::generic(const uint32_t index)
    {
        return type_tag { generic_tag { index } };
    }

    type_tag type_tag::structure(const address &addr, std::string module, std::string name, std::vector<type_tag> params)
    {
        return type_tag { struct_tag { addr, std::move(module), std::move(name), std::move(params) } };
    }

    type_tag_kind type_tag::kind() const
    {
        return std::visit([](const auto &v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, primitive_tag>) {
                return v.kind;
            } else if constexpr (std::is_same_v<T, vector_tag>) {
                return type_tag_kind::vector;
            } else if constexpr (std::is_same_v<T, struct_tag>) {
                return type_tag_kind::structure;
            } else if constexpr (std::is_same_v<T, reference_tag>) {
                return type_tag_kind::reference;
            } else {
                return type_tag_kind::generic;
            }
        }, val);
    }

    void type_tag::to_bcs(bcs::encoder &enc) const
    {
        enc.variant(static_cast<uint32_t>(kind()));
        std::visit([&enc](const auto &v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, vector_tag>) {
                v.elem->to_bcs(enc);
            } else if constexpr (std::is_same_v<T, struct_tag>) {
                v.to_bcs(enc);
            } else if constexpr (std::is_same_v<T, reference_tag>) {
                v.ref->to_bcs(enc);
            } else if constexpr (std::is_same_v<T, generic_tag>) {
                enc.u32(v.index);
            }
        }, val);
    }

    std::string type_tag::to_string() const
    {
        return std::visit([](const auto &v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, primitive_tag>) {
                return std::string { kind_name(v.kind) };
            } else if constexpr (std::is_same_v<T, vector_tag>) {
                return fmt::format("vector<{}>", v.elem->to_string());
            } else if constexpr (std::is_same_v<T, struct_tag>) {
                return v.to_string();
            } else if constexpr (std::is_same_v<T, reference_tag>) {
                return fmt::format("&{}", v.ref->to_string());
            } else {
                return fmt::format("T{}", v.index);
            }
        }, val);
    }

    type_tag string_tag()
    {
        return type_tag::structure(address_one, "string", "String");
    }

    type_tag option_tag(const type_tag &inner)
    {
        return type_tag::structure(address_one, "option", "Option", { inner });
    }

    type_tag object_tag(const type_tag &inner)
    {
        return type_tag::structure(address_one, "object", "Object", { inner });
    }

    type_tag aptos_coin_tag()
    {
        return type_tag::structure(address_one, "aptos_coin", "AptosCoin");
    }

    bool is_string_tag(const struct_tag &st)
    {
        return st.is(address_one, "string", "String");
    }

    bool is_option_tag(const struct_tag &st)
    {
        return st.is(address_one, "option", "Option");
    }

    bool is_object_tag(const struct_tag &st)
    {
        return st.is(address_one, "object", "Object");
    }
}
