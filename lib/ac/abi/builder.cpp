/* This file is part of Aptos Client project
 * Copyright (c) 2025 Aptos Client developers */

#include <ac/abi/builder.hpp>

namespace aptos_client::abi {
    using move::type_tag;

    namespace {
        static bool is_signer(const type_tag &tag)
        {
            if (const auto *r = tag.get_if<move::reference_tag>(); r)
                return is_signer(*r->ref);
            return tag.kind() == move::type_tag_kind::signer;
        }

        static const function_abi &find_function(const module_abi &abi, const std::string_view function)
        {
            const auto *fn = abi.find(function);
            if (!fn)
                throw value_error(fmt::format("function {} not found in module {}", function, abi.name));
            return *fn;
        }

        static std::vector<type_tag> parse_params(const function_abi &fn, const bool skip_signers)
        {
            std::vector<type_tag> params {};
            for (const auto &p: fn.params) {
                auto tag = type_tag::parse(p);
                if (skip_signers && params.empty() && is_signer(tag))
                    continue;
                params.emplace_back(std::move(tag));
            }
            return params;
        }

        static tx::entry_function bind(const function_abi &fn, const move::address &addr, const std::string_view module_name,
            const std::vector<type_arg> &type_args, const std::vector<arg_value> &args, const marshal_options &opts, const bool skip_signers)
        {
            if (type_args.size() != fn.generic_type_params)
                throw value_error(fmt::format("function {} expects {} type arguments but got {}", fn.name, fn.generic_type_params, type_args.size()));
            auto tags = convert_type_tags(type_args);
            const auto params = parse_params(fn, skip_signers);
            if (args.size() != params.size())
                throw value_error(fmt::format("function {} expects {} arguments but got {}", fn.name, params.size(), args.size()));
            std::vector<uint8_vector> bcs_args {};
            bcs_args.reserve(args.size());
            for (size_t i = 0; i < args.size(); ++i) {
                try {
                    bcs_args.emplace_back(convert_arg(params[i], args[i], tags, opts));
                } catch (const value_error &ex) {
                    throw value_error(fmt::format("argument {} of {}", i, fn.name), ex);
                }
            }
            return { tx::module_id { addr, std::string { module_name } }, fn.name, std::move(tags), std::move(bcs_args) };
        }
    }

    tx::entry_function entry_function_from_abi(const module_abi &abi, const move::address &addr, const std::string_view module_name,
        const std::string_view function, const std::vector<type_arg> &type_args, const std::vector<arg_value> &args, const marshal_options &opts)
    {
        const auto &fn = find_function(abi, function);
        if (!fn.is_entry)
            throw value_error(fmt::format("function {} is not an entry function in module {}", function, abi.name));
        return entry_function_from_abi(fn, addr, module_name, type_args, args, opts);
    }

    tx::entry_function entry_function_from_abi(const function_abi &fn, const move::address &addr, const std::string_view module_name,
        const std::vector<type_arg> &type_args, const std::vector<arg_value> &args, const marshal_options &opts)
    {
        return bind(fn, addr, module_name, type_args, args, opts, true);
    }

    tx::view_payload view_payload_from_abi(const module_abi &abi, const move::address &addr, const std::string_view module_name,
        const std::string_view function, const std::vector<type_arg> &type_args, const std::vector<arg_value> &args, const marshal_options &opts)
    {
        const auto &fn = find_function(abi, function);
        if (!fn.is_view)
            throw value_error(fmt::format("function {} is not a view function in module {}", function, abi.name));
        return view_payload_from_abi(fn, addr, module_name, type_args, args, opts);
    }

    tx::view_payload view_payload_from_abi(const function_abi &fn, const move::address &addr, const std::string_view module_name,
        const std::vector<type_arg> &type_args, const std::vector<arg_value> &args, const marshal_options &opts)
    {
        return { bind(fn, addr, module_name, type_args, args, opts, false) };
    }
}
