/* This file is part of Aptos Client project
 * Copyright (c) 2025 Aptos Client developers */
#ifndef APTOS_CLIENT_ABI_BUILDER_HPP
#define APTOS_CLIENT_ABI_BUILDER_HPP

#include <ac/abi/marshaller.hpp>
#include <ac/abi/module-abi.hpp>
#include <ac/tx/payload.hpp>

namespace aptos_client::abi {
    /*
     * Binds user arguments to an entry function of the module.
     * Leading signer and &signer parameters are filled in by the chain and take no argument.
     * Throws value_error on count mismatches and conversion failures.
     */
    extern tx::entry_function entry_function_from_abi(const module_abi &abi, const move::address &addr, std::string_view module_name,
        std::string_view function, const std::vector<type_arg> &type_args, const std::vector<arg_value> &args, const marshal_options &opts={});
    extern tx::entry_function entry_function_from_abi(const function_abi &fn, const move::address &addr, std::string_view module_name,
        const std::vector<type_arg> &type_args, const std::vector<arg_value> &args, const marshal_options &opts={});

    extern tx::view_payload view_payload_from_abi(const module_abi &abi, const move::address &addr, std::string_view module_name,
        std::string_view function, const std::vector<type_arg> &type_args, const std::vector<arg_value> &args, const marshal_options &opts={});
    extern tx::view_payload view_payload_from_abi(const function_abi &fn, const move::address &addr, std::string_view module_name,
        const std::vector<type_arg> &type_args, const std::vector<arg_value> &args, const marshal_options &opts={});
}

#endif // !APTOS_CLIENT_ABI_BUILDER_HPP
