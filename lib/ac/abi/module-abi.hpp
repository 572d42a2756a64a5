/* This file is part of Aptos Client project
 * Copyright (c) 2025 Aptos Client developers */
#ifndef APTOS_CLIENT_ABI_MODULE_ABI_HPP
#define APTOS_CLIENT_ABI_MODULE_ABI_HPP

#include <ac/json.hpp>
#include <ac/move/address.hpp>

namespace aptos_client::abi {
    struct function_abi {
        std::string name {};
        std::string visibility {};
        bool is_entry = false;
        bool is_view = false;
        size_t generic_type_params = 0;
        // Move type strings as returned by the node
        std::vector<std::string> params {};
        std::vector<std::string> returns {};

        static function_abi from_json(const json::value &j);
    };

    struct module_abi {
        move::address addr {};
        std::string name {};
        std::vector<function_abi> exposed_functions {};

        // accepts the bare ABI object or a module response that wraps it under "abi"
        static module_abi from_json(const json::value &j);

        const function_abi *find(std::string_view fn_name) const;
    };
}

#endif // !APTOS_CLIENT_ABI_MODULE_ABI_HPP
