/* This file is part of Aptos Client project
 * Copyright (c) 2025 Aptos Client developers */

#include <ac/abi/module-abi.hpp>

namespace aptos_client::abi {
    static std::vector<std::string> string_array(const json::object &obj, const std::string_view key)
    {
        std::vector<std::string> res {};
        for (const auto &v: obj.at(key).as_array())
            res.emplace_back(v.as_string());
        return res;
    }

    function_abi function_abi::from_json(const json::value &j)
    {
        try {
            const auto &obj = j.as_object();
            function_abi res {};
            res.name = std::string { obj.at("name").as_string() };
            if (const auto *v = obj.if_contains("visibility"); v)
                res.visibility = std::string { v->as_string() };
            res.is_entry = obj.at("is_entry").as_bool();
            res.is_view = obj.at("is_view").as_bool();
            res.generic_type_params = obj.at("generic_type_params").as_array().size();
            res.params = string_array(obj, "params");
            res.returns = string_array(obj, "return");
            return res;
        } catch (const std::exception &ex) {
            throw error("malformed function ABI", ex);
        }
    }

    module_abi module_abi::from_json(const json::value &j)
    {
        if (const auto *obj = j.if_object(); obj) {
            if (const auto *abi = obj->if_contains("abi"); abi)
                return from_json(*abi);
        }
        try {
            const auto &obj = j.as_object();
            module_abi res {};
            res.addr = move::address::from_string_relaxed(obj.at("address").as_string());
            res.name = std::string { obj.at("name").as_string() };
            for (const auto &f: obj.at("exposed_functions").as_array())
                res.exposed_functions.emplace_back(function_abi::from_json(f));
            return res;
        } catch (const std::exception &ex) {
            throw error("malformed module ABI", ex);
        }
    }

    const function_abi *module_abi::find(const std::string_view fn_name) const
    {
        for (const auto &f: exposed_functions) {
            if (f.name == fn_name)
                return &f;
        }
        return nullptr;
    }
}
