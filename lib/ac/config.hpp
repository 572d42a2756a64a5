/* This file is part of Aptos Client project
 * Copyright (c) 2025 Aptos Client developers */
#ifndef APTOS_CLIENT_CONFIG_HPP
#define APTOS_CLIENT_CONFIG_HPP

#include <cstdint>
#include <string>
#include <ac/json.hpp>

namespace aptos_client {
    struct config {
        virtual ~config() =default;

        [[nodiscard]] const json::value &at(const std::string_view &name) const
        {
            return _at_impl(name);
        }

        [[nodiscard]] const json::value *find(const std::string_view &name) const
        {
            const auto &obj = json();
            const auto it = obj.find(name);
            return it != obj.end() ? &it->value() : nullptr;
        }

        [[nodiscard]] const json::object &json() const
        {
            return _json_impl();
        }

        [[nodiscard]] const buffer bytes() const
        {
            return _bytes_impl();
        }
    private:
        virtual const json::value &_at_impl(const std::string_view &name) const =0;
        virtual const json::object &_json_impl() const =0;
        virtual const buffer _bytes_impl() const =0;
    };

    // Used as a config mock
    struct config_json: config {
        explicit config_json(json::object &&json)
            : _json { std::move(json) }, _bytes { buffer { json::serialize(_json) } }
        {
        }
    private:
        const json::object _json;
        const uint8_vector _bytes;

        const json::value &_at_impl(const std::string_view &name) const override
        {
            const auto it = _json.find(name);
            if (it == _json.end())
                throw error(fmt::format("config does not have the requested {} element!", name));
            return it->value();
        }

        const json::object &_json_impl() const override
        {
            return _json;
        }

        const buffer _bytes_impl() const override
        {
            return _bytes;
        }
    };

    struct config_file: config {
        explicit config_file(const std::string &path);
    private:
        uint8_vector _raw;
        json::object _parsed;

        const json::value &_at_impl(const std::string_view &name) const override;
        const json::object &_json_impl() const override
        {
            return _parsed;
        }
        const buffer _bytes_impl() const override
        {
            return _raw;
        }
    };

    // Endpoints and the chain id of an Aptos network. A zero chain id must be requested from the node.
    struct network_config {
        std::string name {};
        uint8_t chain_id = 0;
        std::string node_url {};
        std::string indexer_url {};
        std::string faucet_url {};

        static network_config preset(std::string_view name);
        static network_config from_json(const config &cfg);

        bool operator==(const network_config &o) const =default;
    };

    struct transaction_defaults {
        uint64_t max_gas_amount = 100'000;
        uint64_t gas_unit_price = 100;
        uint64_t expiration_seconds = 300;

        static transaction_defaults from_json(const config &cfg);
    };
}

#endif // !APTOS_CLIENT_CONFIG_HPP
