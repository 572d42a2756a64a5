/* This file is part of Aptos Client project
 * Copyright (c) 2025 Aptos Client developers */

#include <ac/common/narrow-cast.hpp>
#include <ac/config.hpp>
#include <ac/logger.hpp>

namespace aptos_client {
    config_file::config_file(const std::string &path)
    {
        const auto j = json::load(path);
        if (!j.is_object())
            throw error(fmt::format("configuration file {} must contain a JSON object!", path));
        _parsed = j.as_object();
        _raw = buffer { json::serialize(_parsed) };
        logger::debug("loaded configuration file {}", path);
    }

    const json::value &config_file::_at_impl(const std::string_view &name) const
    {
        const auto it = _parsed.find(name);
        if (it == _parsed.end())
            throw error(fmt::format("configuration file does not have the element {}!", name));
        return it->value();
    }

    network_config network_config::preset(const std::string_view name)
    {
        if (name == "mainnet")
            return { "mainnet", 1, "https://api.mainnet.aptoslabs.com/v1", "https://api.mainnet.aptoslabs.com/v1/graphql", "" };
        if (name == "testnet")
            return { "testnet", 2, "https://api.testnet.aptoslabs.com/v1", "https://api.testnet.aptoslabs.com/v1/graphql",
                "https://faucet.testnet.aptoslabs.com" };
        if (name == "devnet")
            return { "devnet", 0, "https://api.devnet.aptoslabs.com/v1", "https://api.devnet.aptoslabs.com/v1/graphql",
                "https://faucet.devnet.aptoslabs.com" };
        if (name == "localnet")
            return { "localnet", 4, "http://127.0.0.1:8080/v1", "http://127.0.0.1:8090/v1/graphql", "http://127.0.0.1:8081" };
        throw error(fmt::format("unknown network: {}", name));
    }

    static std::string optional_string(const config &cfg, const std::string_view name)
    {
        if (const auto *v = cfg.find(name); v)
            return std::string { v->as_string() };
        return {};
    }

    network_config network_config::from_json(const config &cfg)
    {
        network_config res {};
        res.name = std::string { cfg.at("name").as_string() };
        if (const auto *v = cfg.find("chainId"); v)
            res.chain_id = narrow_cast<uint8_t>(json::value_to_u64(*v));
        res.node_url = std::string { cfg.at("nodeUrl").as_string() };
        res.indexer_url = optional_string(cfg, "indexerUrl");
        res.faucet_url = optional_string(cfg, "faucetUrl");
        return res;
    }

    transaction_defaults transaction_defaults::from_json(const config &cfg)
    {
        transaction_defaults res {};
        if (const auto *v = cfg.find("maxGasAmount"); v)
            res.max_gas_amount = json::value_to_u64(*v);
        if (const auto *v = cfg.find("gasUnitPrice"); v)
            res.gas_unit_price = json::value_to_u64(*v);
        if (const auto *v = cfg.find("expirationSeconds"); v)
            res.expiration_seconds = json::value_to_u64(*v);
        return res;
    }
}
