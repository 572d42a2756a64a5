/* This file is part of Aptos Client project
 * Copyright (c) 2025 Aptos Client developers */
#ifndef APTOS_CLIENT_CLIENT_TRANSPORT_HPP
#define APTOS_CLIENT_CLIENT_TRANSPORT_HPP

#include <optional>
#include <ac/json.hpp>
#include <ac/move/address.hpp>

namespace aptos_client::client {
    static constexpr std::string_view signed_transaction_content_type { "application/x.aptos.signed_transaction+bcs" };
    static constexpr std::string_view view_function_content_type { "application/x.aptos.view_function+bcs" };

    /*
     * The connection to a node. Implementations own retries, caching and polling
     * and report failures with transport_error.
     */
    struct transport {
        virtual ~transport() =default;

        uint8_t chain_id()
        {
            return _chain_id_impl();
        }

        uint64_t sequence_number(const move::address &addr)
        {
            return _sequence_number_impl(addr);
        }

        json::object account_info(const move::address &addr)
        {
            return _account_info_impl(addr);
        }

        // returns the transaction hash
        std::string submit_signed_transaction(const buffer signed_tx_bcs)
        {
            return _submit_impl(signed_tx_bcs);
        }

        json::value submit_batch(const buffer batch_bcs)
        {
            return _submit_batch_impl(batch_bcs);
        }

        json::value simulate(const buffer signed_tx_bcs)
        {
            return _simulate_impl(signed_tx_bcs);
        }

        json::value wait_for_transaction(const std::string_view hash)
        {
            return _wait_impl(hash);
        }

        json::array view(const buffer payload_bcs, const std::optional<uint64_t> ledger_version={})
        {
            return _view_impl(payload_bcs, ledger_version);
        }
    private:
        virtual uint8_t _chain_id_impl() =0;
        virtual uint64_t _sequence_number_impl(const move::address &addr) =0;
        virtual json::object _account_info_impl(const move::address &addr) =0;
        virtual std::string _submit_impl(buffer signed_tx_bcs) =0;
        virtual json::value _submit_batch_impl(buffer batch_bcs) =0;
        virtual json::value _simulate_impl(buffer signed_tx_bcs) =0;
        virtual json::value _wait_impl(std::string_view hash) =0;
        virtual json::array _view_impl(buffer payload_bcs, std::optional<uint64_t> ledger_version) =0;
    };
}

#endif // !APTOS_CLIENT_CLIENT_TRANSPORT_HPP
