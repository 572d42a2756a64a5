/* This file is part of Aptos Client project
 * Copyright (c) 2025 Aptos Client developers */
#ifndef APTOS_CLIENT_CLIENT_BUILDER_HPP
#define APTOS_CLIENT_CLIENT_BUILDER_HPP

#include <ac/account.hpp>
#include <ac/config.hpp>
#include <ac/client/transport.hpp>
#include <ac/tx/signed-transaction.hpp>

namespace aptos_client::client {
    // Unset fields fall back to transaction_defaults or, for the chain state, to the transport
    struct build_options {
        std::optional<uint64_t> max_gas_amount {};
        std::optional<uint64_t> gas_unit_price {};
        std::optional<uint64_t> expiration_seconds {};
        std::optional<uint64_t> sequence_number {};
        std::optional<uint8_t> chain_id {};
        // multi-agent transactions only
        std::optional<move::address> fee_payer {};
        std::vector<move::address> additional_signers {};
    };

    // throws error when fee payer or additional signers are requested; use build_transaction_multi_agent
    extern tx::raw_transaction build_transaction(transport &tr, const move::address &sender, tx::transaction_payload payload,
        const build_options &opts={}, const transaction_defaults &defaults={});
    // the fee payer variant when opts.fee_payer is set, the multi-agent variant otherwise
    extern tx::raw_transaction_with_data build_transaction_multi_agent(transport &tr, const move::address &sender, tx::transaction_payload payload,
        const build_options &opts={}, const transaction_defaults &defaults={});

    extern std::string submit_transaction(transport &tr, const tx::signed_transaction &tx);
    extern json::value submit_batch(transport &tr, const std::vector<tx::signed_transaction> &txs);
    // signs with zero signatures so the node only estimates the outcome
    extern json::value simulate_transaction(transport &tr, const tx::raw_transaction &raw, const crypto::signer &sender);
    extern json::value simulate_transaction(transport &tr, const tx::raw_transaction_with_data &raw, const crypto::signer &sender);
    extern json::array view(transport &tr, const tx::view_payload &payload, std::optional<uint64_t> ledger_version={});
    // builds with the account as the sender, signs and submits; returns the transaction hash
    extern std::string sign_and_submit(transport &tr, const account &sender, tx::transaction_payload payload,
        const build_options &opts={}, const transaction_defaults &defaults={});
}

#endif // !APTOS_CLIENT_CLIENT_BUILDER_HPP
