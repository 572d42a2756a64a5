/* This file is part of Aptos Client project
 * Copyright (c) 2025 Aptos Client developers */

#include <chrono>
#include <ac/bcs.hpp>
#include <ac/client/builder.hpp>
#include <ac/logger.hpp>

namespace aptos_client::client {
    namespace {
        static uint64_t now_seconds()
        {
            return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(
                std::chrono::system_clock::now().time_since_epoch()).count());
        }

        static tx::raw_transaction build_raw(transport &tr, const move::address &sender, tx::transaction_payload payload,
            const build_options &opts, const transaction_defaults &defaults)
        {
            tx::raw_transaction raw { sender, 0, std::move(payload) };
            raw.max_gas_amount = opts.max_gas_amount.value_or(defaults.max_gas_amount);
            raw.gas_unit_price = opts.gas_unit_price.value_or(defaults.gas_unit_price);
            raw.expiration_timestamp_secs = now_seconds() + opts.expiration_seconds.value_or(defaults.expiration_seconds);
            if (opts.chain_id) {
                raw.chain_id = *opts.chain_id;
            } else {
                raw.chain_id = tr.chain_id();
                logger::debug("fetched chain id {}", raw.chain_id);
            }
            if (opts.sequence_number) {
                raw.sequence_number = *opts.sequence_number;
            } else {
                raw.sequence_number = tr.sequence_number(sender);
                logger::debug("fetched sequence number {} of {}", raw.sequence_number, sender);
            }
            logger::debug("built a {} transaction of {} with sequence number {} expiring at {}",
                raw.payload.variant(), sender, raw.sequence_number, raw.expiration_timestamp_secs);
            return raw;
        }
    }

    tx::raw_transaction build_transaction(transport &tr, const move::address &sender, tx::transaction_payload payload,
        const build_options &opts, const transaction_defaults &defaults)
    {
        if (opts.fee_payer || !opts.additional_signers.empty())
            throw error("fee payer and additional signers require a multi-agent transaction");
        return build_raw(tr, sender, std::move(payload), opts, defaults);
    }

    tx::raw_transaction_with_data build_transaction_multi_agent(transport &tr, const move::address &sender, tx::transaction_payload payload,
        const build_options &opts, const transaction_defaults &defaults)
    {
        auto raw = build_raw(tr, sender, std::move(payload), opts, defaults);
        if (opts.fee_payer)
            return { tx::fee_payer_transaction { std::move(raw), opts.additional_signers, *opts.fee_payer } };
        return { tx::multi_agent_transaction { std::move(raw), opts.additional_signers } };
    }

    std::string submit_transaction(transport &tr, const tx::signed_transaction &tx)
    {
        return tr.submit_signed_transaction(bcs::serialize(tx));
    }

    json::value submit_batch(transport &tr, const std::vector<tx::signed_transaction> &txs)
    {
        return tr.submit_batch(tx::batch_body(txs));
    }

    json::value simulate_transaction(transport &tr, const tx::raw_transaction &raw, const crypto::signer &sender)
    {
        return tr.simulate(bcs::serialize(tx::make_simulated(raw, sender)));
    }

    json::value simulate_transaction(transport &tr, const tx::raw_transaction_with_data &raw, const crypto::signer &sender)
    {
        return tr.simulate(bcs::serialize(tx::make_simulated(raw, sender)));
    }

    json::array view(transport &tr, const tx::view_payload &payload, const std::optional<uint64_t> ledger_version)
    {
        return tr.view(bcs::serialize(payload), ledger_version);
    }

    std::string sign_and_submit(transport &tr, const account &sender, tx::transaction_payload payload,
        const build_options &opts, const transaction_defaults &defaults)
    {
        const auto raw = build_transaction(tr, sender.address(), std::move(payload), opts, defaults);
        return submit_transaction(tr, tx::make_signed(raw, tx::sign(sender.signer(), raw)));
    }
}
