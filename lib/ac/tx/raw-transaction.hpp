/* This file is part of Aptos Client project
 * Copyright (c) 2025 Aptos Client developers */
#ifndef APTOS_CLIENT_TX_RAW_TRANSACTION_HPP
#define APTOS_CLIENT_TX_RAW_TRANSACTION_HPP

#include <ac/crypto/sha3.hpp>
#include <ac/tx/payload.hpp>

namespace aptos_client::tx {
    // SHA3-256 of the domain tag, prepended to the BCS bytes of every signed structure
    extern const crypto::sha3::hash_256 &raw_transaction_prefix();
    extern const crypto::sha3::hash_256 &raw_transaction_with_data_prefix();
    extern const crypto::sha3::hash_256 &transaction_prefix();

    struct raw_transaction {
        address sender {};
        uint64_t sequence_number = 0;
        transaction_payload payload { entry_function {} };
        uint64_t max_gas_amount = 0;
        uint64_t gas_unit_price = 0;
        uint64_t expiration_timestamp_secs = 0;
        uint8_t chain_id = 0;

        static raw_transaction from_bcs(bcs::decoder &dec);
        void to_bcs(bcs::encoder &enc) const;
        // prefix || bcs(this): the exact bytes passed to the signer
        uint8_vector signing_message() const;
        bool operator==(const raw_transaction &o) const =default;
    };

    struct multi_agent_transaction {
        raw_transaction raw {};
        std::vector<address> secondary_signers {};

        static multi_agent_transaction from_bcs(bcs::decoder &dec);
        void to_bcs(bcs::encoder &enc) const;
        bool operator==(const multi_agent_transaction &o) const =default;
    };

    // A zero fee payer address lets the sender sign before the fee payer is known
    struct fee_payer_transaction {
        raw_transaction raw {};
        std::vector<address> secondary_signers {};
        address fee_payer {};

        static fee_payer_transaction from_bcs(bcs::decoder &dec);
        void to_bcs(bcs::encoder &enc) const;
        bool operator==(const fee_payer_transaction &o) const =default;
    };

    struct raw_transaction_with_data {
        enum class variant_type: uint32_t {
            multi_agent = 0,
            fee_payer = 1
        };
        using value_type = std::variant<multi_agent_transaction, fee_payer_transaction>;

        value_type val;

        static raw_transaction_with_data from_bcs(bcs::decoder &dec);
        void to_bcs(bcs::encoder &enc) const;
        variant_type variant() const;
        const raw_transaction &raw() const;
        const std::vector<address> &secondary_signers() const;
        // the fee payer address for the fee payer variant
        std::optional<address> fee_payer() const;
        // signed identically by the sender, the secondary signers and the fee payer
        uint8_vector signing_message() const;
        bool operator==(const raw_transaction_with_data &o) const =default;
    };
}

#endif // !APTOS_CLIENT_TX_RAW_TRANSACTION_HPP
