/* This file is part of Aptos Client project
 * Copyright (c) 2025 Aptos Client developers */
#ifndef APTOS_CLIENT_TX_SIGNED_TRANSACTION_HPP
#define APTOS_CLIENT_TX_SIGNED_TRANSACTION_HPP

#include <ac/crypto/signer.hpp>
#include <ac/tx/raw-transaction.hpp>

namespace aptos_client::tx {
    using crypto::account_authenticator;

    struct multi_agent_authenticator {
        account_authenticator sender { crypto::none_authenticator {} };
        std::vector<address> secondary_signer_addresses {};
        std::vector<account_authenticator> secondary_signers {};

        static multi_agent_authenticator from_bcs(bcs::decoder &dec);
        void to_bcs(bcs::encoder &enc) const;
        bool verify(buffer msg) const;
        bool operator==(const multi_agent_authenticator &o) const =default;
    };

    struct fee_payer_authenticator {
        account_authenticator sender { crypto::none_authenticator {} };
        std::vector<address> secondary_signer_addresses {};
        std::vector<account_authenticator> secondary_signers {};
        address fee_payer_address {};
        account_authenticator fee_payer { crypto::none_authenticator {} };

        static fee_payer_authenticator from_bcs(bcs::decoder &dec);
        void to_bcs(bcs::encoder &enc) const;
        bool verify(buffer msg) const;
        bool operator==(const fee_payer_authenticator &o) const =default;
    };

    // SingleKey and MultiKey account authenticators travel wrapped in this variant
    struct single_sender_authenticator {
        account_authenticator sender { crypto::none_authenticator {} };

        static single_sender_authenticator from_bcs(bcs::decoder &dec)
        {
            return { account_authenticator::from_bcs(dec) };
        }

        void to_bcs(bcs::encoder &enc) const
        {
            sender.to_bcs(enc);
        }

        bool verify(const buffer msg) const
        {
            return sender.verify(msg);
        }

        bool operator==(const single_sender_authenticator &o) const =default;
    };

    /*
     * The legacy Ed25519 and MultiEd25519 variants carry only the key and the signature,
     * without the account authenticator discriminant.
     */
    struct transaction_authenticator {
        enum class variant_type: uint32_t {
            ed25519 = 0,
            multi_ed25519 = 1,
            multi_agent = 2,
            fee_payer = 3,
            single_sender = 4
        };
        using value_type = std::variant<crypto::ed25519_authenticator, crypto::multi_ed25519_authenticator,
            multi_agent_authenticator, fee_payer_authenticator, single_sender_authenticator>;

        value_type val;

        // throws crypto_error for the None authenticator
        static transaction_authenticator from_account_authenticator(const account_authenticator &auth);
        static transaction_authenticator from_bcs(bcs::decoder &dec);
        void to_bcs(bcs::encoder &enc) const;
        variant_type variant() const;
        bool verify(buffer msg) const;
        bool operator==(const transaction_authenticator &o) const =default;
    };

    struct signed_transaction {
        raw_transaction raw {};
        transaction_authenticator auth { single_sender_authenticator {} };

        static signed_transaction from_bcs(bcs::decoder &dec);
        void to_bcs(bcs::encoder &enc) const;
        // recomputes the signing message of the plain, multi-agent or fee payer form and verifies every signer
        bool verify() const;
        // SHA3-256(SHA3-256("APTOS::Transaction") || 0x00 || bcs(this))
        crypto::sha3::hash_256 hash() const;
        // 0x-prefixed lowercase hex of hash()
        std::string hash_hex() const;
        bool operator==(const signed_transaction &o) const =default;
    };

    // Reconstructs the multi-agent or fee payer form a signed transaction was signed in
    extern std::optional<raw_transaction_with_data> with_data(const signed_transaction &tx);

    extern account_authenticator sign(const crypto::signer &signer, const raw_transaction &raw);
    extern account_authenticator sign(const crypto::signer &signer, const raw_transaction_with_data &raw);

    extern signed_transaction make_signed(const raw_transaction &raw, const account_authenticator &sender);
    // secondary authenticators follow the order of the secondary signer addresses
    extern signed_transaction make_signed(const raw_transaction_with_data &raw, const account_authenticator &sender,
        const std::vector<account_authenticator> &secondary_signers, const std::optional<account_authenticator> &fee_payer={});

    // Zero signatures with the true sender key; secondary signers and the fee payer get the None authenticator
    extern signed_transaction make_simulated(const raw_transaction &raw, const crypto::signer &sender);
    extern signed_transaction make_simulated(const raw_transaction_with_data &raw, const crypto::signer &sender);

    // BCS sequence of signed transactions for the batch submission endpoint
    extern uint8_vector batch_body(const std::vector<signed_transaction> &txs);
}

namespace fmt {
    template<>
    struct formatter<aptos_client::tx::transaction_authenticator::variant_type>: formatter<int> {
        template<typename FormatContext>
        auto format(const aptos_client::tx::transaction_authenticator::variant_type &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using aptos_client::tx::transaction_authenticator;
            switch (v) {
                case transaction_authenticator::variant_type::ed25519: return fmt::format_to(ctx.out(), "ed25519");
                case transaction_authenticator::variant_type::multi_ed25519: return fmt::format_to(ctx.out(), "multi_ed25519");
                case transaction_authenticator::variant_type::multi_agent: return fmt::format_to(ctx.out(), "multi_agent");
                case transaction_authenticator::variant_type::fee_payer: return fmt::format_to(ctx.out(), "fee_payer");
                case transaction_authenticator::variant_type::single_sender: return fmt::format_to(ctx.out(), "single_sender");
                default: return fmt::format_to(ctx.out(), "unknown({})", static_cast<uint32_t>(v));
            }
        }
    };
}

#endif // !APTOS_CLIENT_TX_SIGNED_TRANSACTION_HPP
