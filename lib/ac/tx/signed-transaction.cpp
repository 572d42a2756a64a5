/* This file is part of Aptos Client project
 * Copyright (c) 2025 Aptos Client developers */

#include <ac/bcs.hpp>
#include <ac/logger.hpp>
#include <ac/tx/signed-transaction.hpp>

namespace aptos_client::tx {
    namespace {
        static bool verify_all(const buffer msg, const std::vector<address> &addrs, const std::vector<account_authenticator> &auths)
        {
            if (addrs.size() != auths.size())
                return false;
            return std::all_of(auths.begin(), auths.end(), [msg](const auto &a) { return a.verify(msg); });
        }

        static void check_secondary_count(const std::vector<address> &addrs, const std::vector<account_authenticator> &auths)
        {
            if (addrs.size() != auths.size())
                throw error(fmt::format("{} secondary signer addresses but {} authenticators", addrs.size(), auths.size()));
        }
    }

    multi_agent_authenticator multi_agent_authenticator::from_bcs(bcs::decoder &dec)
    {
        multi_agent_authenticator res {};
        res.sender = account_authenticator::from_bcs(dec);
        res.secondary_signer_addresses = dec.seq<address>();
        res.secondary_signers = dec.seq<account_authenticator>();
        return res;
    }

    void multi_agent_authenticator::to_bcs(bcs::encoder &enc) const
    {
        enc.obj(sender).seq(secondary_signer_addresses).seq(secondary_signers);
    }

    bool multi_agent_authenticator::verify(const buffer msg) const
    {
        return sender.verify(msg) && verify_all(msg, secondary_signer_addresses, secondary_signers);
    }

    fee_payer_authenticator fee_payer_authenticator::from_bcs(bcs::decoder &dec)
    {
        fee_payer_authenticator res {};
        res.sender = account_authenticator::from_bcs(dec);
        res.secondary_signer_addresses = dec.seq<address>();
        res.secondary_signers = dec.seq<account_authenticator>();
        res.fee_payer_address = address::from_bcs(dec);
        res.fee_payer = account_authenticator::from_bcs(dec);
        return res;
    }

    void fee_payer_authenticator::to_bcs(bcs::encoder &enc) const
    {
        enc.obj(sender)
            .seq(secondary_signer_addresses)
            .seq(secondary_signers)
            .obj(fee_payer_address)
            .obj(fee_payer);
    }

    bool fee_payer_authenticator::verify(const buffer msg) const
    {
        return sender.verify(msg) && verify_all(msg, secondary_signer_addresses, secondary_signers) && fee_payer.verify(msg);
    }

    transaction_authenticator transaction_authenticator::from_account_authenticator(const account_authenticator &auth)
    {
        switch (auth.variant()) {
            case account_authenticator::variant_type::ed25519:
                return { std::get<crypto::ed25519_authenticator>(auth.val) };
            case account_authenticator::variant_type::multi_ed25519:
                return { std::get<crypto::multi_ed25519_authenticator>(auth.val) };
            case account_authenticator::variant_type::single_key:
            case account_authenticator::variant_type::multi_key:
                return { single_sender_authenticator { auth } };
            default:
                throw crypto_error(fmt::format("a {} authenticator cannot sign a single-signer transaction", auth.variant()));
        }
    }

    transaction_authenticator transaction_authenticator::from_bcs(bcs::decoder &dec)
    {
        switch (const auto typ = static_cast<variant_type>(dec.variant()); typ) {
            case variant_type::ed25519: return { crypto::ed25519_authenticator::from_bcs(dec) };
            case variant_type::multi_ed25519: return { crypto::multi_ed25519_authenticator::from_bcs(dec) };
            case variant_type::multi_agent: return { multi_agent_authenticator::from_bcs(dec) };
            case variant_type::fee_payer: return { fee_payer_authenticator::from_bcs(dec) };
            case variant_type::single_sender: return { single_sender_authenticator::from_bcs(dec) };
            default:
                if (dec.ok())
                    dec.set_error(fmt::format("unknown transaction authenticator variant: {}", static_cast<uint32_t>(typ)));
                return { single_sender_authenticator {} };
        }
    }

    void transaction_authenticator::to_bcs(bcs::encoder &enc) const
    {
        enc.variant(static_cast<uint32_t>(variant()));
        std::visit([&enc](const auto &v) { v.to_bcs(enc); }, val);
    }

    transaction_authenticator::variant_type transaction_authenticator::variant() const
    {
        return static_cast<variant_type>(val.index());
    }

    bool transaction_authenticator::verify(const buffer msg) const
    {
        return std::visit([msg](const auto &v) { return v.verify(msg); }, val);
    }

    signed_transaction signed_transaction::from_bcs(bcs::decoder &dec)
    {
        signed_transaction res {};
        res.raw = raw_transaction::from_bcs(dec);
        res.auth = transaction_authenticator::from_bcs(dec);
        return res;
    }

    void signed_transaction::to_bcs(bcs::encoder &enc) const
    {
        enc.obj(raw).obj(auth);
    }

    bool signed_transaction::verify() const
    {
        const auto rtwd = with_data(*this);
        if (!rtwd)
            return auth.verify(raw.signing_message());
        const auto msg = rtwd->signing_message();
        if (const auto *fp = std::get_if<fee_payer_authenticator>(&auth.val); fp) {
            if (!verify_all(msg, fp->secondary_signer_addresses, fp->secondary_signers) || !fp->fee_payer.verify(msg))
                return false;
            if (fp->sender.verify(msg))
                return true;
            // the sender may have signed before the fee payer was known
            auto unknown_payer = *rtwd;
            std::get<fee_payer_transaction>(unknown_payer.val).fee_payer = move::address_zero;
            return fp->sender.verify(unknown_payer.signing_message());
        }
        return auth.verify(msg);
    }

    crypto::sha3::hash_256 signed_transaction::hash() const
    {
        static constexpr uint8_t user_transaction_tag = 0;
        return crypto::sha3::digest({ transaction_prefix(), buffer { &user_transaction_tag, 1 }, bcs::serialize(*this) });
    }

    std::string signed_transaction::hash_hex() const
    {
        return to_hex(hash());
    }

    std::optional<raw_transaction_with_data> with_data(const signed_transaction &tx)
    {
        if (const auto *ma = std::get_if<multi_agent_authenticator>(&tx.auth.val); ma)
            return raw_transaction_with_data { multi_agent_transaction { tx.raw, ma->secondary_signer_addresses } };
        if (const auto *fp = std::get_if<fee_payer_authenticator>(&tx.auth.val); fp)
            return raw_transaction_with_data { fee_payer_transaction { tx.raw, fp->secondary_signer_addresses, fp->fee_payer_address } };
        return {};
    }

    account_authenticator sign(const crypto::signer &signer, const raw_transaction &raw)
    {
        return signer.sign(raw.signing_message());
    }

    account_authenticator sign(const crypto::signer &signer, const raw_transaction_with_data &raw)
    {
        return signer.sign(raw.signing_message());
    }

    signed_transaction make_signed(const raw_transaction &raw, const account_authenticator &sender)
    {
        return { raw, transaction_authenticator::from_account_authenticator(sender) };
    }

    signed_transaction make_signed(const raw_transaction_with_data &raw, const account_authenticator &sender,
        const std::vector<account_authenticator> &secondary_signers, const std::optional<account_authenticator> &fee_payer)
    {
        check_secondary_count(raw.secondary_signers(), secondary_signers);
        if (const auto *fp = std::get_if<fee_payer_transaction>(&raw.val); fp) {
            return { fp->raw, transaction_authenticator { fee_payer_authenticator {
                sender, fp->secondary_signers, secondary_signers, fp->fee_payer,
                fee_payer ? *fee_payer : account_authenticator { crypto::none_authenticator {} }
            } } };
        }
        if (fee_payer)
            throw error("a fee payer authenticator requires a fee payer transaction");
        const auto &ma = std::get<multi_agent_transaction>(raw.val);
        return { ma.raw, transaction_authenticator { multi_agent_authenticator { sender, ma.secondary_signers, secondary_signers } } };
    }

    signed_transaction make_simulated(const raw_transaction &raw, const crypto::signer &sender)
    {
        return make_signed(raw, sender.simulation_authenticator());
    }

    signed_transaction make_simulated(const raw_transaction_with_data &raw, const crypto::signer &sender)
    {
        const std::vector<account_authenticator> secondaries(raw.secondary_signers().size(), account_authenticator { crypto::none_authenticator {} });
        std::optional<account_authenticator> fee_payer {};
        if (raw.variant() == raw_transaction_with_data::variant_type::fee_payer)
            fee_payer.emplace(account_authenticator { crypto::none_authenticator {} });
        logger::debug("simulating a transaction of {} with {} secondary signers", raw.raw().sender, secondaries.size());
        return make_signed(raw, sender.simulation_authenticator(), secondaries, fee_payer);
    }

    uint8_vector batch_body(const std::vector<signed_transaction> &txs)
    {
        return bcs::serialize_seq(txs);
    }
}
