/* This file is part of Aptos Client project
 * Copyright (c) 2025 Aptos Client developers */

#include <ac/bcs.hpp>
#include <ac/tx/raw-transaction.hpp>

namespace aptos_client::tx {
    namespace {
        template<typename T>
        uint8_vector prefixed_bcs(const crypto::sha3::hash_256 &prefix, const T &obj)
        {
            bcs::encoder enc {};
            enc.fixed_bytes(prefix);
            obj.to_bcs(enc);
            return std::move(enc.bcs());
        }
    }

    const crypto::sha3::hash_256 &raw_transaction_prefix()
    {
        static const auto prefix = crypto::sha3::digest(buffer { std::string_view { "APTOS::RawTransaction" } });
        return prefix;
    }

    const crypto::sha3::hash_256 &raw_transaction_with_data_prefix()
    {
        static const auto prefix = crypto::sha3::digest(buffer { std::string_view { "APTOS::RawTransactionWithData" } });
        return prefix;
    }

    const crypto::sha3::hash_256 &transaction_prefix()
    {
        static const auto prefix = crypto::sha3::digest(buffer { std::string_view { "APTOS::Transaction" } });
        return prefix;
    }

    raw_transaction raw_transaction::from_bcs(bcs::decoder &dec)
    {
        raw_transaction res {};
        res.sender = address::from_bcs(dec);
        res.sequence_number = dec.u64();
        res.payload = transaction_payload::from_bcs(dec);
        res.max_gas_amount = dec.u64();
        res.gas_unit_price = dec.u64();
        res.expiration_timestamp_secs = dec.u64();
        res.chain_id = dec.u8();
        return res;
    }

    void raw_transaction::to_bcs(bcs::encoder &enc) const
    {
        enc.obj(sender)
            .u64(sequence_number)
            .obj(payload)
            .u64(max_gas_amount)
            .u64(gas_unit_price)
            .u64(expiration_timestamp_secs)
            .u8(chain_id);
    }

    uint8_vector raw_transaction::signing_message() const
    {
        return prefixed_bcs(raw_transaction_prefix(), *this);
    }

    multi_agent_transaction multi_agent_transaction::from_bcs(bcs::decoder &dec)
    {
        multi_agent_transaction res {};
        res.raw = raw_transaction::from_bcs(dec);
        res.secondary_signers = dec.seq<address>();
        return res;
    }

    void multi_agent_transaction::to_bcs(bcs::encoder &enc) const
    {
        enc.obj(raw).seq(secondary_signers);
    }

    fee_payer_transaction fee_payer_transaction::from_bcs(bcs::decoder &dec)
    {
        fee_payer_transaction res {};
        res.raw = raw_transaction::from_bcs(dec);
        res.secondary_signers = dec.seq<address>();
        res.fee_payer = address::from_bcs(dec);
        return res;
    }

    void fee_payer_transaction::to_bcs(bcs::encoder &enc) const
    {
        enc.obj(raw).seq(secondary_signers).obj(fee_payer);
    }

    raw_transaction_with_data raw_transaction_with_data::from_bcs(bcs::decoder &dec)
    {
        switch (const auto typ = static_cast<variant_type>(dec.variant()); typ) {
            case variant_type::multi_agent: return { multi_agent_transaction::from_bcs(dec) };
            case variant_type::fee_payer: return { fee_payer_transaction::from_bcs(dec) };
            default:
                if (dec.ok())
                    dec.set_error(fmt::format("unknown raw transaction with data variant: {}", static_cast<uint32_t>(typ)));
                return { multi_agent_transaction {} };
        }
    }

    void raw_transaction_with_data::to_bcs(bcs::encoder &enc) const
    {
        enc.variant(static_cast<uint32_t>(variant()));
        std::visit([&enc](const auto &v) { v.to_bcs(enc); }, val);
    }

    raw_transaction_with_data::variant_type raw_transaction_with_data::variant() const
    {
        return static_cast<variant_type>(val.index());
    }

    const raw_transaction &raw_transaction_with_data::raw() const
    {
        return std::visit([](const auto &v) -> const raw_transaction & { return v.raw; }, val);
    }

    const std::vector<address> &raw_transaction_with_data::secondary_signers() const
    {
        return std::visit([](const auto &v) -> const std::vector<address> & { return v.secondary_signers; }, val);
    }

    std::optional<address> raw_transaction_with_data::fee_payer() const
    {
        if (const auto *fp = std::get_if<fee_payer_transaction>(&val); fp)
            return fp->fee_payer;
        return {};
    }

    uint8_vector raw_transaction_with_data::signing_message() const
    {
        return prefixed_bcs(raw_transaction_with_data_prefix(), *this);
    }
}
