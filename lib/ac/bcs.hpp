/* This file is part of Aptos Client project
 * Copyright (c) 2025 Aptos Client developers */
#ifndef APTOS_CLIENT_BCS_HPP
#define APTOS_CLIENT_BCS_HPP

#include <ac/bcs/decoder.hpp>
#include <ac/bcs/encoder.hpp>

namespace aptos_client::bcs {
    template<serializable T>
    uint8_vector serialize(const T &v)
    {
        encoder enc {};
        v.to_bcs(enc);
        return std::move(enc.bcs());
    }

    template<serializable T>
    uint8_vector serialize_seq(const std::vector<T> &items)
    {
        encoder enc {};
        enc.seq(items);
        return std::move(enc.bcs());
    }

    // throws bcs::error when the data is malformed or has trailing bytes
    template<deserializable T>
    T deserialize(const buffer data)
    {
        decoder dec { data };
        auto res = T::from_bcs(dec);
        dec.expect_end();
        dec.throw_if_failed();
        return res;
    }

    template<deserializable T>
    std::vector<T> deserialize_seq(const buffer data)
    {
        decoder dec { data };
        auto res = dec.seq<T>();
        dec.expect_end();
        dec.throw_if_failed();
        return res;
    }
}

#endif // !APTOS_CLIENT_BCS_HPP
