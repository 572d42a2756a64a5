/* This file is part of Aptos Client project
 * Copyright (c) 2025 Aptos Client developers */
#ifndef APTOS_CLIENT_BCS_TYPES_HPP
#define APTOS_CLIENT_BCS_TYPES_HPP

#include <concepts>
#include <ac/common/error.hpp>

namespace aptos_client::bcs {
    struct error: aptos_client::error {
        using aptos_client::error::error;
    };

    struct encoder;
    struct decoder;

    template<typename T>
    concept serializable = requires(const T &v, encoder &enc) {
        v.to_bcs(enc);
    };

    template<typename T>
    concept deserializable = requires(decoder &dec) {
        { T::from_bcs(dec) } -> std::convertible_to<T>;
    };

    // lengths and variant discriminants are limited to 32 bits on the wire
    static constexpr uint64_t max_uleb128_value = 0xFFFFFFFFULL;
}

#endif // !APTOS_CLIENT_BCS_TYPES_HPP
