/* This file is part of Aptos Client project
 * Copyright (c) 2025 Aptos Client developers */
#ifndef APTOS_CLIENT_ABI_MARSHALLER_HPP
#define APTOS_CLIENT_ABI_MARSHALLER_HPP

#include <ac/abi/arg-value.hpp>
#include <ac/move/type-tag.hpp>

namespace aptos_client::abi {
    struct marshal_options {
        // lets Option<T> accept a hex string holding an already serialized option
        bool compatibility_mode = false;
    };

    // a type argument given either as a tag or as its Move text
    using type_arg = std::variant<move::type_tag, std::string>;

    // throws type_tag_error for unparsable text
    extern move::type_tag convert_type_tag(const type_arg &arg);
    extern std::vector<move::type_tag> convert_type_tags(const std::vector<type_arg> &args);

    /*
     * Serializes a user value as the declared parameter type.
     * Generic parameters T<i> resolve to generics[i].
     * Throws value_error when the value does not fit the type and type_tag_error for unresolvable types.
     */
    extern uint8_vector convert_arg(const move::type_tag &tag, const arg_value &arg,
        const std::vector<move::type_tag> &generics={}, const marshal_options &opts={});
}

#endif // !APTOS_CLIENT_ABI_MARSHALLER_HPP
