/* This file is part of Aptos Client project
 * Copyright (c) 2025 Aptos Client developers */
#ifndef APTOS_CLIENT_COMMON_NARROW_CAST_HPP
#define APTOS_CLIENT_COMMON_NARROW_CAST_HPP

#include <limits>
#include <typeinfo>
#include <ac/common/format.hpp>

namespace aptos_client {
    template<typename TO, typename FROM>
    constexpr TO narrow_cast(const FROM from)
    {
        if constexpr (std::numeric_limits<FROM>::is_signed == std::numeric_limits<TO>::is_signed) {
            if (from > std::numeric_limits<TO>::max()) [[unlikely]]
                throw error(fmt::format("can't convert {} {} to {}: the value is too big", typeid(FROM).name(), from, typeid(TO).name()));
            if (from < std::numeric_limits<TO>::min()) [[unlikely]]
                throw error(fmt::format("can't convert {} {} to {}: the value is too small", typeid(FROM).name(), from, typeid(TO).name()));
            return static_cast<TO>(from);
        }
        if constexpr (std::numeric_limits<FROM>::is_signed) {
            if (from < 0) [[unlikely]]
                throw error(fmt::format("can't convert {} {} to {}: the value is negative", typeid(FROM).name(), from, typeid(TO).name()));
            if (static_cast<std::make_unsigned_t<FROM>>(from) > std::numeric_limits<TO>::max()) [[unlikely]]
                throw error(fmt::format("can't convert {} {} to {}: the value is too big", typeid(FROM).name(), from, typeid(TO).name()));
            return static_cast<TO>(from);
        }
        if (from > static_cast<std::make_unsigned_t<TO>>(std::numeric_limits<TO>::max())) [[unlikely]]
            throw error(fmt::format("can't convert {} {} to {}: the value is too big", typeid(FROM).name(), from, typeid(TO).name()));
        return static_cast<TO>(from);
    }
}

#endif // !APTOS_CLIENT_COMMON_NARROW_CAST_HPP
