/* This file is part of Aptos Client project
 * Copyright (c) 2025 Aptos Client developers */

#include <algorithm>
#include <ac/common/array.hpp>

namespace aptos_client {
    void secure_clear(const std::span<uint8_t> store)
    {
        std::fill_n<volatile uint8_t *>(store.data(), store.size(), 0);
    }

    std::string to_hex(const buffer bytes)
    {
        return fmt::format("0x{}", buffer_lowercase { bytes });
    }
}
