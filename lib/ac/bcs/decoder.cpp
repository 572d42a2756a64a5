/* This file is part of Aptos Client project
 * Copyright (c) 2025 Aptos Client developers */

#include <ac/bcs/decoder.hpp>

namespace aptos_client::bcs {
    void decoder::set_error(std::string msg)
    {
        if (!_error)
            _error.emplace(std::move(msg));
    }

    void decoder::throw_if_failed() const
    {
        if (_error) [[unlikely]]
            throw error(fmt::format("BCS decoding failed at byte {}: {}", _pos, *_error));
    }

    void decoder::expect_end()
    {
        if (ok() && remaining() > 0) [[unlikely]]
            set_error(fmt::format("{} bytes remain after the end of a value", remaining()));
    }

    buffer decoder::_take(const size_t sz)
    {
        if (!ok())
            return {};
        if (sz > remaining()) [[unlikely]] {
            set_error(fmt::format("requested {} bytes but only {} remain", sz, remaining()));
            return {};
        }
        const auto res = _data.subbuf(_pos, sz);
        _pos += sz;
        return res;
    }

    uint64_t decoder::_decode_le(const size_t num_bytes)
    {
        const auto data = _take(num_bytes);
        if (data.size() != num_bytes)
            return 0;
        uint64_t val = 0;
        for (size_t i = 0; i < num_bytes; ++i)
            val |= static_cast<uint64_t>(data[i]) << (i * 8);
        return val;
    }

    cpp_int decoder::_decode_big_uint(const size_t num_bytes)
    {
        const auto data = _take(num_bytes);
        cpp_int val = 0;
        if (data.size() != num_bytes)
            return val;
        for (size_t i = num_bytes; i > 0; --i) {
            val <<= 8;
            val += data[i - 1];
        }
        return val;
    }

    cpp_int decoder::_decode_big_int(const size_t num_bytes)
    {
        auto val = _decode_big_uint(num_bytes);
        const auto bits = num_bytes * 8;
        if (val > big_int_max(bits))
            val -= cpp_int { 1 } << bits;
        return val;
    }

    uint8_t decoder::u8()
    {
        return static_cast<uint8_t>(_decode_le(1));
    }

    uint16_t decoder::u16()
    {
        return static_cast<uint16_t>(_decode_le(2));
    }

    uint32_t decoder::u32()
    {
        return static_cast<uint32_t>(_decode_le(4));
    }

    uint64_t decoder::u64()
    {
        return _decode_le(8);
    }

    cpp_int decoder::u128()
    {
        return _decode_big_uint(16);
    }

    cpp_int decoder::u256()
    {
        return _decode_big_uint(32);
    }

    int8_t decoder::i8()
    {
        return static_cast<int8_t>(u8());
    }

    int16_t decoder::i16()
    {
        return static_cast<int16_t>(u16());
    }

    int32_t decoder::i32()
    {
        return static_cast<int32_t>(u32());
    }

    int64_t decoder::i64()
    {
        return static_cast<int64_t>(u64());
    }

    cpp_int decoder::i128()
    {
        return _decode_big_int(16);
    }

    cpp_int decoder::i256()
    {
        return _decode_big_int(32);
    }

    bool decoder::boolean()
    {
        switch (const auto b = u8(); b) {
            case 0: return false;
            case 1: return true;
            default:
                set_error(fmt::format("a boolean must be encoded as 0 or 1 but got {}", b));
                return false;
        }
    }

    uint32_t decoder::uleb128()
    {
        uint64_t val = 0;
        for (unsigned shift = 0; ok(); shift += 7) {
            if (shift >= 64) [[unlikely]] {
                set_error("a ULEB128 value overflows 64 bits");
                break;
            }
            const uint64_t b = u8();
            if (!ok())
                break;
            const uint64_t chunk = b & 0x7F;
            if (shift > 0 && (chunk >> (64 - shift)) != 0) [[unlikely]] {
                set_error("a ULEB128 value overflows 64 bits");
                break;
            }
            val |= chunk << shift;
            if ((b & 0x80) == 0) {
                if (shift > 0 && b == 0) [[unlikely]]
                    set_error("a ULEB128 value has a non-canonical encoding");
                else if (val > max_uleb128_value) [[unlikely]]
                    set_error(fmt::format("a ULEB128 value must fit into 32 bits but got {}", val));
                else
                    return static_cast<uint32_t>(val);
                break;
            }
        }
        return 0;
    }

    uint8_vector decoder::bytes()
    {
        const auto sz = uleb128();
        return uint8_vector { _take(sz) };
    }

    std::string decoder::str()
    {
        const auto sz = uleb128();
        return std::string { static_cast<std::string_view>(_take(sz)) };
    }

    uint8_vector decoder::fixed_bytes(const size_t sz)
    {
        const auto data = _take(sz);
        if (data.size() != sz)
            return uint8_vector(sz);
        return uint8_vector { data };
    }

    void decoder::fixed_bytes(const std::span<uint8_t> out)
    {
        const auto data = _take(out.size());
        if (data.size() != out.size()) {
            std::fill(out.begin(), out.end(), 0);
            return;
        }
        std::copy(data.begin(), data.end(), out.begin());
    }
}
