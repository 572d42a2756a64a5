/* This file is part of Aptos Client project
 * Copyright (c) 2025 Aptos Client developers */
#ifndef APTOS_CLIENT_BCS_ENCODER_HPP
#define APTOS_CLIENT_BCS_ENCODER_HPP

#include <functional>
#include <optional>
#include <type_traits>
#include <vector>
#include <ac/common/big-int.hpp>
#include <ac/common/bytes.hpp>
#include <ac/bcs/types.hpp>

namespace aptos_client::bcs {
    /*
     * Appends values in the Binary Canonical Serialization format:
     * fixed-width integers are little-endian, variable-size data is prefixed with its ULEB128 length.
     * Encoding errors are reported by throwing bcs::error.
     */
    struct encoder {
        using custom_func = std::function<void(encoder &)>;

        encoder &u8(const uint8_t val)
        {
            _buf.emplace_back(val);
            return *this;
        }

        encoder &u16(const uint16_t val)
        {
            _encode_le(val, sizeof(val));
            return *this;
        }

        encoder &u32(const uint32_t val)
        {
            _encode_le(val, sizeof(val));
            return *this;
        }

        encoder &u64(const uint64_t val)
        {
            _encode_le(val, sizeof(val));
            return *this;
        }

        encoder &u128(const cpp_int &val)
        {
            _encode_big_uint(val, 16);
            return *this;
        }

        encoder &u256(const cpp_int &val)
        {
            _encode_big_uint(val, 32);
            return *this;
        }

        // signed integers use the two's complement representation of the same width
        encoder &i8(const int8_t val)
        {
            return u8(static_cast<uint8_t>(val));
        }

        encoder &i16(const int16_t val)
        {
            return u16(static_cast<uint16_t>(val));
        }

        encoder &i32(const int32_t val)
        {
            return u32(static_cast<uint32_t>(val));
        }

        encoder &i64(const int64_t val)
        {
            return u64(static_cast<uint64_t>(val));
        }

        encoder &i128(const cpp_int &val)
        {
            _encode_big_int(val, 16);
            return *this;
        }

        encoder &i256(const cpp_int &val)
        {
            _encode_big_int(val, 32);
            return *this;
        }

        encoder &boolean(const bool val)
        {
            _buf.emplace_back(val ? 1 : 0);
            return *this;
        }

        encoder &uleb128(uint64_t val)
        {
            if (val > max_uleb128_value) [[unlikely]]
                throw error(fmt::format("a ULEB128 value must fit into 32 bits but got {}", val));
            while (val >= 0x80) {
                _buf.emplace_back(static_cast<uint8_t>((val & 0x7F) | 0x80));
                val >>= 7;
            }
            _buf.emplace_back(static_cast<uint8_t>(val));
            return *this;
        }

        encoder &bytes(const buffer buf)
        {
            uleb128(buf.size());
            _buf << buf;
            return *this;
        }

        encoder &str(const std::string_view sv)
        {
            return bytes(buffer { sv });
        }

        encoder &fixed_bytes(const buffer buf)
        {
            _buf << buf;
            return *this;
        }

        encoder &variant(const uint64_t discriminant)
        {
            return uleb128(discriminant);
        }

        template<serializable T>
        encoder &obj(const T &v)
        {
            v.to_bcs(*this);
            return *this;
        }

        template<serializable T>
        encoder &seq(const std::vector<T> &items)
        {
            uleb128(items.size());
            for (const auto &it: items)
                it.to_bcs(*this);
            return *this;
        }

        template<typename T>
        encoder &seq(const std::vector<T> &items, const std::type_identity_t<std::function<void(encoder &, const T &)>> &encode_item)
        {
            uleb128(items.size());
            for (const auto &it: items)
                encode_item(*this, it);
            return *this;
        }

        template<serializable T>
        encoder &option(const std::optional<T> &v)
        {
            if (v) {
                uleb128(1);
                v->to_bcs(*this);
            } else {
                uleb128(0);
            }
            return *this;
        }

        encoder &custom(const custom_func &gen)
        {
            gen(*this);
            return *this;
        }

        [[nodiscard]] uint8_vector &bcs()
        {
            return _buf;
        }

        [[nodiscard]] const uint8_vector &bcs() const
        {
            return _buf;
        }
    private:
        uint8_vector _buf {};

        void _encode_le(uint64_t val, const size_t num_bytes)
        {
            for (size_t i = 0; i < num_bytes; ++i) {
                _buf.emplace_back(static_cast<uint8_t>(val & 0xFF));
                val >>= 8;
            }
        }

        void _encode_big_uint(const cpp_int &val, const size_t num_bytes)
        {
            if (val < 0 || val > big_uint_max(num_bytes * 8)) [[unlikely]]
                throw error(fmt::format("value {} does not fit into an unsigned {}-bit integer", val, num_bytes * 8));
            cpp_int rest = val;
            for (size_t i = 0; i < num_bytes; ++i) {
                _buf.emplace_back(static_cast<uint8_t>(rest & 0xFF));
                rest >>= 8;
            }
        }

        void _encode_big_int(const cpp_int &val, const size_t num_bytes)
        {
            const auto bits = num_bytes * 8;
            if (val < big_int_min(bits) || val > big_int_max(bits)) [[unlikely]]
                throw error(fmt::format("value {} does not fit into a signed {}-bit integer", val, bits));
            if (val < 0)
                _encode_big_uint(val + (cpp_int { 1 } << bits), num_bytes);
            else
                _encode_big_uint(val, num_bytes);
        }
    };
}

#endif // !APTOS_CLIENT_BCS_ENCODER_HPP
