/* This file is part of Aptos Client project
 * Copyright (c) 2025 Aptos Client developers */
#ifndef APTOS_CLIENT_BCS_DECODER_HPP
#define APTOS_CLIENT_BCS_DECODER_HPP

#include <functional>
#include <optional>
#include <type_traits>
#include <string>
#include <vector>
#include <ac/common/big-int.hpp>
#include <ac/common/bytes.hpp>
#include <ac/bcs/types.hpp>

namespace aptos_client::bcs {
    /*
     * Reads values from a borrowed buffer.
     * Errors are sticky: the first one is kept, and every later read returns a zero value.
     * The caller checks ok() at a natural boundary or calls throw_if_failed().
     */
    struct decoder {
        explicit decoder(const buffer data): _data { data }
        {
        }

        decoder(const decoder &) =delete;

        uint8_t u8();
        uint16_t u16();
        uint32_t u32();
        uint64_t u64();
        cpp_int u128();
        cpp_int u256();
        int8_t i8();
        int16_t i16();
        int32_t i32();
        int64_t i64();
        cpp_int i128();
        cpp_int i256();
        bool boolean();
        // the value is limited to 32 bits since it serves as a length or a discriminant
        uint32_t uleb128();
        uint8_vector bytes();
        std::string str();
        uint8_vector fixed_bytes(size_t sz);
        void fixed_bytes(std::span<uint8_t> out);

        uint32_t variant()
        {
            return uleb128();
        }

        template<deserializable T>
        T obj()
        {
            return T::from_bcs(*this);
        }

        template<deserializable T>
        std::vector<T> seq()
        {
            return seq<T>([](decoder &dec) { return T::from_bcs(dec); });
        }

        template<typename T>
        std::vector<T> seq(const std::type_identity_t<std::function<T(decoder &)>> &decode_item)
        {
            std::vector<T> items {};
            const auto sz = uleb128();
            // each item takes at least one byte so a larger length is malformed
            if (sz > remaining()) [[unlikely]] {
                set_error(fmt::format("sequence length {} exceeds the remaining {} bytes", sz, remaining()));
                return items;
            }
            items.reserve(sz);
            for (uint32_t i = 0; i < sz && ok(); ++i)
                items.emplace_back(decode_item(*this));
            return items;
        }

        template<deserializable T>
        std::optional<T> option()
        {
            switch (const auto tag = uleb128(); tag) {
                case 0: return {};
                case 1: return T::from_bcs(*this);
                default:
                    set_error(fmt::format("an option tag must be 0 or 1 but got {}", tag));
                    return {};
            }
        }

        [[nodiscard]] size_t remaining() const noexcept
        {
            return _data.size() - _pos;
        }

        [[nodiscard]] size_t pos() const noexcept
        {
            return _pos;
        }

        [[nodiscard]] bool ok() const noexcept
        {
            return !_error;
        }

        [[nodiscard]] const std::optional<std::string> &error_message() const noexcept
        {
            return _error;
        }

        // keeps only the first error
        void set_error(std::string msg);
        void throw_if_failed() const;
        // fails when bytes are left over after a complete value
        void expect_end();
    private:
        buffer _data;
        size_t _pos = 0;
        std::optional<std::string> _error {};

        buffer _take(size_t sz);
        uint64_t _decode_le(size_t num_bytes);
        cpp_int _decode_big_uint(size_t num_bytes);
        cpp_int _decode_big_int(size_t num_bytes);
    };
}

#endif // !APTOS_CLIENT_BCS_DECODER_HPP
