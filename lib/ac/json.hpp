/* This file is part of Aptos Client project
 * Copyright (c) 2025 Aptos Client developers */
#ifndef APTOS_CLIENT_JSON_HPP
#define APTOS_CLIENT_JSON_HPP

#include <fstream>
#include <boost/json.hpp>
#include <ac/common/bytes.hpp>

namespace aptos_client::json {
    using namespace boost::json;

    inline json::value parse(const buffer &buf, json::storage_ptr sp={})
    {
        return boost::json::parse(static_cast<std::string_view>(buf), sp);
    }

    inline json::value load(const std::string &path, json::storage_ptr sp={})
    {
        std::ifstream is { path, std::ios::binary };
        if (!is)
            throw error_sys(fmt::format("failed to open {}", path));
        const std::string data { std::istreambuf_iterator<char> { is }, std::istreambuf_iterator<char> {} };
        return boost::json::parse(data, sp);
    }

    // the node API renders u64 values as decimal strings
    inline uint64_t value_to_u64(const json::value &v)
    {
        switch (v.kind()) {
            case json::kind::uint64: return v.get_uint64();
            case json::kind::int64: {
                if (v.get_int64() < 0)
                    throw error(fmt::format("expected an unsigned value but got {}", v.get_int64()));
                return static_cast<uint64_t>(v.get_int64());
            }
            case json::kind::string: {
                const std::string_view s = v.get_string();
                if (s.empty() || !std::all_of(s.begin(), s.end(), [](const char c) { return c >= '0' && c <= '9'; }))
                    throw error(fmt::format("not a decimal u64: '{}'", s));
                try {
                    return std::stoull(std::string { s });
                } catch (const std::out_of_range &ex) {
                    throw error(fmt::format("u64 value out of range: '{}'", s), ex);
                }
            }
            default:
                throw error(fmt::format("expected a u64 value but got json of kind {}", static_cast<int>(v.kind())));
        }
    }
}

#endif // !APTOS_CLIENT_JSON_HPP
