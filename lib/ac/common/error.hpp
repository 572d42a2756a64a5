/* This file is part of Aptos Client project
 * Copyright (c) 2025 Aptos Client developers */
#ifndef APTOS_CLIENT_COMMON_ERROR_HPP
#define APTOS_CLIENT_COMMON_ERROR_HPP

#include <array>
#include <stdexcept>
#include <string>
#include <string_view>

namespace aptos_client {
    struct base_error: std::exception {
        static constexpr size_t stacktrace_depth = 0x20;

        explicit base_error(std::string_view msg);
        const char *what() const noexcept override;
    private:
        std::string _msg;
        std::array<std::byte, sizeof(void*) * stacktrace_depth> _trace {};
        mutable bool _trace_logged = false;
    };

    struct error: base_error {
        explicit error(std::string_view msg);
        explicit error(std::string_view msg, const std::exception &ex);
    };

    // appends errno and its description captured at construction
    struct error_sys: error {
        explicit error_sys(std::string_view msg);
        explicit error_sys(std::string_view msg, int err_no);
    };

    // Error kinds shared by several modules. Codec errors live in bcs::error.
    struct type_tag_error: error {
        using error::error;
    };

    struct value_error: error {
        using error::error;
    };

    struct crypto_error: error {
        using error::error;
    };

    struct bitmap_error: crypto_error {
        using crypto_error::crypto_error;
    };

    struct transport_error: error {
        using error::error;
    };
}

#endif // !APTOS_CLIENT_COMMON_ERROR_HPP
