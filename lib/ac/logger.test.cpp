/* This file is part of Aptos Client project
 * Copyright (c) 2025 Aptos Client developers */

#include <ac/common/test.hpp>
#include <ac/logger.hpp>

using namespace aptos_client;

suite logger_suite = [] {
    "logger"_test = [] {
        "api"_test = [] {
            // checks that the code compiles and does not fail
            logger::trace("OK - trace");
            logger::trace("OK - {}", "trace");
            logger::debug("OK - debug");
            logger::debug("OK - {}", "debug");
            logger::info("OK - info");
            logger::info("OK - {}", "info");
            logger::warn("OK - warn");
            logger::warn("OK - {}", "warn");
            expect(true);
        };
        "last_error"_test = [] {
            logger::reset_last_error();
            expect(!logger::last_error());
            logger::error("OK - {}", "error");
            const auto last = logger::last_error();
            expect(static_cast<bool>(last) >> fatal);
            test_same(std::string { "OK - error" }, *last);
            logger::warn("a warning does not replace the last error");
            test_same(std::string { "OK - error" }, *logger::last_error());
            logger::reset_last_error();
            expect(!logger::last_error());
        };
    };
};
