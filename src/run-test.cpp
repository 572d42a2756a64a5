/* This file is part of Aptos Client project
 * Copyright (c) 2025 Aptos Client developers */

#include <iostream>
#include <ac/common/test.hpp>
#include <ac/logger.hpp>

int main(const int argc, const char **argv)
{
    using namespace aptos_client;
    if (argc >= 2) {
        std::cerr << "using test-filter mask: " << argv[1] << '\n';
        boost::ut::cfg<boost::ut::override> = { .filter = argv[1] };
    }
    const bool failed = boost::ut::cfg<boost::ut::override>.run();
    logger::info("run-test finished with {}", failed ? "failures" : "success");
    return failed ? 1 : 0;
}
