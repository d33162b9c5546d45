/* This file is part of ShardGuard project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <chrono>
#include <iostream>
#include <shardguard/common/logger.hpp>
#include <shardguard/common/test.hpp>

int main(const int argc, const char **argv)
{
    using namespace shardguard;
    const auto start = std::chrono::steady_clock::now();
    if (argc >= 2) {
        std::cerr << fmt::format("using test-filter mask: {}\n", argv[1]);
        boost::ut::cfg<boost::ut::override> = { .filter = argv[1] };
    }
    const bool res = boost::ut::cfg<boost::ut::override>.run();
    const std::chrono::duration<double> took = std::chrono::steady_clock::now() - start;
    logger::info("run-test took {:.3f} secs", took.count());
    return res ? 1 : 0;
}
