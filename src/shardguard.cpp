/* This file is part of ShardGuard project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <shardguard/common/cli.hpp>

int main(const int argc, const char **argv)
{
    using namespace shardguard;
    return cli::run(argc, argv);
}
