/* This file is part of ShardGuard project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <shardguard/common/cli.hpp>
#include <shardguard/shard/file-set.hpp>

namespace shardguard::cli::check {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "check";
            cmd.desc = "verify the hashes of all shards, fails when any shard is corrupt";
            cmd.args.expect({ "<data>", "<meta.json>", "<parity>", "[<parity> ...]" });
        }

        void run(const arguments &args) const override
        {
            shard::file_set_t fs { args.at(0), { args.begin() + 2, args.end() }, shard::metadata_t::load(args.at(1)) };
            fs.check_health();
            logger::info("all {} shards of {} are healthy", fs.manager().metadata().total_shards(), args.at(0));
        }
    };
    static auto &instance = command::reg(std::make_shared<cmd>());
}
