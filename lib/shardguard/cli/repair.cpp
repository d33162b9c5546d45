/* This file is part of ShardGuard project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <shardguard/common/cli.hpp>
#include <shardguard/shard/file-set.hpp>

namespace shardguard::cli::repair {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "repair";
            cmd.desc = "rebuild corrupt data and parity shards from the healthy ones";
            cmd.args.expect({ "<data>", "<meta.json>", "<parity>", "[<parity> ...]" });
        }

        void run(const arguments &args) const override
        {
            shard::file_set_t fs { args.at(0), { args.begin() + 2, args.end() }, shard::metadata_t::load(args.at(1)) };
            fs.repair();
        }
    };
    static auto &instance = command::reg(std::make_shared<cmd>());
}
