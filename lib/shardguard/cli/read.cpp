/* This file is part of ShardGuard project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <shardguard/common/cli.hpp>
#include <shardguard/shard/file-set.hpp>
#include <shardguard/storage/file.hpp>
#include <shardguard/storage/stream.hpp>

namespace shardguard::cli::read {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "read";
            cmd.desc = "write the original data to the output file, repairing the shards first if necessary";
            cmd.args.expect({ "<data>", "<meta.json>", "<out>", "<parity>", "[<parity> ...]" });
        }

        void run(const arguments &args) const override
        {
            shard::file_set_t fs { args.at(0), { args.begin() + 3, args.end() }, shard::metadata_t::load(args.at(1)) };
            storage::file::resource_t out { args.at(2), storage::file::open_mode_t::truncate };
            storage::resource_stream_t out_stream { out };
            fs.read(out_stream);
            logger::info("wrote {} bytes to {}", fs.manager().metadata().size(), args.at(2));
        }
    };
    static auto &instance = command::reg(std::make_shared<cmd>());
}
