/* This file is part of ShardGuard project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <shardguard/common/cli.hpp>
#include <shardguard/shard/file-set.hpp>

namespace shardguard::cli::encode {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "encode";
            cmd.desc = "split a data file into shards, write the parity files and save the shard metadata";
            cmd.args.expect({ "<data>", "<meta.json>", "<parity>", "[<parity> ...]" });
            cmd.opts.try_emplace("data-shards", "the number of data shards", "2");
        }

        void run(const arguments &args, const options &opts) const override
        {
            const auto &data_path = args.at(0);
            const auto &meta_path = args.at(1);
            const shard::path_list_t parity_paths { args.begin() + 2, args.end() };
            const auto data_shards = from_str<size_t>(*opts.at("data-shards"));
            const auto meta = shard::encode_file(data_path, data_shards, parity_paths);
            meta.save(meta_path);
            logger::info("saved the shard metadata to {}", meta_path);
        }
    };
    static auto &instance = command::reg(std::make_shared<cmd>());
}
