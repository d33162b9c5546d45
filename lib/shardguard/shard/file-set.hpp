#pragma once
/* This file is part of ShardGuard project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <string>
#include <vector>
#include <shardguard/storage/common.hpp>
#include "health-manager.hpp"

namespace shardguard::shard {
    using path_list_t = std::vector<std::string>;

    // splits the data file into data_shards shards and writes one parity file per parity path, replacing existing ones
    extern metadata_t encode_file(const std::string &data_path, size_t data_shards, const path_list_t &parity_paths,
        size_t block_size=erasure::coder_t::default_block_size);

    // A data file whose shards are windows over it, plus one file per parity shard
    struct file_set_t {
        file_set_t(const std::string &data_path, const path_list_t &parity_paths, const metadata_t &meta,
            size_t block_size=erasure::coder_t::default_block_size);

        void check_health()
        {
            _manager->check_health();
        }

        void repair()
        {
            _manager->repair();
        }

        void read(storage::writer_t &dst)
        {
            _manager->read(dst);
        }

        [[nodiscard]] health_manager_t &manager() noexcept
        {
            return *_manager;
        }
    private:
        storage::resource_ptr_t _data {};
        std::vector<storage::resource_ptr_t> _parity {};
        std::unique_ptr<health_manager_t> _manager {};
    };
}
