/* This file is part of ShardGuard project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <shardguard/common/logger.hpp>
#include <shardguard/storage/file.hpp>
#include <shardguard/storage/stream.hpp>
#include "chunk-window.hpp"
#include "encoder.hpp"
#include "file-set.hpp"

namespace shardguard::shard {
    metadata_t encode_file(const std::string &data_path, const size_t data_shards, const path_list_t &parity_paths, const size_t block_size)
    {
        storage::file::resource_t data { data_path, storage::file::open_mode_t::read_only };
        const auto size = data.size();
        const auto windows = split(data, size, data_shards);
        std::vector<storage::reader_t *> readers {};
        readers.reserve(windows.size());
        for (const auto &w: windows)
            readers.emplace_back(w.get());

        std::vector<std::unique_ptr<storage::file::resource_t>> parity {};
        std::vector<std::unique_ptr<storage::resource_stream_t>> parity_streams {};
        std::vector<storage::writer_t *> writers {};
        for (const auto &p: parity_paths) {
            parity.emplace_back(std::make_unique<storage::file::resource_t>(p, storage::file::open_mode_t::truncate));
            writers.emplace_back(parity_streams.emplace_back(std::make_unique<storage::resource_stream_t>(*parity.back())).get());
        }
        auto meta = encoder_t { data_shards, parity_paths.size(), block_size }.encode(readers, writers, size);
        logger::info("encoded {} into {} parity files: {}", data_path, parity_paths.size(), meta);
        return meta;
    }

    file_set_t::file_set_t(const std::string &data_path, const path_list_t &parity_paths, const metadata_t &meta, const size_t block_size)
    {
        if (parity_paths.size() != meta.parity_shards()) [[unlikely]]
            throw error(fmt::format("cannot open encoded files: need {} parity shards, got {}", meta.parity_shards(), parity_paths.size()));
        _data = std::make_unique<storage::file::resource_t>(data_path, storage::file::open_mode_t::read_write);
        std::vector<storage::stream_ptr_t> shards {};
        shards.reserve(meta.total_shards());
        for (auto &w: split(*_data, meta.size(), meta.data_shards()))
            shards.emplace_back(std::move(w));
        for (const auto &p: parity_paths) {
            auto &res = _parity.emplace_back(std::make_unique<storage::file::resource_t>(p, storage::file::open_mode_t::read_write));
            shards.emplace_back(std::make_shared<storage::resource_stream_t>(*res));
        }
        _manager = std::make_unique<health_manager_t>(std::move(shards), meta, block_size);
    }
}
