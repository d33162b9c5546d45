/* This file is part of ShardGuard project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <shardguard/common/numeric-cast.hpp>
#include "metadata.hpp"

namespace shardguard::shard {
    metadata_t::metadata_t(const uint64_t size, hash_list_t hashes, const size_t data_shards, const size_t parity_shards):
        _size { size }, _hashes { std::move(hashes) }, _data_shards { data_shards }, _parity_shards { parity_shards }
    {
        if (_data_shards == 0) [[unlikely]]
            throw error("metadata must describe at least one data shard");
        if (_parity_shards == 0) [[unlikely]]
            throw error("metadata must describe at least one parity shard");
        if (total_shards() > max_shards) [[unlikely]]
            throw error(fmt::format("the total number of shards {} exceeds the maximum of {}", total_shards(), max_shards));
        if (_hashes.size() != total_shards()) [[unlikely]]
            throw error(fmt::format("metadata expects {} shard hashes but got {}", total_shards(), _hashes.size()));
    }

    metadata_t metadata_t::from_json(const codec::json::value &jv)
    {
        const auto &jo = jv.as_object();
        const auto &j_hashes = codec::json::field(jo, "hashes").as_array();
        hash_list_t hashes {};
        hashes.reserve(j_hashes.size());
        for (const auto &jh: j_hashes)
            hashes.emplace_back(hash_t::from_hex(static_cast<std::string_view>(jh.as_string())));
        return {
            codec::json::field_uint(jo, "size"),
            std::move(hashes),
            numeric_cast<size_t>(codec::json::field_uint(jo, "dataShards")),
            numeric_cast<size_t>(codec::json::field_uint(jo, "parityShards"))
        };
    }

    metadata_t metadata_t::load(const std::string &path)
    {
        try {
            return from_json(codec::json::load(path));
        } catch (const std::exception &ex) {
            throw error(fmt::format("failed to load shard metadata from {}", path), ex);
        }
    }

    codec::json::value metadata_t::to_json() const
    {
        codec::json::array j_hashes {};
        j_hashes.reserve(_hashes.size());
        for (const auto &h: _hashes)
            j_hashes.emplace_back(crypto::blake2b::to_hex(h));
        return codec::json::object {
            { "size", _size },
            { "hashes", std::move(j_hashes) },
            { "dataShards", _data_shards },
            { "parityShards", _parity_shards }
        };
    }

    void metadata_t::save(const std::string &path) const
    {
        codec::json::save_pretty(path, to_json());
    }
}
