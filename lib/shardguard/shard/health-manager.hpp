#pragma once
/* This file is part of ShardGuard project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <optional>
#include <vector>
#include <shardguard/erasure/coder.hpp>
#include "metadata.hpp"

namespace shardguard::shard {
    struct corrupt_shard_t {
        size_t index;
        hash_t observed;
    };
    using corrupt_shard_list_t = std::vector<corrupt_shard_t>;

    /*
     * Verifies and repairs a set of shards against the hashes recorded in their metadata.
     * Shards are ordered as in the metadata: data shards first, parity shards after them.
     *
     * Every hashing pass, including check_health(), keeps the modification time of each shard
     * that hashed clean and forgets it for each shard that did not. read() skips rehashing shards
     * whose modification time has not changed since. Corruption that does not change the
     * modification time, such as media bit rot, is therefore invisible to read() and requires
     * an explicit check_health().
     */
    struct health_manager_t {
        health_manager_t(std::vector<storage::stream_ptr_t> shards, metadata_t meta,
            size_t block_size=erasure::coder_t::default_block_size);

        // rehashes every shard and refreshes the cached modification times; the result is in ascending index order
        corrupt_shard_list_t detect_corruption();
        // throws integrity_error listing every corrupt shard
        void check_health();
        // rebuilds the corrupt shards from the healthy ones and resizes them to the shard size; throws insufficient_parity_error
        // without writing anything when more shards are corrupt than there are parity shards
        void repair();
        // writes the first metadata().size() bytes of the data shards to dst, repairing them first if necessary
        void read(storage::writer_t &dst);

        [[nodiscard]] const metadata_t &metadata() const noexcept
        {
            return _meta;
        }

        [[nodiscard]] const std::vector<storage::stream_ptr_t> &shards() const noexcept
        {
            return _shards;
        }
    private:
        std::vector<storage::stream_ptr_t> _shards;
        const metadata_t _meta;
        const size_t _block_size;
        std::vector<std::optional<storage::mtime_t>> _mtimes;

        hash_t _hash_shard(size_t idx);
        void _rewind_all();
        void _refresh(std::vector<size_t> &corrupt);
        void _serve(storage::writer_t &dst);
    };
}
