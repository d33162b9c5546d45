#pragma once
/* This file is part of ShardGuard project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <shardguard/erasure/coder.hpp>
#include "metadata.hpp"

namespace shardguard::shard {
    // Produces parity shards for a set of data shards and records the content hash of every shard.
    struct encoder_t {
        encoder_t(size_t data_shards, size_t parity_shards, size_t block_size=erasure::coder_t::default_block_size);

        // size is the logical length of the data recorded in the returned metadata; nothing is persisted
        metadata_t encode(erasure::reader_list_t data, erasure::writer_list_t parity, uint64_t size) const;
    private:
        const size_t _data_shards;
        const size_t _parity_shards;
        const size_t _block_size;
    };
}
