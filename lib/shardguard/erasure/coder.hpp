#pragma once
/* This file is part of ShardGuard project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <memory>
#include <span>
#include <shardguard/storage/common.hpp>

namespace shardguard::erasure {
    using reader_list_t = std::span<storage::reader_t * const>;
    using writer_list_t = std::span<storage::writer_t * const>;

    // A systematic erasure code over data_shards() data and parity_shards() parity streams of equal length.
    struct coder_t {
        static constexpr size_t default_block_size = 1 << 16;

        virtual ~coder_t() = default;

        // streams the data shards and writes the parity shards;
        // throws shard::encoding_error when the counts differ from the configuration or the data shards differ in length
        virtual void encode(reader_list_t data, writer_list_t parity) = 0;

        // shards holds data_shards() + parity_shards() entries with nullptr marking the ones to rebuild;
        // every rebuilt shard is written to the writer at the same index.
        virtual void reconstruct(reader_list_t shards, writer_list_t rebuilt) = 0;

        [[nodiscard]] virtual size_t data_shards() const noexcept = 0;
        [[nodiscard]] virtual size_t parity_shards() const noexcept = 0;
    };
    using coder_ptr_t = std::unique_ptr<coder_t>;

    extern coder_ptr_t create(size_t data_shards, size_t parity_shards, size_t block_size=coder_t::default_block_size);
}
