#pragma once
/* This file is part of ShardGuard project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include "coder.hpp"

namespace shardguard::erasure::jerasure {
    // Reed-Solomon Vandermonde code over GF(2^8) processing the shards in fixed-size blocks
    struct coder_t: erasure::coder_t {
        static constexpr size_t word_size = 8;
        static constexpr size_t max_shards = 1 << word_size;

        coder_t(size_t data_shards, size_t parity_shards, size_t block_size=default_block_size);
        ~coder_t() override;
        void encode(reader_list_t data, writer_list_t parity) override;
        void reconstruct(reader_list_t shards, writer_list_t rebuilt) override;
        [[nodiscard]] size_t data_shards() const noexcept override;
        [[nodiscard]] size_t parity_shards() const noexcept override;
    private:
        struct impl;
        std::unique_ptr<impl> _impl;
    };
}
