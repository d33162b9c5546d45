#pragma once
/* This file is part of ShardGuard project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <memory>
#include <vector>
#include <shardguard/storage/common.hpp>

namespace shardguard::shard {
    // A bounded view over [start, limit) of a shared resource that presents exactly one shard.
    // Reads past the physical end of the resource produce zero padding up to the window's limit.
    // The resource must outlive the window.
    struct chunk_window_t: storage::stream_t {
        chunk_window_t(storage::resource_t &res, uint64_t start, uint64_t limit);

        size_t read(write_buffer out) override;
        // throws bounds_error without writing anything when data does not fit into the remaining space
        void write(buffer data) override;
        // positions are relative to start(); throws bounds_error and keeps the position when out of [0, size()]
        uint64_t seek(int64_t off, storage::whence_t whence) override;
        // a window always presents size() bytes, so only that size is accepted
        void truncate(uint64_t new_size) override;

        [[nodiscard]] storage::mtime_t mtime() const override
        {
            return _res.mtime();
        }

        [[nodiscard]] uint64_t start() const noexcept
        {
            return _start;
        }

        [[nodiscard]] uint64_t limit() const noexcept
        {
            return _limit;
        }

        [[nodiscard]] uint64_t size() const noexcept
        {
            return _limit - _start;
        }

        [[nodiscard]] uint64_t position() const noexcept
        {
            return _pos;
        }

        [[nodiscard]] const storage::resource_t &resource() const noexcept
        {
            return _res;
        }
    private:
        storage::resource_t &_res;
        const uint64_t _start;
        const uint64_t _limit;
        uint64_t _pos = 0;
    };
    using chunk_window_ptr_t = std::shared_ptr<chunk_window_t>;

    // the size of every window produced by split: ceil(size / num_chunks)
    extern uint64_t chunk_size(uint64_t size, size_t num_chunks);
    // partitions [0, size) of res into num_chunks contiguous windows of chunk_size(size, num_chunks) bytes each
    extern std::vector<chunk_window_ptr_t> split(storage::resource_t &res, uint64_t size, size_t num_chunks);
}
