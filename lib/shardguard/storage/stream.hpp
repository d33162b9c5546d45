#pragma once
/* This file is part of ShardGuard project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include "common.hpp"

namespace shardguard::storage {
    // A stream over the whole of a resource, used for shards stored one per resource such as parity files.
    // Writes past the end grow the resource. Does not own the resource.
    struct resource_stream_t: stream_t {
        explicit resource_stream_t(resource_t &res):
            _res { res }
        {
        }

        size_t read(write_buffer out) override;
        void write(buffer data) override;
        uint64_t seek(int64_t off, whence_t whence) override;
        void truncate(uint64_t new_size) override;

        [[nodiscard]] mtime_t mtime() const override
        {
            return _res.mtime();
        }

        [[nodiscard]] uint64_t position() const noexcept
        {
            return _pos;
        }
    private:
        resource_t &_res;
        uint64_t _pos = 0;
    };
}
