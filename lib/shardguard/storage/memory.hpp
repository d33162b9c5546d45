#pragma once
/* This file is part of ShardGuard project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include "common.hpp"

namespace shardguard::storage::memory {
    // An in-memory resource. The modification time is a counter bumped by every write.
    struct resource_t: storage::resource_t {
        explicit resource_t(buffer data={});
        size_t read_at(uint64_t off, write_buffer out) override;
        void write_at(uint64_t off, buffer data) override;
        void truncate(uint64_t new_size) override;
        [[nodiscard]] uint64_t size() const override;
        [[nodiscard]] mtime_t mtime() const override;

        [[nodiscard]] const uint8_vector &bytes() const noexcept
        {
            return _data;
        }
    private:
        uint8_vector _data;
        mtime_t _version = 1;
    };
}
