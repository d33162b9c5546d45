#pragma once
/* This file is part of ShardGuard project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <string>
#include "common.hpp"

namespace shardguard::storage::file {
    enum class open_mode_t {
        read_only,
        read_write,
        // creates the file if necessary and truncates it to zero length
        truncate
    };

    struct resource_t: storage::resource_t {
        explicit resource_t(const std::string &path, open_mode_t mode=open_mode_t::read_write);
        ~resource_t() override;
        resource_t(const resource_t &) =delete;
        size_t read_at(uint64_t off, write_buffer out) override;
        void write_at(uint64_t off, buffer data) override;
        void truncate(uint64_t new_size) override;
        [[nodiscard]] uint64_t size() const override;
        [[nodiscard]] mtime_t mtime() const override;

        const std::string &path() const noexcept
        {
            return _path;
        }
    private:
        const std::string _path;
        int _fd = -1;
    };
}
