/* This file is part of ShardGuard project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <shardguard/common/numeric-cast.hpp>
#include "memory.hpp"

namespace shardguard::storage::memory {
    resource_t::resource_t(const buffer data):
        _data { data }
    {
    }

    size_t resource_t::read_at(const uint64_t off, const write_buffer out)
    {
        if (off >= _data.size())
            return 0;
        const auto start = numeric_cast<size_t>(off);
        const auto n = std::min(out.size(), _data.size() - start);
        if (n)
            memcpy(out.data(), _data.data() + start, n);
        return n;
    }

    void resource_t::write_at(const uint64_t off, const buffer data)
    {
        const auto start = numeric_cast<size_t>(off);
        if (start + data.size() > _data.size())
            _data.resize(start + data.size());
        if (!data.empty())
            memcpy(_data.data() + start, data.data(), data.size());
        ++_version;
    }

    void resource_t::truncate(const uint64_t new_size)
    {
        _data.resize(numeric_cast<size_t>(new_size));
        ++_version;
    }

    uint64_t resource_t::size() const
    {
        return _data.size();
    }

    mtime_t resource_t::mtime() const
    {
        return _version;
    }
}
