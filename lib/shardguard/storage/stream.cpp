/* This file is part of ShardGuard project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <limits>
#include <shardguard/common/numeric-cast.hpp>
#include "stream.hpp"

namespace shardguard::storage {
    size_t resource_stream_t::read(const write_buffer out)
    {
        const auto n = _res.read_at(_pos, out);
        _pos += n;
        return n;
    }

    void resource_stream_t::write(const buffer data)
    {
        _res.write_at(_pos, data);
        _pos += data.size();
    }

    uint64_t resource_stream_t::seek(const int64_t off, const whence_t whence)
    {
        int64_t base;
        switch (whence) {
            case whence_t::start: base = 0; break;
            case whence_t::current: base = numeric_cast<int64_t>(_pos); break;
            case whence_t::end: base = numeric_cast<int64_t>(_res.size()); break;
            default: throw error(fmt::format("unsupported seek whence: {}", static_cast<int>(whence)));
        }
        if (off > 0 && base > std::numeric_limits<int64_t>::max() - off) [[unlikely]]
            throw error(fmt::format("requested position {} + {} does not fit into a 64-bit offset", base, off));
        const auto new_pos = base + off;
        if (new_pos < 0) [[unlikely]]
            throw error(fmt::format("requested position {} is before the beginning of the resource", new_pos));
        _pos = static_cast<uint64_t>(new_pos);
        return _pos;
    }

    void resource_stream_t::truncate(const uint64_t new_size)
    {
        _res.truncate(new_size);
    }
}
