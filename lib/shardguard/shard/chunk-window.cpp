/* This file is part of ShardGuard project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <cstring>
#include <limits>
#include <shardguard/common/numeric-cast.hpp>
#include "chunk-window.hpp"
#include "errors.hpp"

namespace shardguard::shard {
    chunk_window_t::chunk_window_t(storage::resource_t &res, const uint64_t start, const uint64_t limit):
        _res { res }, _start { start }, _limit { limit }
    {
        if (_start > _limit) [[unlikely]]
            throw bounds_error(fmt::format("chunk start {} is larger than its limit {}", _start, _limit));
    }

    size_t chunk_window_t::read(const write_buffer out)
    {
        const auto avail = size() - _pos;
        if (avail == 0)
            return 0;
        const auto n = static_cast<size_t>(std::min(static_cast<uint64_t>(out.size()), avail));
        const auto dst = out.subspan(0, n);
        size_t done = 0;
        while (done < n) {
            const auto got = _res.read_at(_start + _pos + done, dst.subspan(done));
            if (got == 0)
                break;
            done += got;
        }
        if (done < n)
            memset(dst.data() + done, 0, n - done);
        _pos += n;
        return n;
    }

    void chunk_window_t::write(const buffer data)
    {
        const auto avail = size() - _pos;
        if (data.size() > avail) [[unlikely]]
            throw bounds_error(fmt::format("cannot write {} bytes to chunk; only {} bytes left", data.size(), avail));
        _res.write_at(_start + _pos, data);
        _pos += data.size();
    }

    uint64_t chunk_window_t::seek(const int64_t off, const storage::whence_t whence)
    {
        int64_t base;
        switch (whence) {
            case storage::whence_t::start: base = 0; break;
            case storage::whence_t::current: base = numeric_cast<int64_t>(_pos); break;
            case storage::whence_t::end: base = numeric_cast<int64_t>(size()); break;
            default:
                throw invalid_argument_error(fmt::format("got {}, expected one of: start, current, end", static_cast<int>(whence)));
        }
        if (off > 0 && base > std::numeric_limits<int64_t>::max() - off) [[unlikely]]
            throw bounds_error(fmt::format("requested position {} + {} is larger than chunk limit {}", base, off, size()));
        const auto new_pos = base + off;
        if (new_pos < 0) [[unlikely]]
            throw bounds_error(fmt::format("requested position {} is smaller than chunk beginning 0", new_pos));
        if (static_cast<uint64_t>(new_pos) > size()) [[unlikely]]
            throw bounds_error(fmt::format("requested position {} is larger than chunk limit {}", new_pos, size()));
        _pos = static_cast<uint64_t>(new_pos);
        return _pos;
    }

    void chunk_window_t::truncate(const uint64_t new_size)
    {
        if (new_size != size()) [[unlikely]]
            throw bounds_error(fmt::format("cannot resize a chunk of {} bytes to {} bytes", size(), new_size));
    }

    uint64_t chunk_size(const uint64_t size, const size_t num_chunks)
    {
        if (num_chunks == 0) [[unlikely]]
            throw error("the number of chunks must be positive");
        return size / num_chunks + (size % num_chunks != 0 ? 1 : 0);
    }

    std::vector<chunk_window_ptr_t> split(storage::resource_t &res, const uint64_t size, const size_t num_chunks)
    {
        const auto chunk_sz = chunk_size(size, num_chunks);
        std::vector<chunk_window_ptr_t> windows {};
        windows.reserve(num_chunks);
        for (size_t i = 0; i < num_chunks; ++i)
            windows.emplace_back(std::make_shared<chunk_window_t>(res, i * chunk_sz, (i + 1) * chunk_sz));
        return windows;
    }
}
