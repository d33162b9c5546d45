#pragma once
/* This file is part of ShardGuard project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <cstdint>
#include <memory>
#include <shardguard/common/bytes.hpp>

namespace shardguard::storage {
    // modification timestamp: nanoseconds for files, a write counter for memory resources
    using mtime_t = uint64_t;

    // A shared positioned-I/O capability. Multiple shard windows may address disjoint ranges of one resource.
    struct resource_t {
        virtual ~resource_t() = default;
        // returns the number of bytes read which is less than out.size() only when the end of the resource is reached
        virtual size_t read_at(uint64_t off, write_buffer out) = 0;
        virtual void write_at(uint64_t off, buffer data) = 0;
        // sets the size to new_size, dropping or zero-filling the tail
        virtual void truncate(uint64_t new_size) = 0;
        [[nodiscard]] virtual uint64_t size() const = 0;
        [[nodiscard]] virtual mtime_t mtime() const = 0;
    };
    using resource_ptr_t = std::unique_ptr<resource_t>;

    struct reader_t {
        virtual ~reader_t() = default;
        // returns 0 only at the end of the stream
        virtual size_t read(write_buffer out) = 0;
    };

    struct writer_t {
        virtual ~writer_t() = default;
        virtual void write(buffer data) = 0;
    };

    enum class whence_t: int {
        start = 0,
        current = 1,
        end = 2
    };

    // The single capability required from a shard: sequential reads and writes, seeking, and a modification time.
    struct stream_t: reader_t, writer_t {
        virtual uint64_t seek(int64_t off, whence_t whence) = 0;
        // makes the stream exactly new_size bytes long
        virtual void truncate(uint64_t new_size) = 0;
        [[nodiscard]] virtual mtime_t mtime() const = 0;

        void rewind()
        {
            seek(0, whence_t::start);
        }
    };
    using stream_ptr_t = std::shared_ptr<stream_t>;

    // reads until the buffer is full or the stream ends
    inline size_t read_full(reader_t &r, const write_buffer out)
    {
        size_t done = 0;
        while (done < out.size()) {
            const auto n = r.read(out.subspan(done));
            if (n == 0)
                break;
            done += n;
        }
        return done;
    }
}
