/* This file is part of ShardGuard project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <cerrno>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <shardguard/common/logger.hpp>
#include <shardguard/common/numeric-cast.hpp>
#include "file.hpp"

namespace shardguard::storage::file {
    namespace {
        int open_flags(const open_mode_t mode)
        {
            switch (mode) {
                case open_mode_t::read_only: return O_RDONLY;
                case open_mode_t::read_write: return O_RDWR;
                case open_mode_t::truncate: return O_RDWR | O_CREAT | O_TRUNC;
                default: throw error(fmt::format("unsupported file mode: {}", static_cast<int>(mode)));
            }
        }

        struct stat stat_fd(const int fd, const std::string &path)
        {
            struct stat st {};
            if (fstat(fd, &st) != 0) [[unlikely]]
                throw error_sys(fmt::format("failed to stat {}", path));
            return st;
        }
    }

    resource_t::resource_t(const std::string &path, const open_mode_t mode):
        _path { path },
        _fd { ::open(path.c_str(), open_flags(mode), 0644) }
    {
        if (_fd < 0) [[unlikely]]
            throw error_sys(fmt::format("failed to open {}", path));
        logger::trace("opened {} fd: {}", _path, _fd);
    }

    resource_t::~resource_t()
    {
        if (::close(_fd) != 0) [[unlikely]]
            logger::warn("failed to close {} errno: {}", _path, errno);
    }

    size_t resource_t::read_at(const uint64_t off, const write_buffer out)
    {
        size_t done = 0;
        while (done < out.size()) {
            const auto n = ::pread(_fd, out.data() + done, out.size() - done, numeric_cast<off_t>(off + done));
            if (n < 0) {
                if (errno == EINTR)
                    continue;
                throw error_sys(fmt::format("failed to read {} bytes at offset {} from {}", out.size() - done, off + done, _path));
            }
            if (n == 0)
                break;
            done += static_cast<size_t>(n);
        }
        return done;
    }

    void resource_t::write_at(const uint64_t off, const buffer data)
    {
        size_t done = 0;
        while (done < data.size()) {
            const auto n = ::pwrite(_fd, data.data() + done, data.size() - done, numeric_cast<off_t>(off + done));
            if (n < 0) {
                if (errno == EINTR)
                    continue;
                throw error_sys(fmt::format("failed to write {} bytes at offset {} to {}", data.size() - done, off + done, _path));
            }
            done += static_cast<size_t>(n);
        }
    }

    void resource_t::truncate(const uint64_t new_size)
    {
        while (::ftruncate(_fd, numeric_cast<off_t>(new_size)) != 0) {
            if (errno != EINTR) [[unlikely]]
                throw error_sys(fmt::format("failed to truncate {} to {} bytes", _path, new_size));
        }
    }

    uint64_t resource_t::size() const
    {
        return numeric_cast<uint64_t>(stat_fd(_fd, _path).st_size);
    }

    mtime_t resource_t::mtime() const
    {
        const auto st = stat_fd(_fd, _path);
        return numeric_cast<uint64_t>(st.st_mtim.tv_sec) * 1'000'000'000ULL + numeric_cast<uint64_t>(st.st_mtim.tv_nsec);
    }
}
