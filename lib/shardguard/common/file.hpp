#pragma once
/* This file is part of ShardGuard project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <filesystem>
#include <string>
#include <string_view>
#include "bytes.hpp"

namespace shardguard::file {
    extern uint8_vector read(const std::string &path);
    extern void write(const std::string &path, buffer data);
    extern std::string install_path(std::string_view rel_path);

    // a file in the system temporary directory removed on destruction
    struct tmp {
        explicit tmp(const std::string_view name):
            _path { (std::filesystem::temp_directory_path() / name).string() }
        {
        }

        tmp(const tmp &) =delete;

        ~tmp()
        {
            std::error_code ec {};
            std::filesystem::remove(_path, ec);
        }

        const std::string &path() const noexcept
        {
            return _path;
        }

        operator const std::string &() const noexcept
        {
            return _path;
        }
    private:
        std::string _path;
    };

    struct tmp_directory {
        explicit tmp_directory(const std::string_view name):
            _path { std::filesystem::temp_directory_path() / name }
        {
            std::filesystem::remove_all(_path);
            std::filesystem::create_directories(_path);
        }

        tmp_directory(const tmp_directory &) =delete;

        ~tmp_directory()
        {
            std::error_code ec {};
            std::filesystem::remove_all(_path, ec);
        }

        std::string path() const
        {
            return _path.string();
        }

        operator std::filesystem::path() const
        {
            return _path;
        }

        std::string operator/(const std::string_view name) const
        {
            return (_path / name).string();
        }
    private:
        std::filesystem::path _path;
    };
}
