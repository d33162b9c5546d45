/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <cstdio>
#include <memory>
#include "file.hpp"
#include "numeric-cast.hpp"

namespace shardguard::file {
    namespace {
        struct file_closer_t {
            void operator()(FILE *f) const
            {
                fclose(f);
            }
        };
        using file_ptr_t = std::unique_ptr<FILE, file_closer_t>;
    }

    uint8_vector read(const std::string &path)
    {
        const auto sz = std::filesystem::file_size(path);
        uint8_vector buf(numeric_cast<size_t>(sz));
        const file_ptr_t f { fopen(path.c_str(), "rb") };
        if (!f) [[unlikely]]
            throw error_sys(fmt::format("failed to open a file for reading: {}", path));
        if (!buf.empty() && fread(buf.data(), 1, buf.size(), f.get()) != buf.size())
            throw error_sys(fmt::format("failed to read from {}", path));
        return buf;
    }

    void write(const std::string &path, const buffer data)
    {
        if (const auto dir = std::filesystem::path { path }.parent_path(); !dir.empty())
            std::filesystem::create_directories(dir);
        const auto tmp_path = fmt::format("{}.tmp", path);
        {
            const file_ptr_t f { fopen(tmp_path.c_str(), "wb") };
            if (!f) [[unlikely]]
                throw error_sys(fmt::format("failed to open a file for writing: {}", tmp_path));
            if (!data.empty() && fwrite(data.data(), 1, data.size(), f.get()) != data.size())
                throw error_sys(fmt::format("failed to write to {}", tmp_path));
        }
        std::filesystem::rename(tmp_path, path);
    }

    std::string install_path(const std::string_view rel_path)
    {
        // provide a dummy implementation at the moment
        return fmt::format("./{}", rel_path);
    }
}
