#pragma once
/* This file is part of ShardGuard project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <string>
#include <vector>
#include <shardguard/codec/json.hpp>
#include <shardguard/crypto/blake2b.hpp>

namespace shardguard::shard {
    using hash_t = crypto::blake2b::hash_t;
    using hash_list_t = std::vector<hash_t>;

    // Describes an encoded shard set: the logical data size and the content hash of every shard,
    // data shards first and parity shards after them.
    struct metadata_t {
        static constexpr size_t max_shards = 256;

        static metadata_t from_json(const codec::json::value &jv);
        static metadata_t load(const std::string &path);

        metadata_t(uint64_t size, hash_list_t hashes, size_t data_shards, size_t parity_shards);

        [[nodiscard]] uint64_t size() const noexcept
        {
            return _size;
        }

        [[nodiscard]] const hash_list_t &hashes() const noexcept
        {
            return _hashes;
        }

        [[nodiscard]] size_t data_shards() const noexcept
        {
            return _data_shards;
        }

        [[nodiscard]] size_t parity_shards() const noexcept
        {
            return _parity_shards;
        }

        [[nodiscard]] size_t total_shards() const noexcept
        {
            return _data_shards + _parity_shards;
        }

        [[nodiscard]] codec::json::value to_json() const;
        void save(const std::string &path) const;

        bool operator==(const metadata_t &o) const noexcept =default;
    private:
        uint64_t _size;
        hash_list_t _hashes;
        size_t _data_shards;
        size_t _parity_shards;
    };
}

namespace fmt {
    template<>
    struct formatter<shardguard::shard::metadata_t>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "size: {} data shards: {} parity shards: {}", v.size(), v.data_shards(), v.parity_shards());
        }
    };
}
