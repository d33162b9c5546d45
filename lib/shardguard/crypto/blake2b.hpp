#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <memory>
#include <string>
#include <shardguard/common/bytes.hpp>

namespace shardguard::crypto::blake2b
{
    using hash_t = byte_array<32>;
    using hash_span_t = std::span<uint8_t, sizeof(hash_t)>;

    extern void digest(const hash_span_t &out, const buffer &in);

    template<typename T=hash_t>
    T digest(const buffer &in)
    {
        static_assert(sizeof(T) == sizeof(hash_t));
        T out;
        digest(out, in);
        return out;
    }

    // lowercase hex rendering used for shard hashes in metadata
    inline std::string to_hex(const hash_t &h)
    {
        return fmt::format("{}", buffer_lowercase { static_cast<buffer>(h) });
    }

    // incremental hashing for data that arrives in pieces
    struct hasher_t {
        hasher_t();
        ~hasher_t();
        hasher_t(const hasher_t &) =delete;
        hasher_t(hasher_t &&) noexcept;
        void update(const buffer &in);
        // the hasher must not be updated after finishing
        hash_t finish();
    private:
        struct impl;
        std::unique_ptr<impl> _impl;
    };
}
