/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include "blake2b.hpp"
#include "sodium.hpp"

namespace shardguard::crypto::blake2b {
    using sodium::ensure_initialized;

    void digest(const hash_span_t &out, const buffer &in)
    {
        ensure_initialized();
        if (crypto_generichash(out.data(), out.size(), in.data(), in.size(), nullptr, 0) != 0)
            throw error("libsodium error: can't compute hash!");
    }

    struct hasher_t::impl {
        impl()
        {
            ensure_initialized();
            if (crypto_generichash_init(&_state, nullptr, 0, sizeof(hash_t)) != 0)
                throw error("libsodium error: can't initialize a hash state!");
        }

        void update(const buffer &in)
        {
            if (_finished) [[unlikely]]
                throw error("blake2b: update after finish!");
            if (crypto_generichash_update(&_state, in.data(), in.size()) != 0)
                throw error("libsodium error: can't update a hash state!");
        }

        hash_t finish()
        {
            if (_finished) [[unlikely]]
                throw error("blake2b: the hash has already been finished!");
            hash_t out;
            if (crypto_generichash_final(&_state, out.data(), out.size()) != 0)
                throw error("libsodium error: can't finalize a hash state!");
            _finished = true;
            return out;
        }
    private:
        crypto_generichash_state _state {};
        bool _finished = false;
    };

    hasher_t::hasher_t():
        _impl { std::make_unique<impl>() }
    {
    }

    hasher_t::~hasher_t() = default;

    hasher_t::hasher_t(hasher_t &&) noexcept = default;

    void hasher_t::update(const buffer &in)
    {
        _impl->update(in);
    }

    hash_t hasher_t::finish()
    {
        return _impl->finish();
    }
}
