/* This file is part of ShardGuard project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <shardguard/common/logger.hpp>
#include "chunk-window.hpp"
#include "errors.hpp"
#include "health-manager.hpp"

namespace shardguard::shard {
    health_manager_t::health_manager_t(std::vector<storage::stream_ptr_t> shards, metadata_t meta, const size_t block_size):
        _shards { std::move(shards) }, _meta { std::move(meta) }, _block_size { block_size },
        _mtimes(_meta.total_shards())
    {
        if (_shards.size() != _meta.total_shards()) [[unlikely]]
            throw error(fmt::format("need {} shards, got {}", _meta.total_shards(), _shards.size()));
        for (size_t i = 0; i < _shards.size(); ++i) {
            if (!_shards[i]) [[unlikely]]
                throw error(fmt::format("shard {} is missing", i));
        }
        if (_block_size == 0) [[unlikely]]
            throw error("block size must be positive");
    }

    corrupt_shard_list_t health_manager_t::detect_corruption()
    {
        corrupt_shard_list_t corrupt {};
        for (size_t i = 0; i < _shards.size(); ++i) {
            // taken before hashing so that a write racing with the hash invalidates the entry
            const auto mtime = _shards[i]->mtime();
            const auto observed = _hash_shard(i);
            if (observed != _meta.hashes()[i]) {
                logger::warn("shard {} is corrupt: expected hash {} observed {}", i,
                    crypto::blake2b::to_hex(_meta.hashes()[i]), crypto::blake2b::to_hex(observed));
                corrupt.emplace_back(corrupt_shard_t { i, observed });
                _mtimes[i].reset();
            } else {
                _mtimes[i] = mtime;
            }
        }
        return corrupt;
    }

    void health_manager_t::check_health()
    {
        const auto corrupt = detect_corruption();
        if (!corrupt.empty()) {
            std::vector<size_t> indices {};
            indices.reserve(corrupt.size());
            for (const auto &c: corrupt)
                indices.emplace_back(c.index);
            throw integrity_error(std::move(indices));
        }
    }

    void health_manager_t::repair()
    {
        const auto corrupt = detect_corruption();
        if (corrupt.empty()) {
            logger::debug("repair: all {} shards are healthy", _shards.size());
            return;
        }
        if (corrupt.size() > _meta.parity_shards()) [[unlikely]]
            throw insufficient_parity_error(corrupt.size(), _meta.parity_shards());
        std::vector<storage::reader_t *> readers {};
        readers.reserve(_shards.size());
        for (auto &s: _shards)
            readers.emplace_back(s.get());
        std::vector<storage::writer_t *> writers(_shards.size(), nullptr);
        std::vector<size_t> indices {};
        for (const auto &c: corrupt) {
            readers[c.index] = nullptr;
            writers[c.index] = _shards[c.index].get();
            indices.emplace_back(c.index);
        }
        _rewind_all();
        const auto coder = erasure::create(_meta.data_shards(), _meta.parity_shards(), _block_size);
        coder->reconstruct(readers, writers);
        // drops any bytes a corrupt shard carried past its proper end
        const auto shard_size = chunk_size(_meta.size(), _meta.data_shards());
        for (const auto idx: indices)
            _shards[idx]->truncate(shard_size);
        _rewind_all();
        logger::info("repaired shards: {}", format_indices(indices));
    }

    void health_manager_t::read(storage::writer_t &dst)
    {
        std::vector<size_t> corrupt {};
        _refresh(corrupt);
        if (!corrupt.empty()) {
            logger::warn("read: found corrupt shards {}, repairing", format_indices(corrupt));
            repair();
        }
        _serve(dst);
    }

    hash_t health_manager_t::_hash_shard(const size_t idx)
    {
        auto &s = *_shards[idx];
        s.rewind();
        crypto::blake2b::hasher_t hasher {};
        uint8_vector buf(_block_size);
        for (;;) {
            const auto n = s.read(buf);
            if (n == 0)
                break;
            hasher.update(buffer { buf.data(), n });
        }
        s.rewind();
        return hasher.finish();
    }

    void health_manager_t::_rewind_all()
    {
        for (auto &s: _shards)
            s->rewind();
    }

    // rehashes the shards whose modification time differs from the last clean observation
    void health_manager_t::_refresh(std::vector<size_t> &corrupt)
    {
        const auto check = [&](const size_t idx, const storage::mtime_t mtime) {
            if (_hash_shard(idx) == _meta.hashes()[idx]) {
                _mtimes[idx] = mtime;
            } else {
                _mtimes[idx].reset();
                corrupt.emplace_back(idx);
            }
        };
        std::vector<storage::mtime_t> mtimes {};
        mtimes.reserve(_shards.size());
        for (const auto &s: _shards)
            mtimes.emplace_back(s->mtime());

        // data shards usually share a single resource, so any change means rechecking all of them
        bool data_changed = false;
        for (size_t i = 0; i < _meta.data_shards(); ++i)
            data_changed |= _mtimes[i] != mtimes[i];
        if (data_changed) {
            for (size_t i = 0; i < _meta.data_shards(); ++i)
                check(i, mtimes[i]);
        } else {
            logger::trace("read: data shards are unchanged since the last check");
        }
        for (size_t i = _meta.data_shards(); i < _shards.size(); ++i) {
            if (_mtimes[i] != mtimes[i])
                check(i, mtimes[i]);
        }
    }

    void health_manager_t::_serve(storage::writer_t &dst)
    {
        uint64_t remaining = _meta.size();
        uint8_vector buf(_block_size);
        for (size_t i = 0; i < _meta.data_shards() && remaining > 0; ++i) {
            auto &s = *_shards[i];
            s.rewind();
            while (remaining > 0) {
                const auto n = s.read(write_buffer { buf.data(), static_cast<size_t>(std::min(static_cast<uint64_t>(buf.size()), remaining)) });
                if (n == 0)
                    break;
                dst.write(buffer { buf.data(), n });
                remaining -= n;
            }
            s.rewind();
        }
        if (remaining > 0) [[unlikely]]
            throw error(fmt::format("data shards ended {} bytes before the recorded data size", remaining));
    }
}
