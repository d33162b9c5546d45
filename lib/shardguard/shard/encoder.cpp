/* This file is part of ShardGuard project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <shardguard/common/logger.hpp>
#include "encoder.hpp"
#include "errors.hpp"

namespace shardguard::shard {
    namespace {
        struct hashing_reader_t: storage::reader_t {
            explicit hashing_reader_t(storage::reader_t &src):
                _src { src }
            {
            }

            size_t read(const write_buffer out) override
            {
                const auto n = _src.read(out);
                _hasher.update(buffer { out.data(), n });
                return n;
            }

            hash_t finish()
            {
                return _hasher.finish();
            }
        private:
            storage::reader_t &_src;
            crypto::blake2b::hasher_t _hasher {};
        };

        struct hashing_writer_t: storage::writer_t {
            explicit hashing_writer_t(storage::writer_t &dst):
                _dst { dst }
            {
            }

            void write(const buffer data) override
            {
                _dst.write(data);
                _hasher.update(data);
            }

            hash_t finish()
            {
                return _hasher.finish();
            }
        private:
            storage::writer_t &_dst;
            crypto::blake2b::hasher_t _hasher {};
        };
    }

    encoder_t::encoder_t(const size_t data_shards, const size_t parity_shards, const size_t block_size):
        _data_shards { data_shards }, _parity_shards { parity_shards }, _block_size { block_size }
    {
    }

    metadata_t encoder_t::encode(const erasure::reader_list_t data, const erasure::writer_list_t parity, const uint64_t size) const
    {
        if (data.size() != _data_shards) [[unlikely]]
            throw encoding_error(fmt::format("error encoding: expected {} data shards but got {}", _data_shards, data.size()));
        if (parity.size() != _parity_shards) [[unlikely]]
            throw encoding_error(fmt::format("error encoding: expected {} parity shards but got {}", _parity_shards, parity.size()));
        std::vector<hashing_reader_t> readers {};
        readers.reserve(data.size());
        std::vector<storage::reader_t *> reader_ptrs {};
        for (auto *r: data) {
            if (!r) [[unlikely]]
                throw encoding_error("error encoding: a data shard is missing");
            reader_ptrs.emplace_back(&readers.emplace_back(*r));
        }
        std::vector<hashing_writer_t> writers {};
        writers.reserve(parity.size());
        std::vector<storage::writer_t *> writer_ptrs {};
        for (auto *w: parity) {
            if (!w) [[unlikely]]
                throw encoding_error("error encoding: a parity shard is missing");
            writer_ptrs.emplace_back(&writers.emplace_back(*w));
        }
        const auto coder = erasure::create(_data_shards, _parity_shards, _block_size);
        try {
            coder->encode(reader_ptrs, writer_ptrs);
        } catch (const encoding_error &ex) {
            throw encoding_error(fmt::format("error encoding: {}", ex.what()));
        }
        hash_list_t hashes {};
        hashes.reserve(_data_shards + _parity_shards);
        for (auto &r: readers)
            hashes.emplace_back(r.finish());
        for (auto &w: writers)
            hashes.emplace_back(w.finish());
        metadata_t meta { size, std::move(hashes), _data_shards, _parity_shards };
        logger::debug("encoded shards: {}", meta);
        return meta;
    }
}
