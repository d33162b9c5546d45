/* This file is part of ShardGuard project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <cstdlib>
#include <cstring>
#include <optional>
#include <vector>
extern "C" {
#   include <jerasure.h>
#   include <reed_sol.h>
}
#include <shardguard/common/logger.hpp>
#include <shardguard/common/numeric-cast.hpp>
#include <shardguard/shard/errors.hpp>
#include "jerasure.hpp"

namespace shardguard::erasure::jerasure {
    struct coder_t::impl {
        impl(const size_t data_shards, const size_t parity_shards, const size_t block_size):
            _k { data_shards }, _m { parity_shards },
            // jerasure processes regions in multiples of the machine word
            _block_size { _align(block_size) }
        {
            if (_k == 0 || _m == 0) [[unlikely]]
                throw shard::encoding_error(fmt::format("need at least one data and one parity shard but got {} and {}", _k, _m));
            if (_k + _m > max_shards) [[unlikely]]
                throw shard::encoding_error(fmt::format("the total number of shards {} exceeds the maximum of {}", _k + _m, max_shards));
            _matrix.reset(reed_sol_vandermonde_coding_matrix(numeric_cast<int>(_k), numeric_cast<int>(_m), numeric_cast<int>(word_size)));
            if (!_matrix) [[unlikely]]
                throw shard::encoding_error(fmt::format("failed to create a coding matrix for {} data and {} parity shards", _k, _m));
            _blocks.resize(_k + _m);
            for (auto &b: _blocks)
                b.resize(_block_size);
            _ptrs.resize(_k + _m);
            for (size_t i = 0; i < _blocks.size(); ++i)
                _ptrs[i] = reinterpret_cast<char *>(_blocks[i].data());
        }

        void encode(const reader_list_t data, const writer_list_t parity)
        {
            if (data.size() != _k) [[unlikely]]
                throw shard::encoding_error(fmt::format("expected {} data shards but got {}", _k, data.size()));
            if (parity.size() != _m) [[unlikely]]
                throw shard::encoding_error(fmt::format("expected {} parity shards but got {}", _m, parity.size()));
            uint64_t total = 0;
            for (;;) {
                const auto n = _read_block(data);
                if (n == 0)
                    break;
                const auto region = _align(n);
                _zero_tail(0, _k, n, region);
                jerasure_matrix_encode(numeric_cast<int>(_k), numeric_cast<int>(_m), numeric_cast<int>(word_size),
                    _matrix.get(), _ptrs.data(), _ptrs.data() + _k, numeric_cast<int>(region));
                for (size_t j = 0; j < _m; ++j)
                    parity[j]->write(buffer { _blocks[_k + j].data(), n });
                total += n;
            }
            logger::trace("erasure: encoded {} bytes per shard into {} parity shards", total, _m);
        }

        void reconstruct(const reader_list_t shards, const writer_list_t rebuilt)
        {
            if (shards.size() != _k + _m || rebuilt.size() != _k + _m) [[unlikely]]
                throw shard::encoding_error(fmt::format("expected {} shards but got {} readers and {} writers", _k + _m, shards.size(), rebuilt.size()));
            std::vector<int> erasures {};
            for (size_t i = 0; i < shards.size(); ++i) {
                if (shards[i])
                    continue;
                if (!rebuilt[i]) [[unlikely]]
                    throw shard::encoding_error(fmt::format("no destination for the missing shard {}", i));
                erasures.emplace_back(numeric_cast<int>(i));
            }
            if (erasures.empty())
                return;
            if (erasures.size() > _m) [[unlikely]]
                throw shard::encoding_error(fmt::format("too few shards for reconstruction: {} missing, only {} parity shards", erasures.size(), _m));
            erasures.emplace_back(-1);
            for (;;) {
                const auto n = _read_block(shards);
                if (n == 0)
                    break;
                const auto region = _align(n);
                _zero_tail(0, _k + _m, n, region);
                const auto rc = jerasure_matrix_decode(numeric_cast<int>(_k), numeric_cast<int>(_m), numeric_cast<int>(word_size),
                    _matrix.get(), 1, erasures.data(), _ptrs.data(), _ptrs.data() + _k, numeric_cast<int>(region));
                if (rc != 0) [[unlikely]]
                    throw shard::encoding_error("reconstruction failed: the remaining shards are insufficient");
                for (const auto idx: erasures) {
                    if (idx < 0)
                        break;
                    rebuilt[static_cast<size_t>(idx)]->write(buffer { _blocks[static_cast<size_t>(idx)].data(), n });
                }
            }
        }

        [[nodiscard]] size_t data_shards() const noexcept
        {
            return _k;
        }

        [[nodiscard]] size_t parity_shards() const noexcept
        {
            return _m;
        }
    private:
        struct matrix_deleter {
            void operator()(int *p) const noexcept
            {
                free(p);
            }
        };

        const size_t _k;
        const size_t _m;
        const size_t _block_size;
        std::unique_ptr<int, matrix_deleter> _matrix {};
        std::vector<uint8_vector> _blocks {};
        std::vector<char *> _ptrs {};

        static size_t _align(const size_t sz)
        {
            static constexpr size_t alignment = 16;
            return (sz + alignment - 1) / alignment * alignment;
        }

        void _zero_tail(const size_t first, const size_t last, const size_t n, const size_t region)
        {
            if (region == n)
                return;
            for (size_t i = first; i < last; ++i)
                memset(_blocks[i].data() + n, 0, region - n);
        }

        // fills the block of every present reader, all present readers must yield the same number of bytes
        size_t _read_block(const reader_list_t readers)
        {
            std::optional<size_t> block_sz {};
            for (size_t i = 0; i < readers.size(); ++i) {
                auto *r = readers[i];
                if (!r)
                    continue;
                const auto n = storage::read_full(*r, _blocks[i]);
                if (!block_sz)
                    block_sz = n;
                else if (*block_sz != n) [[unlikely]]
                    throw shard::encoding_error("shard sizes do not match");
            }
            return block_sz.value_or(0);
        }
    };

    coder_t::coder_t(const size_t data_shards, const size_t parity_shards, const size_t block_size):
        _impl { std::make_unique<impl>(data_shards, parity_shards, block_size) }
    {
    }

    coder_t::~coder_t() =default;

    void coder_t::encode(const reader_list_t data, const writer_list_t parity)
    {
        _impl->encode(data, parity);
    }

    void coder_t::reconstruct(const reader_list_t shards, const writer_list_t rebuilt)
    {
        _impl->reconstruct(shards, rebuilt);
    }

    size_t coder_t::data_shards() const noexcept
    {
        return _impl->data_shards();
    }

    size_t coder_t::parity_shards() const noexcept
    {
        return _impl->parity_shards();
    }
}

namespace shardguard::erasure {
    coder_ptr_t create(const size_t data_shards, const size_t parity_shards, const size_t block_size)
    {
        return std::make_unique<jerasure::coder_t>(data_shards, parity_shards, block_size);
    }
}
