/* This file is part of ShardGuard project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <shardguard/common/format.hpp>
#include "errors.hpp"

namespace shardguard::shard {
    std::string format_indices(const std::vector<size_t> &indices)
    {
        std::string res { "[" };
        for (size_t i = 0; i < indices.size(); ++i) {
            if (i)
                res += ' ';
            res += fmt::format("{}", indices[i]);
        }
        res += ']';
        return res;
    }

    integrity_error::integrity_error(std::vector<size_t> indices):
        error { fmt::format("corrupted shards: {}", format_indices(indices)) },
        _indices { std::move(indices) }
    {
    }

    insufficient_parity_error::insufficient_parity_error(const size_t num_corrupt, const size_t num_parity):
        error { fmt::format("cannot repair data: {} shards corrupt, only have {} parity shards", num_corrupt, num_parity) },
        _num_corrupt { num_corrupt },
        _num_parity { num_parity }
    {
    }
}
