#pragma once
/* This file is part of ShardGuard project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <vector>
#include <shardguard/common/error.hpp>

namespace shardguard::shard {
    struct bounds_error: error {
        using error::error;
    };

    struct invalid_argument_error: error {
        using error::error;
    };

    struct encoding_error: error {
        using error::error;
    };

    struct integrity_error: error {
        explicit integrity_error(std::vector<size_t> indices);

        [[nodiscard]] const std::vector<size_t> &indices() const noexcept
        {
            return _indices;
        }
    private:
        std::vector<size_t> _indices;
    };

    struct insufficient_parity_error: error {
        insufficient_parity_error(size_t num_corrupt, size_t num_parity);

        [[nodiscard]] size_t num_corrupt() const noexcept
        {
            return _num_corrupt;
        }

        [[nodiscard]] size_t num_parity() const noexcept
        {
            return _num_parity;
        }
    private:
        size_t _num_corrupt;
        size_t _num_parity;
    };

    // renders indices as "[0 1 5]"
    extern std::string format_indices(const std::vector<size_t> &indices);
}
