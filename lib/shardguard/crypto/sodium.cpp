/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include "sodium.hpp"

namespace shardguard::crypto::sodium {
    void ensure_initialized()
    {
        struct initializer_t {
            initializer_t()
            {
                if (sodium_init() == -1) [[unlikely]]
                    throw error("failed to initialize libsodium!");
            }
        };
        // runs once per process
        static initializer_t init {};
    }
}
