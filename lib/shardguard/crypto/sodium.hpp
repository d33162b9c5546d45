#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <sodium.h>
#include <shardguard/common/error.hpp>

namespace shardguard::crypto::sodium {
    // must be called before any libsodium primitive; safe to call from multiple threads
    extern void ensure_initialized();
}
