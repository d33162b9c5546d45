/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <shardguard/common/test.hpp>
#include "blake2b.hpp"
#include "sodium.hpp"

namespace {
    using namespace shardguard;
    using namespace crypto::blake2b;
}

suite shardguard_crypto_blake2b_suite = [] {
    "shardguard::crypto::blake2b"_test = [] {
        using test_vector = std::pair<std::string_view, uint8_vector>;
        static std::vector test_vectors = {
            test_vector { "0e5751c026e543b2e8ab2eb06099daa1d1e5df47778f7787faab45cdf12fe3a8", uint8_vector {} },
            test_vector { "EF72A2CDE2A485B61F25762073155CC857A3D1B3FFD07B9C9B1993C75E07879D", uint8_vector::from_hex("000102030405060708090A0B0C0E0F") }
        };
        "sodium initialization is idempotent"_test = [] {
            expect(nothrow([] { crypto::sodium::ensure_initialized(); }));
            expect(nothrow([] { crypto::sodium::ensure_initialized(); }));
        };
        "digest"_test = [] {
            for (const auto &[exp_hex, input]: test_vectors) {
                const auto exp = uint8_vector::from_hex(exp_hex);
                const auto act = digest(input);
                expect_equal(exp, static_cast<buffer>(act));
            }
        };
        "incremental"_test = [] {
            const auto input = uint8_vector::from_hex("000102030405060708090A0B0C0E0F");
            hasher_t h {};
            h.update(static_cast<buffer>(input).subbuf(0, 4));
            h.update(static_cast<buffer>(input).subbuf(4, 0));
            h.update(static_cast<buffer>(input).subbuf(4));
            const auto act = h.finish();
            expect_equal(uint8_vector::from_hex("EF72A2CDE2A485B61F25762073155CC857A3D1B3FFD07B9C9B1993C75E07879D"), static_cast<buffer>(act));
            expect(throws([&] { h.update(input); }));
        };
        "to_hex"_test = [] {
            expect_equal(std::string { "0e5751c026e543b2e8ab2eb06099daa1d1e5df47778f7787faab45cdf12fe3a8" }, to_hex(digest(uint8_vector {})));
        };
    };
};
