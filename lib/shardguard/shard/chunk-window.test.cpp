/* This file is part of ShardGuard project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <limits>
#include <shardguard/common/test.hpp>
#include <shardguard/storage/memory.hpp>
#include "chunk-window.hpp"
#include "errors.hpp"

namespace {
    using namespace std::string_view_literals;
    using namespace shardguard;
    using namespace shardguard::shard;
    using storage::whence_t;

    uint8_vector read_all(storage::reader_t &r, const size_t buf_sz=3)
    {
        uint8_vector res {};
        uint8_vector buf(buf_sz);
        for (;;) {
            const auto n = r.read(buf);
            if (n == 0)
                break;
            res << static_cast<buffer>(buf).subbuf(0, n);
        }
        return res;
    }
}

suite shardguard_shard_chunk_window_suite = [] {
    "shardguard::shard::chunk_window"_test = [] {
        "split reads"_test = [] {
            struct test_vector {
                std::string_view input;
                size_t num_chunks;
                std::vector<std::string_view> expected;
            };
            const std::vector<test_vector> vectors {
                { "ABCDEFGH"sv, 2, { "ABCD"sv, "EFGH"sv } },
                { "ABCDEFGHI"sv, 2, { "ABCDE"sv, "FGHI\0"sv } },
                { "ABCDEFGH"sv, 3, { "ABC"sv, "DEF"sv, "GH\0"sv } }
            };
            for (const auto &tv: vectors) {
                storage::memory::resource_t res { tv.input };
                const auto windows = split(res, tv.input.size(), tv.num_chunks);
                expect_equal(tv.num_chunks, windows.size());
                for (size_t i = 0; i < windows.size(); ++i)
                    expect_equal(buffer { tv.expected[i] }, static_cast<buffer>(read_all(*windows[i])), tv.input);
            }
        };
        "read stops at the window limit"_test = [] {
            storage::memory::resource_t res { "ABCDEFGH"sv };
            const auto windows = split(res, 8, 2);
            uint8_vector buf(12);
            expect_equal(size_t { 4 }, windows[0]->read(buf));
            expect_equal(buffer { "ABCD"sv }, static_cast<buffer>(buf).subbuf(0, 4));
            expect_equal(size_t { 0 }, windows[0]->read(buf));
            expect_equal(size_t { 4 }, windows[1]->read(buf));
            expect_equal(buffer { "EFGH"sv }, static_cast<buffer>(buf).subbuf(0, 4));
            expect_equal(size_t { 0 }, windows[1]->read(buf));
        };
        "padding with small reads"_test = [] {
            storage::memory::resource_t res { "ABCDEFGHI"sv };
            const auto windows = split(res, 9, 2);
            expect_equal(uint8_vector::from_hex("4142434445"), read_all(*windows[0], 2));
            expect_equal(uint8_vector::from_hex("4647484900"), read_all(*windows[1], 2));
            expect_equal(uint64_t { 5 }, windows[1]->position());
        };
        "tiling"_test = [] {
            for (uint64_t sz = 1; sz <= 40; ++sz) {
                for (size_t n = 1; n <= 9; ++n) {
                    storage::memory::resource_t res {};
                    const auto windows = split(res, sz, n);
                    const auto chunk_sz = sz / n + (sz % n ? 1 : 0);
                    uint64_t total = 0;
                    uint64_t next_start = 0;
                    for (const auto &w: windows) {
                        expect_equal(next_start, w->start());
                        expect_equal(chunk_sz, w->size());
                        next_start = w->limit();
                        total += w->size();
                    }
                    expect_equal(n * chunk_sz, total);
                    expect(total >= sz && total - sz < n);
                }
            }
        };
        "empty input"_test = [] {
            storage::memory::resource_t res {};
            const auto windows = split(res, 0, 3);
            expect_equal(size_t { 3 }, windows.size());
            for (const auto &w: windows)
                expect_equal(size_t { 0 }, read_all(*w).size());
            expect(throws<error>([&] { split(res, 8, 0); }));
        };
        "writes"_test = [] {
            struct test_vector {
                std::vector<std::string_view> inputs;
                std::string_view output;
            };
            const std::vector<test_vector> vectors {
                { { "AB"sv, "CD"sv }, "ABCD"sv },
                { { "ABCDE"sv, "FGHI"sv }, "ABCDEFGHI"sv },
                { { "ABC"sv, "DEF"sv, "GH"sv }, "ABCDEFGH"sv }
            };
            for (const auto &tv: vectors) {
                storage::memory::resource_t res {};
                const auto windows = split(res, tv.output.size(), tv.inputs.size());
                for (size_t i = 0; i < windows.size(); ++i)
                    windows[i]->write(tv.inputs[i]);
                expect_equal(buffer { tv.output }, static_cast<buffer>(res.bytes()));
            }
        };
        "write limits"_test = [] {
            storage::memory::resource_t res { "ABCDEFGH"sv };
            for (const uint64_t start: { 0ULL, 4ULL }) {
                for (const int64_t pos: { 0LL, 2LL }) {
                    chunk_window_t w { res, start, start + 4 };
                    w.seek(pos, whence_t::start);
                    expect(throws<bounds_error>([&] { w.write("TOOBIG"sv); }));
                    expect_equal(static_cast<uint64_t>(pos), w.position());
                }
            }
            expect_equal(buffer { "ABCDEFGH"sv }, static_cast<buffer>(res.bytes()));
        };
        "seek"_test = [] {
            struct test_vector {
                int64_t off;
                whence_t whence;
                size_t read_first;
                size_t read_second;
                std::string_view expected;
            };
            const std::vector<test_vector> vectors {
                { 0, whence_t::start, 4, 4, "ABCD"sv },
                { 2, whence_t::start, 4, 2, "CD"sv },
                { 2, whence_t::current, 2, 2, "EF"sv },
                { -2, whence_t::current, 2, 2, "AB"sv },
                { -2, whence_t::end, 2, 2, "GH"sv },
                { -8, whence_t::end, 2, 2, "AB"sv }
            };
            for (const auto &tv: vectors) {
                storage::memory::resource_t res { "ABCDEFGH"sv };
                auto windows = split(res, 8, 1);
                uint8_vector buf(tv.read_first);
                expect_equal(tv.read_first, windows[0]->read(buf));
                windows[0]->seek(tv.off, tv.whence);
                buf.resize(tv.read_second);
                expect_equal(tv.read_second, windows[0]->read(buf));
                expect_equal(buffer { tv.expected }, static_cast<buffer>(buf));
            }
        };
        "seek errors"_test = [] {
            struct test_vector {
                int64_t off;
                whence_t whence;
                std::string_view msg;
            };
            const std::vector<test_vector> vectors {
                { 5, whence_t::start, "requested position 5 is larger than chunk limit 4"sv },
                { 5, whence_t::current, "requested position 5 is larger than chunk limit 4"sv },
                { 2, whence_t::end, "requested position 6 is larger than chunk limit 4"sv },
                { -1, whence_t::start, "requested position -1 is smaller than chunk beginning 0"sv },
                { -1, whence_t::current, "requested position -1 is smaller than chunk beginning 0"sv },
                { -6, whence_t::end, "requested position -2 is smaller than chunk beginning 0"sv }
            };
            for (const auto &tv: vectors) {
                storage::memory::resource_t res { "ABCDEFGH"sv };
                auto windows = split(res, 8, 2);
                std::string msg {};
                try {
                    windows[0]->seek(tv.off, tv.whence);
                } catch (const bounds_error &ex) {
                    msg = ex.what();
                }
                expect_equal(tv.msg, std::string_view { msg });
                expect_equal(uint64_t { 0 }, windows[0]->position());
            }
            storage::memory::resource_t res { "ABCDEFGH"sv };
            chunk_window_t w { res, 0, 4 };
            expect(throws<invalid_argument_error>([&] { w.seek(0, static_cast<whence_t>(4)); }));
            expect(throws<invalid_argument_error>([&] { w.seek(0, static_cast<whence_t>(-2)); }));
            expect(throws<bounds_error>([&] { chunk_window_t { res, 5, 4 }; }));
        };
        "seek past the offset range"_test = [] {
            storage::memory::resource_t res { "ABCDEFGH"sv };
            chunk_window_t w { res, 0, 8 };
            w.seek(4, whence_t::start);
            std::string msg {};
            try {
                w.seek(std::numeric_limits<int64_t>::max(), whence_t::current);
            } catch (const bounds_error &ex) {
                msg = ex.what();
            }
            expect_equal(std::string { "requested position 4 + 9223372036854775807 is larger than chunk limit 8" }, msg);
            expect_equal(uint64_t { 4 }, w.position());
            expect(throws<bounds_error>([&] { w.seek(std::numeric_limits<int64_t>::max(), whence_t::end); }));
            expect(throws<bounds_error>([&] { w.seek(std::numeric_limits<int64_t>::min(), whence_t::current); }));
            expect_equal(uint64_t { 4 }, w.position());
        };
        "truncate keeps the window size"_test = [] {
            storage::memory::resource_t res { "ABCDEFGH"sv };
            chunk_window_t w { res, 4, 8 };
            expect(nothrow([&] { w.truncate(4); }));
            expect(throws<bounds_error>([&] { w.truncate(3); }));
            expect_equal(uint64_t { 8 }, res.size());
        };
        "mtime follows the resource"_test = [] {
            storage::memory::resource_t res { "ABCDEFGH"sv };
            auto windows = split(res, 8, 2);
            const auto m0 = windows[0]->mtime();
            windows[1]->write("Z"sv);
            expect(windows[0]->mtime() != m0);
            expect_equal(windows[0]->mtime(), windows[1]->mtime());
        };
    };
};
