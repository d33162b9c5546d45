/* This file is part of ShardGuard project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <limits>
#include <shardguard/common/test.hpp>
#include "file.hpp"
#include "memory.hpp"
#include "stream.hpp"

namespace {
    using namespace std::string_view_literals;
    using namespace shardguard;
    using namespace shardguard::storage;

    void test_resource(storage::resource_t &res)
    {
        expect_equal(uint64_t { 0 }, res.size());
        const auto mtime0 = res.mtime();
        res.write_at(0, "ABCDEFGH"sv);
        expect_equal(uint64_t { 8 }, res.size());
        uint8_vector buf(4);
        expect_equal(size_t { 4 }, res.read_at(2, buf));
        expect_equal(buffer { "CDEF"sv }, static_cast<buffer>(buf));
        // short read at the tail
        expect_equal(size_t { 2 }, res.read_at(6, buf));
        expect_equal(buffer { "GH"sv }, static_cast<buffer>(buf).subbuf(0, 2));
        expect_equal(size_t { 0 }, res.read_at(8, buf));
        expect_equal(size_t { 0 }, res.read_at(100, buf));
        res.write_at(10, "XY"sv);
        expect_equal(uint64_t { 12 }, res.size());
        expect(res.mtime() >= mtime0);
    }

    void test_truncate(storage::resource_t &res)
    {
        res.write_at(0, "ABCDEFGH"sv);
        res.truncate(3);
        expect_equal(uint64_t { 3 }, res.size());
        res.truncate(5);
        expect_equal(uint64_t { 5 }, res.size());
        uint8_vector buf(8);
        expect_equal(size_t { 5 }, res.read_at(0, buf));
        expect_equal(uint8_vector::from_hex("4142430000"), uint8_vector { static_cast<buffer>(buf).subbuf(0, 5) });
    }
}

suite shardguard_storage_suite = [] {
    "shardguard::storage"_test = [] {
        "memory resource"_test = [] {
            memory::resource_t res {};
            test_resource(res);
            const auto v0 = res.mtime();
            res.write_at(0, "Z"sv);
            expect(res.mtime() != v0);
            expect_equal(uint8_vector::from_hex("5A4243444546474800005859"), res.bytes());
            memory::resource_t res2 {};
            const auto v1 = res2.mtime();
            test_truncate(res2);
            expect(res2.mtime() != v1);
        };
        "file resource"_test = [] {
            const shardguard::file::tmp_directory tmp_dir { "test-shardguard-storage-file" };
            const auto path = tmp_dir / "res.bin";
            {
                storage::file::resource_t res { path, storage::file::open_mode_t::truncate };
                test_resource(res);
            }
            expect_equal(uint8_vector::from_hex("41424344454647480000" "5859"), shardguard::file::read(path));
            expect(throws<error_sys>([&] { storage::file::resource_t { tmp_dir / "missing.bin", storage::file::open_mode_t::read_only }; }));
            {
                storage::file::resource_t res { tmp_dir / "trunc.bin", storage::file::open_mode_t::truncate };
                test_truncate(res);
            }
            expect_equal(uint64_t { 5 }, shardguard::file::read(tmp_dir / "trunc.bin").size());
        };
        "resource stream"_test = [] {
            memory::resource_t res { "ABCDEFGH"sv };
            resource_stream_t s { res };
            uint8_vector buf(5);
            expect_equal(size_t { 5 }, s.read(buf));
            expect_equal(size_t { 3 }, s.read(buf));
            expect_equal(size_t { 0 }, s.read(buf));
            expect_equal(uint64_t { 6 }, s.seek(-2, whence_t::end));
            expect_equal(uint64_t { 4 }, s.seek(-2, whence_t::current));
            s.write("xy"sv);
            expect_equal(uint8_vector { buffer { "ABCDxyGH"sv } }, res.bytes());
            expect(throws([&] { s.seek(-1, whence_t::start); }));
            expect_equal(uint64_t { 6 }, s.position());
            s.rewind();
            expect_equal(uint64_t { 0 }, s.position());
            s.seek(4, whence_t::start);
            expect(throws([&] { s.seek(std::numeric_limits<int64_t>::max(), whence_t::current); }));
            expect_equal(uint64_t { 4 }, s.position());
            s.truncate(2);
            expect_equal(uint64_t { 2 }, res.size());
        };
        "read_full"_test = [] {
            memory::resource_t res { "ABC"sv };
            resource_stream_t s { res };
            uint8_vector buf(8);
            expect_equal(size_t { 3 }, read_full(s, buf));
            expect_equal(size_t { 0 }, read_full(s, buf));
        };
    };
};
