/* This file is part of ShardGuard project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <chrono>
#include <filesystem>
#include <shardguard/common/test.hpp>
#include <shardguard/storage/file.hpp>
#include <shardguard/storage/memory.hpp>
#include <shardguard/storage/stream.hpp>
#include "errors.hpp"
#include "file-set.hpp"

namespace {
    using namespace std::string_view_literals;
    using namespace shardguard;
    using namespace shardguard::shard;

    uint8_vector test_data(const size_t sz)
    {
        uint8_vector data(sz);
        for (size_t i = 0; i < data.size(); ++i)
            data[i] = static_cast<uint8_t>((i * 7 + 3) % 251);
        return data;
    }

    // writes in place and moves the modification time forward since quick successive writes may share a timestamp
    void overwrite(const std::string &path, const uint64_t off, const buffer bytes)
    {
        {
            storage::file::resource_t res { path, storage::file::open_mode_t::read_write };
            res.write_at(off, bytes);
        }
        std::filesystem::last_write_time(path, std::filesystem::last_write_time(path) + std::chrono::seconds { 1 });
    }

    uint8_vector read_all(file_set_t &fs)
    {
        storage::memory::resource_t out {};
        storage::resource_stream_t s { out };
        fs.read(s);
        return out.bytes();
    }
}

suite shardguard_shard_file_set_suite = [] {
    "shardguard::shard::file_set"_test = [] {
        "encode a file"_test = [] {
            const shardguard::file::tmp_directory dir { "test-shardguard-file-set-encode" };
            const auto data = test_data(808);
            shardguard::file::write(dir / "data.bin", data);
            const auto meta = encode_file(dir / "data.bin", 2, { dir / "parity-0.bin" });
            expect_equal(uint64_t { 808 }, meta.size());
            expect_equal(size_t { 2 }, meta.data_shards());
            expect_equal(size_t { 1 }, meta.parity_shards());
            expect_equal(hash_t::from_hex("14b27aa572312f8edac4ce9eb87a10cc585a3240f5f76cf75109cf998ea3f23e"), meta.hashes().at(0));
            expect_equal(hash_t::from_hex("93eac031a184283dc9895d2ea757af6ad6f9c2573884315a4829fdc867f647b0"), meta.hashes().at(1));
            expect_equal(hash_t::from_hex("9e0d9b781a56b2ae08e9a37c16f1ae78150eba81e0caf0a6462ed8d95189b25a"), meta.hashes().at(2));
            expect_equal(size_t { 404 }, shardguard::file::read(dir / "parity-0.bin").size());
            expect(throws<error_sys>([&] { encode_file(dir / "missing.bin", 2, { dir / "parity-1.bin" }); }));
        };
        "open checks the parity count"_test = [] {
            const shardguard::file::tmp_directory dir { "test-shardguard-file-set-open" };
            shardguard::file::write(dir / "data.bin", test_data(808));
            const auto meta = encode_file(dir / "data.bin", 2, { dir / "parity-0.bin" });
            expect(nothrow([&] { file_set_t { dir / "data.bin", { dir / "parity-0.bin" }, meta }; }));
            std::string msg {};
            try {
                file_set_t { dir / "data.bin", {}, meta };
            } catch (const error &ex) {
                msg = ex.what();
            }
            expect_equal(std::string { "cannot open encoded files: need 1 parity shards, got 0" }, msg);
        };
        "uneven input end to end"_test = [] {
            const shardguard::file::tmp_directory dir { "test-shardguard-file-set-uneven" };
            const auto data = test_data(547);
            const path_list_t parity { dir / "parity-0.bin", dir / "parity-1.bin" };
            shardguard::file::write(dir / "data.bin", data);
            const auto meta = encode_file(dir / "data.bin", 3, parity);
            meta.save(dir / "meta.json");
            file_set_t fs { dir / "data.bin", parity, metadata_t::load(dir / "meta.json") };
            expect(nothrow([&] { fs.check_health(); }));
            expect_equal(data, read_all(fs));
        };
        "check and repair files"_test = [] {
            const shardguard::file::tmp_directory dir { "test-shardguard-file-set-repair" };
            const auto data = test_data(1000);
            const path_list_t parity { dir / "parity-0.bin", dir / "parity-1.bin" };
            shardguard::file::write(dir / "data.bin", data);
            const auto meta = encode_file(dir / "data.bin", 4, parity);
            file_set_t fs { dir / "data.bin", parity, meta };
            overwrite(dir / "data.bin", 10, "XXXX"sv);
            overwrite(parity[1], 20, "XXXX"sv);
            expect(throws<integrity_error>([&] { fs.check_health(); }));
            fs.repair();
            expect(nothrow([&] { fs.check_health(); }));
            expect_equal(data, shardguard::file::read(dir / "data.bin"));
        };
        "repair a parity file with trailing bytes"_test = [] {
            const shardguard::file::tmp_directory dir { "test-shardguard-file-set-trailing" };
            const auto data = test_data(808);
            const path_list_t parity { dir / "parity-0.bin" };
            shardguard::file::write(dir / "data.bin", data);
            const auto meta = encode_file(dir / "data.bin", 2, parity);
            const auto parity_bytes = shardguard::file::read(parity[0]);
            file_set_t fs { dir / "data.bin", parity, meta };
            overwrite(parity[0], parity_bytes.size(), "\x01"sv);
            expect_equal(size_t { 405 }, shardguard::file::read(parity[0]).size());
            expect(throws<integrity_error>([&] { fs.check_health(); }));
            fs.repair();
            expect(nothrow([&] { fs.check_health(); }));
            expect_equal(parity_bytes, shardguard::file::read(parity[0]));
        };
        "read repairs and fails on insufficient parity"_test = [] {
            const shardguard::file::tmp_directory dir { "test-shardguard-file-set-read" };
            const auto data = test_data(808);
            const path_list_t parity { dir / "parity-0.bin" };
            shardguard::file::write(dir / "data.bin", data);
            const auto meta = encode_file(dir / "data.bin", 2, parity);
            file_set_t fs { dir / "data.bin", parity, meta };
            expect_equal(data, read_all(fs));
            overwrite(dir / "data.bin", 600, "XXXX"sv);
            expect_equal(data, read_all(fs));
            overwrite(dir / "data.bin", 0, "XX"sv);
            overwrite(parity[0], 0, "XX"sv);
            expect(throws<insufficient_parity_error>([&] { read_all(fs); }));
        };
    };
};
