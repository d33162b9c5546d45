/* This file is part of ShardGuard project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <boost/json.hpp>
#include <shardguard/common/test.hpp>
#include "json.hpp"

namespace {
    using namespace shardguard;
    using namespace shardguard::codec::json;
}

suite shardguard_codec_json_suite = [] {
    "shardguard::codec::json"_test = [] {
        "save_pretty + reload object"_test = [] {
            file::tmp t { "json-save-pretty-object-test.json" };
            const auto j = object {
                { "name", "abc" },
                { "version", 123 }
            };
            save_pretty(t.path(), j);
            const auto buf = file::read(t.path());
            expect_equal(std::string_view { "{\n  \"name\": \"abc\",\n  \"version\": 123\n}" }, buf);
            const auto loaded = load(t.path());
            expect(j == loaded);
        };
        "save_pretty + reload array"_test = [] {
            file::tmp t { "json-save-pretty-array-test.json" };
            auto j = array {
                "name",
                123
            };
            save_pretty(t.path(), j);
            auto act = file::read(t.path());
            std::string_view exp { "[\n  \"name\",\n  123\n]" };
            expect(act.size() == exp.size()) << act.size() << exp.size();
            expect(act == exp) << static_cast<buffer>(act);
            const auto loaded = load(t.path());
            expect(j == loaded);
        };
        "save_pretty empty containers"_test = [] {
            expect_equal(std::string { "{\n  \"hashes\": [],\n  \"opts\": {}\n}" },
                serialize_pretty(object { { "hashes", array {} }, { "opts", object {} } }));
        };
        "field accessors"_test = [] {
            const auto jv = parse(std::string_view { R"({"size": 808, "neg": -1, "name": "x"})" });
            const auto &obj = jv.as_object();
            expect_equal(uint64_t { 808 }, field_uint(obj, "size"));
            expect(throws<shardguard::error>([&] { field_uint(obj, "neg"); }));
            expect(throws<shardguard::error>([&] { field_uint(obj, "name"); }));
            expect(throws<shardguard::error>([&] { field(obj, "missing"); }));
        };
    };
};
