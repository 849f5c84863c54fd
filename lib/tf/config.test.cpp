/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <tf/config.hpp>
#include <tf/test.hpp>

using namespace tree_finder;

namespace {
    json::object parse_object(const std::string_view &text)
    {
        return std::move(json::parse(text).as_object());
    }
}

suite config_suite = [] {
    "config"_test = [] {
        "empty"_test = [] {
            const auto wc = walk_config::from(config_json { json::object {} });
            expect(!wc.root);
            expect(!wc.file_filter);
            expect(!wc.dir_filter);
            expect(wc.opts.on_error == error_policy::skip);
        };
        "full"_test = [] {
            const config_json cfg { parse_object(R"({
                "root": "../src",
                "files": { "extensions": [ ".c" ], "suffixes": [ "-test.h" ], "names": [ "Makefile" ] },
                "directories": { "excludeSuffixes": [ "examples" ], "excludeNames": [ ".git" ] },
                "onError": "abort"
            })") };
            expect(cfg.contains("root"));
            expect(cfg.at("root").as_string() == "../src");
            const auto wc = walk_config::from(cfg);
            test_same(wc.root, std::optional<std::string> { "../src" });
            expect(wc.opts.on_error == error_policy::abort);
            expect(static_cast<bool>(wc.file_filter));
            const auto &ff = *wc.file_filter;
            expect(ff("/src/a.c"));
            expect(ff("/src/a-test.h"));
            expect(ff("/src/Makefile"));
            expect(!ff("/src/a.h"));
            expect(static_cast<bool>(wc.dir_filter));
            const auto &df = *wc.dir_filter;
            expect(!df("/src/examples"));
            expect(!df("/src/.git"));
            expect(df("/src/lib"));
        };
        "empty criteria mean no filter"_test = [] {
            const auto wc = walk_config::from(config_json { parse_object(R"({ "files": { "extensions": [] }, "directories": {} })") });
            expect(!wc.file_filter);
            expect(!wc.dir_filter);
        };
        "invalid"_test = [] {
            expect(throws<error>([] { walk_config::from(config_json { parse_object(R"({ "root": 12 })") }); }));
            expect(throws<error>([] { walk_config::from(config_json { parse_object(R"({ "files": [] })") }); }));
            expect(throws<error>([] { walk_config::from(config_json { parse_object(R"({ "files": { "extensions": ".c" } })") }); }));
            expect(throws<error>([] { walk_config::from(config_json { parse_object(R"({ "files": { "extensions": [ 1 ] } })") }); }));
            expect(throws<error>([] { walk_config::from(config_json { parse_object(R"({ "onError": "retry" })") }); }));
            expect(throws<error>([] { config_json { json::object {} }.at("root"); }));
        };
        "parse_policy"_test = [] {
            expect(walk_config::parse_policy("skip") == error_policy::skip);
            expect(walk_config::parse_policy("abort") == error_policy::abort);
            expect(throws<error>([] { walk_config::parse_policy("ignore"); }));
        };
        "config_file"_test = [] {
            file::tmp_directory tmp { "config-file" };
            const auto path = tmp.path("find.json");
            file::write(path, R"({ "root": "/src", "directories": { "excludeSuffixes": [ "examples" ] } })");
            const config_file cfg { path };
            const auto wc = walk_config::from(cfg);
            test_same(wc.root, std::optional<std::string> { "/src" });
            expect(!wc.file_filter);
            expect(static_cast<bool>(wc.dir_filter));
            expect(throws<error>([&] { cfg.at("onError"); }));
        };
        "config_file errors"_test = [] {
            file::tmp_directory tmp { "config-file-errors" };
            expect(throws<error>([&] { config_file cfg { tmp.path("missing.json") }; }));
            const auto bad = tmp.path("bad.json");
            file::write(bad, "{ not json");
            expect(throws<error>([&] { config_file cfg { bad }; }));
            const auto arr = tmp.path("array.json");
            file::write(arr, "[ 1, 2 ]");
            expect(throws<error>([&] { config_file cfg { arr }; }));
        };
    };
};
