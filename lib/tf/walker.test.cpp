/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <tf/filter.hpp>
#include <tf/test.hpp>
#include <tf/walker.hpp>

using namespace tree_finder;

namespace {
    // file lists come in enumeration order
    dir_map sorted(dir_map m)
    {
        for (auto &[dir, files]: m)
            std::sort(files.begin(), files.end());
        return m;
    }

    set<std::string> keys(const dir_map &m)
    {
        set<std::string> res {};
        for (const auto &[dir, files]: m)
            res.emplace(dir);
        return res;
    }

    // root/{a.c, b.txt, sub/{c.c}}
    void make_simple_tree(const file::tmp_directory &tmp)
    {
        test_touch(tmp.path("a.c"));
        test_touch(tmp.path("b.txt"));
        test_touch(tmp.path("sub/c.c"));
    }

    // root/{x.c, examples/{e.c, deep/{d.c, more/m.h}}, lib/{l.c, l.h, examples/y.c}, empty/}
    void make_nested_tree(const file::tmp_directory &tmp)
    {
        test_touch(tmp.path("x.c"));
        test_touch(tmp.path("examples/e.c"));
        test_touch(tmp.path("examples/deep/d.c"));
        test_touch(tmp.path("examples/deep/more/m.h"));
        test_touch(tmp.path("lib/l.c"));
        test_touch(tmp.path("lib/l.h"));
        test_touch(tmp.path("lib/examples/y.c"));
        test_mkdir(tmp.path("empty"));
    }
}

suite walker_suite = [] {
    "walker"_test = [] {
        "file filter only"_test = [] {
            file::tmp_directory tmp { "walk-a" };
            make_simple_tree(tmp);
            const auto res = walk(tmp.path(), filter::ends_with(".c"));
            const dir_map exp {
                { tmp.path(), { tmp.path("a.c") } },
                { tmp.path("sub"), { tmp.path("sub/c.c") } }
            };
            test_same(sorted(res), exp);
        };
        "rejected directory records nothing"_test = [] {
            file::tmp_directory tmp { "walk-b" };
            make_simple_tree(tmp);
            const auto res = walk(tmp.path(), {}, filter::negate(filter::ends_with("sub")));
            const dir_map exp {
                { tmp.path(), { tmp.path("a.c"), tmp.path("b.txt") } }
            };
            test_same(sorted(res), exp);
        };
        "empty directory is a key with no files"_test = [] {
            file::tmp_directory tmp { "walk-c" };
            const auto root = test_mkdir(tmp.path("empty"));
            const auto res = walk(root);
            const dir_map exp { { root, {} } };
            test_same(res, exp);
        };
        "missing root is skipped"_test = [] {
            file::tmp_directory tmp { "walk-d" };
            const auto root = tmp.path("no-such-dir");
            walker w { root };
            expect(w.step());
            expect(w.done());
            expect(w.result().empty());
            test_same(w.failed(), file::path_list { root });
            expect(walk(root).empty());
        };
        "missing root aborts"_test = [] {
            file::tmp_directory tmp { "walk-d-abort" };
            const auto root = tmp.path("no-such-dir");
            expect(throws<file::list_error>([&] { walk(root, {}, {}, walk_options { error_policy::abort }); }));
            try {
                walk(root, {}, {}, walk_options { error_policy::abort });
            } catch (const file::list_error &ex) {
                test_same(ex.path(), root);
            }
        };
        "every reachable directory is a key without a directory filter"_test = [] {
            file::tmp_directory tmp { "walk-all" };
            make_nested_tree(tmp);
            const auto res = walk(tmp.path());
            const set<std::string> exp {
                tmp.path(), tmp.path("examples"), tmp.path("examples/deep"), tmp.path("examples/deep/more"),
                tmp.path("lib"), tmp.path("lib/examples"), tmp.path("empty")
            };
            test_same(keys(res), exp);
            test_same(test_sorted(res.at(tmp.path("lib"))), file::path_list { tmp.path("lib/l.c"), tmp.path("lib/l.h") });
            expect(res.at(tmp.path("empty")).empty());
        };
        "descendants of rejected directories are still visited"_test = [] {
            file::tmp_directory tmp { "walk-descend" };
            make_nested_tree(tmp);
            walker w { tmp.path(), filter::extension({ ".c" }), filter::negate(filter::ends_with("examples")) };
            while (!w.done())
                w.step();
            test_same(w.visited(), 7U);
            const dir_map exp {
                { tmp.path(), { tmp.path("x.c") } },
                { tmp.path("examples/deep"), { tmp.path("examples/deep/d.c") } },
                { tmp.path("examples/deep/more"), {} },
                { tmp.path("lib"), { tmp.path("lib/l.c") } },
                { tmp.path("empty"), {} }
            };
            test_same(sorted(w.take()), exp);
        };
        "no file filter equals an always true filter"_test = [] {
            file::tmp_directory tmp { "walk-same" };
            make_nested_tree(tmp);
            const auto all = sorted(walk(tmp.path()));
            const auto all_filtered = sorted(walk(tmp.path(), [](const std::string &) { return true; }));
            test_same(all, all_filtered);
        };
        "filters see absolute paths"_test = [] {
            file::tmp_directory tmp { "walk-abs" };
            make_simple_tree(tmp);
            size_t file_calls = 0;
            size_t dir_calls = 0;
            walk(tmp.path(),
                [&](const std::string &p) { ++file_calls; expect(std::filesystem::path { p }.is_absolute()); return true; },
                [&](const std::string &p) { ++dir_calls; expect(std::filesystem::path { p }.is_absolute()); return true; });
            test_same(file_calls, 3U);
            test_same(dir_calls, 2U);
        };
        "file filter is not called for rejected directories"_test = [] {
            file::tmp_directory tmp { "walk-no-calls" };
            make_simple_tree(tmp);
            size_t file_calls = 0;
            const auto res = walk(tmp.path(), [&](const std::string &) { ++file_calls; return true; }, [](const std::string &) { return false; });
            expect(res.empty());
            test_same(file_calls, 0U);
        };
        "idempotent"_test = [] {
            file::tmp_directory tmp { "walk-twice" };
            make_nested_tree(tmp);
            const auto ff = filter::extension({ ".c", ".h" });
            test_same(sorted(walk(tmp.path(), ff)), sorted(walk(tmp.path(), ff)));
        };
        "relative root"_test = [] {
            file::tmp_directory tmp { "walk-rel" };
            make_simple_tree(tmp);
            const auto prev_cwd = std::filesystem::current_path();
            std::filesystem::current_path(tmp.path());
            const auto cwd = std::filesystem::current_path().string();
            const auto res = walk("./sub/");
            std::filesystem::current_path(prev_cwd);
            test_same(keys(res), set<std::string> { file::absolute(cwd + "/sub") });
        };
        "stack is inspectable between steps"_test = [] {
            file::tmp_directory tmp { "walk-stack" };
            test_mkdir(tmp.path("one/two"));
            test_mkdir(tmp.path("three"));
            walker w { tmp.path() };
            test_same(w.stack(), walker::stack_type { tmp.path() });
            expect(w.step());
            test_same(test_sorted(w.stack()), file::path_list { tmp.path("one"), tmp.path("three") });
            test_same(w.result().size(), 1U);
            // last pushed is first popped
            const auto next = w.stack().back();
            expect(w.step());
            expect(w.result().contains(next));
            while (!w.done())
                w.step();
            expect(!w.step());
            test_same(w.visited(), 4U);
            test_same(w.result().size(), 4U);
        };
        "directory removed while pending"_test = [] {
            file::tmp_directory tmp { "walk-removed" };
            test_touch(tmp.path("a/a.c"));
            test_touch(tmp.path("b/b.c"));
            {
                walker w { tmp.path() };
                expect(w.step());
                std::filesystem::remove_all(tmp.path("a"));
                while (!w.done())
                    w.step();
                test_same(w.failed(), file::path_list { tmp.path("a") });
                test_same(keys(w.result()), set<std::string> { tmp.path(), tmp.path("b") });
            }
            test_touch(tmp.path("a/a.c"));
            {
                walker w { tmp.path(), {}, {}, walk_options { error_policy::abort } };
                expect(w.step());
                std::filesystem::remove_all(tmp.path("b"));
                expect(throws<file::list_error>([&] {
                    while (!w.done())
                        w.step();
                }));
            }
        };
        "predicate errors propagate"_test = [] {
            file::tmp_directory tmp { "walk-pred-error" };
            make_simple_tree(tmp);
            expect(throws<std::invalid_argument>([&] {
                walk(tmp.path(), [](const std::string &) -> bool { throw std::invalid_argument("bad file"); });
            }));
            expect(throws<std::invalid_argument>([&] {
                walk(tmp.path(), {}, [](const std::string &) -> bool { throw std::invalid_argument("bad dir"); });
            }));
        };
        "deep tree"_test = [] {
            file::tmp_directory tmp { "walk-deep" };
            std::filesystem::path p { tmp.path() };
            static constexpr size_t depth = 64;
            for (size_t i = 0; i < depth; ++i)
                p /= "d";
            test_touch((p / "leaf.c").string());
            const auto res = walk(tmp.path(), filter::extension({ ".c" }));
            test_same(res.size(), depth + 1);
            test_same(res.at(p.string()), file::path_list { (p / "leaf.c").string() });
        };
    };
};
