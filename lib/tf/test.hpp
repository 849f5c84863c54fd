/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TREE_FINDER_TEST_HPP
#define TREE_FINDER_TEST_HPP

#include <algorithm>
#include <iostream>
#include <source_location>
#define BOOST_UT_DISABLE_MODULE 1
#include <boost/ut.hpp>
#include <tf/container.hpp>
#include <tf/error.hpp>
#include <tf/file.hpp>
#include <tf/logger.hpp>

namespace tree_finder {
    using namespace boost::ut;

    struct test_printer: boost::ut::printer {
        template<class T>
        test_printer& operator<<(T &&t) {
            std::cerr << std::forward<T>(t);
            return *this;
        }

        test_printer& operator<<(const std::string_view sv) {
            std::cerr << sv;
            return *this;
        }
    };

    template<typename T, typename Y>
    void test_same(const T &x, const Y &y, const std::source_location &loc=std::source_location::current())
    {
        expect(x == static_cast<T>(y), loc) << fmt::format("{} != {}", x, y);
    }

    // Creates the parent directories as needed.
    inline std::string test_touch(const std::string &path, const std::string_view &data="")
    {
        std::filesystem::create_directories(std::filesystem::path { path }.parent_path());
        file::write(path, data);
        return path;
    }

    inline std::string test_mkdir(const std::string &path)
    {
        std::filesystem::create_directories(path);
        return path;
    }

    inline file::path_list test_sorted(file::path_list paths)
    {
        std::sort(paths.begin(), paths.end());
        return paths;
    }
}

template <class... Ts>
inline auto boost::ut::cfg<boost::ut::override, Ts...> = boost::ut::runner<boost::ut::reporter<tree_finder::test_printer>> {};

#endif // !TREE_FINDER_TEST_HPP
