/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TREE_FINDER_UTIL_HPP
#define TREE_FINDER_UTIL_HPP

#include <string>
#include <string_view>
#include <tf/container.hpp>

namespace tree_finder {
    // Splits by sep and drops empty items, so "a,,b," gives { "a", "b" }
    inline vector<std::string> split(const std::string_view &s, const char sep)
    {
        vector<std::string> res {};
        size_t start = 0;
        while (start <= s.size()) {
            auto end = s.find(sep, start);
            if (end == s.npos)
                end = s.size();
            if (end > start)
                res.emplace_back(s.substr(start, end - start));
            start = end + 1;
        }
        return res;
    }
}

#endif // !TREE_FINDER_UTIL_HPP
