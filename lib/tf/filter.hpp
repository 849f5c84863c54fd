/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TREE_FINDER_FILTER_HPP
#define TREE_FINDER_FILTER_HPP

#include <functional>
#include <optional>
#include <string>
#include <tf/container.hpp>

namespace tree_finder {
    // A predicate over an absolute path; true keeps the path.
    using path_filter = std::function<bool(const std::string &)>;
    using optional_filter = std::optional<path_filter>;
}

namespace tree_finder::filter {
    // The extension of the final component, including the dot, e.g. ".c", is one of exts.
    extern path_filter extension(set<std::string> exts);
    extern path_filter ends_with(std::string suffix);
    // The final path component is one of names.
    extern path_filter name_in(set<std::string> names);
    extern path_filter negate(path_filter f);
    // An empty list accepts everything.
    extern path_filter all_of(vector<path_filter> fs);
    // An empty list rejects everything.
    extern path_filter any_of(vector<path_filter> fs);
}

#endif // !TREE_FINDER_FILTER_HPP
