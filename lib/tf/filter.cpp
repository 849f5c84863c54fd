/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <algorithm>
#include <filesystem>
#include <tf/filter.hpp>

namespace tree_finder::filter {
    path_filter extension(set<std::string> exts)
    {
        return [exts=std::move(exts)](const std::string &path) {
            return exts.contains(std::filesystem::path { path }.extension().string());
        };
    }

    path_filter ends_with(std::string suffix)
    {
        return [suffix=std::move(suffix)](const std::string &path) {
            return path.ends_with(suffix);
        };
    }

    path_filter name_in(set<std::string> names)
    {
        return [names=std::move(names)](const std::string &path) {
            return names.contains(std::filesystem::path { path }.filename().string());
        };
    }

    path_filter negate(path_filter f)
    {
        return [f=std::move(f)](const std::string &path) {
            return !f(path);
        };
    }

    path_filter all_of(vector<path_filter> fs)
    {
        return [fs=std::move(fs)](const std::string &path) {
            return std::all_of(fs.begin(), fs.end(), [&](const auto &f) { return f(path); });
        };
    }

    path_filter any_of(vector<path_filter> fs)
    {
        return [fs=std::move(fs)](const std::string &path) {
            return std::any_of(fs.begin(), fs.end(), [&](const auto &f) { return f(path); });
        };
    }
}
