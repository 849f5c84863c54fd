/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TREE_FINDER_CLI_COMMON_HPP
#define TREE_FINDER_CLI_COMMON_HPP

#include <iostream>
#include <tf/cli.hpp>
#include <tf/json.hpp>
#include <tf/walker.hpp>

namespace tree_finder::cli {
    inline json::array to_json(const file::path_list &paths)
    {
        json::array res {};
        res.reserve(paths.size());
        for (const auto &p: paths)
            res.emplace_back(p);
        return res;
    }

    inline json::object to_json(const file::listing &l)
    {
        return json::object {
            { "files", to_json(l.files) },
            { "directories", to_json(l.directories) }
        };
    }

    inline json::object to_json(const dir_map &m)
    {
        json::object res {};
        for (const auto &[dir, files]: m)
            res.emplace(dir, to_json(files));
        return res;
    }

    inline option_config output_option()
    {
        return option_config { "write the JSON result to this file instead of the standard output" };
    }

    // Prints to stdout unless the output option holds a path.
    inline void write_json(const json::value &jv, const options &opts)
    {
        if (const auto it = opts.find("output"); it != opts.end() && it->second) {
            json::save_pretty(*it->second, jv);
            logger::info("saved the result to {}", *it->second);
        } else {
            json::save_pretty(std::cout, jv);
            std::cout << '\n';
        }
    }
}

#endif // !TREE_FINDER_CLI_COMMON_HPP
