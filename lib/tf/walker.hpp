/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TREE_FINDER_WALKER_HPP
#define TREE_FINDER_WALKER_HPP

#include <string>
#include <string_view>
#include <tf/container.hpp>
#include <tf/file.hpp>
#include <tf/filter.hpp>

namespace tree_finder {
    // absolute directory path -> absolute paths of its retained files
    using dir_map = map<std::string, file::path_list>;

    enum class error_policy {
        skip, abort
    };

    struct walk_options {
        error_policy on_error = error_policy::skip;
    };

    /*
     * Depth-first traversal driven by an explicit stack of pending directories.
     * Each step pops one directory, lists it, records its files when dir_filter accepts it,
     * and pushes all of its subdirectories whether it was accepted or not.
     * The stack and the partial result can be inspected between steps.
     */
    struct walker {
        using stack_type = vector<std::string>;

        explicit walker(const std::string_view &root, optional_filter file_filter={}, optional_filter dir_filter={}, const walk_options &opts={});

        // Processes exactly one directory; returns false when the stack was already empty.
        bool step();

        bool done() const
        {
            return _stack.empty();
        }

        const std::string &root() const
        {
            return _root;
        }

        const stack_type &stack() const
        {
            return _stack;
        }

        const dir_map &result() const
        {
            return _result;
        }

        dir_map take()
        {
            return std::move(_result);
        }

        // directories that could not be listed under error_policy::skip
        const file::path_list &failed() const
        {
            return _failed;
        }

        size_t visited() const
        {
            return _visited;
        }
    private:
        const std::string _root;
        const optional_filter _file_filter;
        const optional_filter _dir_filter;
        const walk_options _opts;
        stack_type _stack {};
        dir_map _result {};
        file::path_list _failed {};
        size_t _visited = 0;
    };

    extern dir_map walk(const std::string_view &root, const optional_filter &file_filter={}, const optional_filter &dir_filter={}, const walk_options &opts={});
}

#endif // !TREE_FINDER_WALKER_HPP
