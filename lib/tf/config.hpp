/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TREE_FINDER_CONFIG_HPP
#define TREE_FINDER_CONFIG_HPP

#include <optional>
#include <string>
#include <tf/json.hpp>
#include <tf/walker.hpp>

namespace tree_finder {
    struct config {
        virtual ~config() =default;

        [[nodiscard]] const json::value &at(const std::string_view &name) const
        {
            return _at_impl(name);
        }

        [[nodiscard]] bool contains(const std::string_view &name) const
        {
            return json().contains(name);
        }

        [[nodiscard]] const json::object &json() const
        {
            return _json_impl();
        }
    private:
        virtual const json::value &_at_impl(const std::string_view &name) const =0;
        virtual const json::object &_json_impl() const =0;
    };

    struct config_json: config {
        explicit config_json(json::object &&json)
            : _json { std::move(json) }
        {
        }
    private:
        const json::object _json;

        const json::value &_at_impl(const std::string_view &name) const override;

        const json::object &_json_impl() const override
        {
            return _json;
        }
    };

    struct config_file: config {
        explicit config_file(const std::string &path);
    private:
        std::string _path;
        json::object _parsed;

        const json::value &_at_impl(const std::string_view &name) const override;

        const json::object &_json_impl() const override
        {
            return _parsed;
        }
    };

    /*
     * Settings of one traversal. The JSON layout:
     * {
     *   "root": "../src",
     *   "files": { "extensions": [ ".c" ], "suffixes": [], "names": [] },
     *   "directories": { "excludeSuffixes": [ "examples" ], "excludeNames": [] },
     *   "onError": "skip"
     * }
     * A file is kept when it matches any of the "files" criteria; with no criteria all files are kept.
     * A directory's files are not recorded when it matches any of the "directories" criteria.
     */
    struct walk_config {
        std::optional<std::string> root {};
        optional_filter file_filter {};
        optional_filter dir_filter {};
        walk_options opts {};

        static walk_config from(const config &cfg);
        static error_policy parse_policy(const std::string_view &name);
    };
}

#endif // !TREE_FINDER_CONFIG_HPP
