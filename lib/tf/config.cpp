/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <tf/config.hpp>
#include <tf/logger.hpp>

namespace tree_finder {
    static json::object load_object(const std::string &path)
    {
        auto jv = json::load(path);
        if (!jv.is_object())
            throw error(fmt::format("configuration file {} must contain a JSON object!", path));
        return std::move(jv.as_object());
    }

    const json::value &config_json::_at_impl(const std::string_view &name) const
    {
        const auto it = _json.find(name);
        if (it == _json.end())
            throw error(fmt::format("config does not have the requested {} element!", name));
        return it->value();
    }

    config_file::config_file(const std::string &path)
        : _path { path }, _parsed { load_object(path) }
    {
        logger::debug("loaded configuration from {}", _path);
    }

    const json::value &config_file::_at_impl(const std::string_view &name) const
    {
        const auto it = _parsed.find(name);
        if (it == _parsed.end())
            throw error(fmt::format("configuration file {} does not have the element {}!", _path, name));
        return it->value();
    }

    static std::string string_value(const json::value &v, const std::string_view &name)
    {
        if (!v.is_string())
            throw error(fmt::format("config element {} must be a string!", name));
        const auto &str = v.get_string();
        return std::string { str.data(), str.size() };
    }

    static set<std::string> string_set(const json::object &section, const std::string_view &name)
    {
        set<std::string> res {};
        const auto *v = section.if_contains(name);
        if (!v)
            return res;
        if (!v->is_array())
            throw error(fmt::format("config element {} must be an array of strings!", name));
        for (const auto &item: v->get_array())
            res.emplace(string_value(item, name));
        return res;
    }

    static const json::object *section(const json::object &j, const std::string_view &name)
    {
        const auto *v = j.if_contains(name);
        if (!v)
            return nullptr;
        if (!v->is_object())
            throw error(fmt::format("config element {} must be an object!", name));
        return &v->get_object();
    }

    static optional_filter make_file_filter(const json::object &files)
    {
        vector<path_filter> criteria {};
        if (auto exts = string_set(files, "extensions"); !exts.empty())
            criteria.emplace_back(filter::extension(std::move(exts)));
        for (auto &sfx: string_set(files, "suffixes"))
            criteria.emplace_back(filter::ends_with(sfx));
        if (auto names = string_set(files, "names"); !names.empty())
            criteria.emplace_back(filter::name_in(std::move(names)));
        if (criteria.empty())
            return {};
        return filter::any_of(std::move(criteria));
    }

    static optional_filter make_dir_filter(const json::object &dirs)
    {
        vector<path_filter> excluded {};
        for (auto &sfx: string_set(dirs, "excludeSuffixes"))
            excluded.emplace_back(filter::ends_with(sfx));
        if (auto names = string_set(dirs, "excludeNames"); !names.empty())
            excluded.emplace_back(filter::name_in(std::move(names)));
        if (excluded.empty())
            return {};
        return filter::negate(filter::any_of(std::move(excluded)));
    }

    error_policy walk_config::parse_policy(const std::string_view &name)
    {
        if (name == "skip")
            return error_policy::skip;
        if (name == "abort")
            return error_policy::abort;
        throw error(fmt::format("unsupported error policy '{}', expected skip or abort", name));
    }

    walk_config walk_config::from(const config &cfg)
    {
        const auto &j = cfg.json();
        walk_config wc {};
        if (const auto *root = j.if_contains("root"))
            wc.root = string_value(*root, "root");
        if (const auto *files = section(j, "files"))
            wc.file_filter = make_file_filter(*files);
        if (const auto *dirs = section(j, "directories"))
            wc.dir_filter = make_dir_filter(*dirs);
        if (const auto *policy = j.if_contains("onError"))
            wc.opts.on_error = parse_policy(string_value(*policy, "onError"));
        return wc;
    }
}
