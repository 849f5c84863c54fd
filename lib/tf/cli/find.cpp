/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#include <tf/cli/common.hpp>
#include <tf/config.hpp>
#include <tf/util.hpp>

namespace tree_finder::cli::find {
    static std::optional<std::string> non_empty(const std::optional<std::string> &val)
    {
        if (!val || val->empty())
            return "a value is required";
        return {};
    }

    static json::array string_array(const std::string &csv)
    {
        json::array res {};
        for (const auto &item: split(csv, ','))
            res.emplace_back(item);
        return res;
    }

    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "find";
            cmd.desc = "print the files of every directory under <dir> (the current one by default) as JSON";
            cmd.args.expect({ "[<dir>]" });
            cmd.opts.try_emplace("config", option_config { "a JSON file with the walk configuration", {}, non_empty });
            cmd.opts.try_emplace("ext", option_config { "a comma-separated list of file extensions to keep, such as .c,.h", {}, non_empty });
            cmd.opts.try_emplace("exclude-dir", option_config { "a comma-separated list of path suffixes of directories whose files are not recorded", {}, non_empty });
            cmd.opts.try_emplace("on-error", option_config { "skip or abort when a directory cannot be listed", {},
                [](const std::optional<std::string> &val) -> std::optional<std::string> {
                    if (!val || (*val != "skip" && *val != "abort"))
                        return "must be skip or abort";
                    return {};
                } });
            cmd.opts.try_emplace("output", output_option());
        }

        void run(const arguments &args, const options &opts) const override
        {
            json::object j {};
            if (const auto path = opts.find("config"); path != opts.end())
                j = config_file { *path->second }.json();
            if (!args.empty())
                j.insert_or_assign("root", args.at(0));
            if (const auto ext = opts.find("ext"); ext != opts.end())
                j.insert_or_assign("files", json::object { { "extensions", string_array(*ext->second) } });
            if (const auto excl = opts.find("exclude-dir"); excl != opts.end())
                j.insert_or_assign("directories", json::object { { "excludeSuffixes", string_array(*excl->second) } });
            if (const auto policy = opts.find("on-error"); policy != opts.end())
                j.insert_or_assign("onError", *policy->second);

            const auto wc = walk_config::from(config_json { std::move(j) });
            walker w { wc.root.value_or("."), wc.file_filter, wc.dir_filter, wc.opts };
            while (!w.done())
                w.step();
            if (!w.failed().empty())
                logger::warn("{} directories could not be listed: {}", w.failed().size(), w.failed());
            logger::debug("visited {} directories, recorded {}", w.visited(), w.result().size());
            write_json(to_json(w.result()), opts);
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
