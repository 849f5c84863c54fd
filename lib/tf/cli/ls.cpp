/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#include <tf/cli/common.hpp>

namespace tree_finder::cli::ls {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "ls";
            cmd.desc = "print the files and subdirectories of <dir> as JSON";
            cmd.args.expect({ "<dir>" });
            cmd.opts.try_emplace("output", output_option());
        }

        void run(const arguments &args, const options &opts) const override
        {
            write_json(to_json(file::list(args.at(0))), opts);
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
