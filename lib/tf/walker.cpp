/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <tf/logger.hpp>
#include <tf/walker.hpp>

namespace tree_finder {
    walker::walker(const std::string_view &root, optional_filter file_filter, optional_filter dir_filter, const walk_options &opts)
        : _root { file::absolute(root) }, _file_filter { std::move(file_filter) }, _dir_filter { std::move(dir_filter) }, _opts { opts }
    {
        _stack.emplace_back(_root);
    }

    bool walker::step()
    {
        if (_stack.empty())
            return false;
        const auto dir = std::move(_stack.back());
        _stack.pop_back();
        ++_visited;
        logger::trace("visiting {} with {} more pending", dir, _stack.size());
        file::listing entries {};
        try {
            entries = file::list(dir);
        } catch (const file::list_error &ex) {
            if (_opts.on_error == error_policy::abort)
                throw;
            logger::warn("skipping a directory that cannot be listed: {}", ex.what());
            _failed.emplace_back(ex.path());
            return true;
        }
        if (!_dir_filter || (*_dir_filter)(dir)) {
            if (_file_filter) {
                file::path_list kept {};
                for (auto &f: entries.files) {
                    if ((*_file_filter)(f))
                        kept.emplace_back(std::move(f));
                }
                _result.try_emplace(dir, std::move(kept));
            } else {
                _result.try_emplace(dir, std::move(entries.files));
            }
        }
        for (auto &d: entries.directories)
            _stack.emplace_back(std::move(d));
        return true;
    }

    dir_map walk(const std::string_view &root, const optional_filter &file_filter, const optional_filter &dir_filter, const walk_options &opts)
    {
        walker w { root, file_filter, dir_filter, opts };
        while (!w.done())
            w.step();
        logger::debug("walk of {} visited {} directories, recorded {}, could not list {}",
            w.root(), w.visited(), w.result().size(), w.failed().size());
        return w.take();
    }
}
