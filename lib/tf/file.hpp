/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TREE_FINDER_FILE_HPP
#define TREE_FINDER_FILE_HPP

#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <tf/container.hpp>
#include <tf/error.hpp>

namespace tree_finder::file {
    using path_list = vector<std::string>;

    // Immediate children of one directory as absolute paths in enumeration order.
    struct listing {
        path_list files {};
        path_list directories {};
    };

    struct list_error: error {
        explicit list_error(const std::string &path, const std::error_code &ec, const std::source_location &loc=std::source_location::current())
            : error { fmt::format("cannot list directory {}: {}", path, ec.message()), loc }, _path { path }
        {
        }

        const std::string &path() const noexcept
        {
            return _path;
        }
    private:
        std::string _path;
    };

    // Absolute and lexically normalized, without a trailing separator. Symbolic links are not resolved.
    extern std::string absolute(const std::string_view &path);

    /*
     * Lists the entries of a directory except "." and "..".
     * Entries are classified by the status of their targets, so a symlink to a directory counts as a directory.
     * Entries that are neither regular files nor directories are omitted.
     * Throws list_error when the directory cannot be opened or read.
     */
    extern listing list(const std::string_view &path);

    extern std::string read(const std::string &path);
    extern void write(const std::string &path, const std::string_view &data);

    // A uniquely named directory under the system temporary directory, removed with all its contents on destruction.
    struct tmp_directory {
        explicit tmp_directory(const std::string_view &name);
        ~tmp_directory();
        tmp_directory(const tmp_directory &) =delete;
        tmp_directory &operator=(const tmp_directory &) =delete;

        const std::string &path() const
        {
            return _path;
        }

        operator const std::string &() const
        {
            return _path;
        }

        std::string path(const std::string_view &rel_path) const
        {
            return (std::filesystem::path { _path } / rel_path).string();
        }
    private:
        std::string _path;
    };
}

#endif // !TREE_FINDER_FILE_HPP
