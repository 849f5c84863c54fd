/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <atomic>
#include <chrono>
#include <fstream>
#include <sstream>
#include <tf/file.hpp>
#include <tf/logger.hpp>

namespace tree_finder::file {
    std::string absolute(const std::string_view &path)
    {
        auto abs_path = std::filesystem::absolute(path.empty() ? std::filesystem::path { "." } : std::filesystem::path { path }).lexically_normal();
        // lexically_normal keeps a trailing separator as an empty filename
        if (!abs_path.has_filename() && abs_path != abs_path.root_path())
            abs_path = abs_path.parent_path();
        return abs_path.string();
    }

    listing list(const std::string_view &path)
    {
        const auto dir_path = absolute(path);
        listing res {};
        std::error_code ec {};
        std::filesystem::directory_iterator it { dir_path, ec };
        if (ec)
            throw list_error(dir_path, ec);
        for (const std::filesystem::directory_iterator end {}; it != end; ) {
            std::error_code status_ec {};
            const auto status = std::filesystem::status(it->path(), status_ec);
            if (!status_ec) {
                if (std::filesystem::is_regular_file(status))
                    res.files.emplace_back(it->path().string());
                else if (std::filesystem::is_directory(status))
                    res.directories.emplace_back(it->path().string());
            }
            it.increment(ec);
            if (ec)
                throw list_error(dir_path, ec);
        }
        return res;
    }

    std::string read(const std::string &path)
    {
        std::ifstream is { path, std::ios::binary };
        if (!is)
            throw error_sys(fmt::format("failed to open for reading: {}", path));
        std::ostringstream ss {};
        ss << is.rdbuf();
        if (is.bad())
            throw error_sys(fmt::format("failed to read: {}", path));
        return ss.str();
    }

    void write(const std::string &path, const std::string_view &data)
    {
        std::ofstream os { path, std::ios::binary | std::ios::trunc };
        if (!os)
            throw error_sys(fmt::format("failed to open for writing: {}", path));
        os.write(data.data(), static_cast<std::streamsize>(data.size()));
        os.close();
        if (!os)
            throw error_sys(fmt::format("failed to write: {}", path));
    }

    static std::string tmp_path(const std::string_view &name)
    {
        static std::atomic_size_t counter { 0 };
        const auto ts = std::chrono::system_clock::now().time_since_epoch().count();
        const auto base = std::filesystem::temp_directory_path() / fmt::format("tf-{}-{}-{}", name, ts, counter++);
        return absolute(base.string());
    }

    tmp_directory::tmp_directory(const std::string_view &name): _path { tmp_path(name) }
    {
        std::filesystem::remove_all(_path);
        std::filesystem::create_directories(_path);
    }

    tmp_directory::~tmp_directory()
    {
        std::error_code ec {};
        std::filesystem::remove_all(_path, ec);
        if (ec)
            logger::warn("failed to remove the temporary directory {}: {}", _path, ec.message());
    }
}
