/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TREE_FINDER_ERROR_HPP
#define TREE_FINDER_ERROR_HPP

#include <cerrno>
#include <cstring>
#include <source_location>
#include <stdexcept>
#include <string>
#include <typeinfo>
#include <tf/format.hpp>

namespace tree_finder {
    struct error: std::runtime_error {
        explicit error(const std::string &msg, const std::source_location &loc=std::source_location::current())
            : error { true, fmt::format("{} at {}:{}", msg, loc.file_name(), loc.line()) }
        {
        }

        explicit error(const std::string &msg, const std::exception &ex, const std::source_location &loc=std::source_location::current())
            : error { true, fmt::format("{} at {}:{} caused by {}: {}", msg, loc.file_name(), loc.line(), typeid(ex).name(), ex.what()) }
        {
        }

        template<typename ...Args>
        explicit error(const std::source_location &loc, const char *fmt, Args&&... a)
            : error { true, fmt::format("{} at {}:{}", fmt::format(fmt::runtime(fmt), std::forward<Args>(a)...), loc.file_name(), loc.line()) }
        {
        }
    protected:
        // logs the message together with a stack trace when tracing is enabled
        explicit error(bool trace, const std::string &msg);
    };

    struct error_sys: error {
        explicit error_sys(const std::string &msg, const std::source_location &loc=std::source_location::current())
            : error { fmt::format("{}, errno: {}, strerror: {}", msg, errno, std::strerror(errno)), loc }
        {
        }
    };
}

#endif // !TREE_FINDER_ERROR_HPP
