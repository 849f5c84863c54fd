/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <boost/stacktrace.hpp>
#include <tf/error.hpp>
#include <tf/logger.hpp>

namespace tree_finder {
    error::error(const bool trace, const std::string &msg): std::runtime_error { msg }
    {
        if (trace && logger::tracing_enabled()) {
            // skips the frames of this constructor and of the public one that delegated to it
            logger::trace("an exception created: {}\n{}", msg, boost::stacktrace::to_string(boost::stacktrace::stacktrace { 2, 32 }));
        } else if (trace) {
            logger::debug("an exception created: {}", msg);
        }
    }
}
