/*
 * Copyright 2024-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <seastar/util/log.hh>
#include <fmt/format.h>

namespace logging {

//
// Keep the library's code independent of the exact seastar type names.
//

using log_level = seastar::log_level;
using logger = seastar::logger;
using registry = seastar::logger_registry;

inline registry& logger_registry() noexcept {
    return seastar::global_logger_registry();
}

using seastar::level_name;

}

template <typename ExceptionType, typename... Args>
[[noreturn]] void log_and_throw(seastar::logger& logger, seastar::log_level log_level, fmt::format_string<Args...> fmt, Args&&... args) {
    auto msg = fmt::format(fmt, std::forward<Args>(args)...);
    logger.log(log_level, "{}", msg);
    throw ExceptionType(msg);
}

template <typename ExceptionType, typename... Args>
[[noreturn]] void log_warning_and_throw(seastar::logger& logger, fmt::format_string<Args...> fmt, Args&&... args) {
    log_and_throw<ExceptionType>(logger, seastar::log_level::warn, fmt, std::forward<Args>(args)...);
}

template <typename ExceptionType, typename... Args>
[[noreturn]] void log_error_and_throw(seastar::logger& logger, fmt::format_string<Args...> fmt, Args&&... args) {
    log_and_throw<ExceptionType>(logger, seastar::log_level::error, fmt, std::forward<Args>(args)...);
}
