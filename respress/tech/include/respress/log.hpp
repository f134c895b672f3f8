#pragma once

// respress logs through spdlog. Without RESPRESS_ENABLE_SPDLOG, log calls compile to nothing
// (format strings are still checked at compile time).
#ifdef RESPRESS_ENABLE_SPDLOG
#ifndef SPDLOG_HEADER_ONLY
#define SPDLOG_HEADER_ONLY
#endif
#include <spdlog/common.h>  // IWYU pragma: export
#include <spdlog/spdlog.h>  // IWYU pragma: export
#else
#include <cstdint>
#include <format>
#endif

namespace respress {
#ifdef RESPRESS_ENABLE_SPDLOG
namespace log = spdlog;
#else
namespace log {

namespace level {
enum level_enum : std::int8_t { trace, debug, info, warn, err, critical, off };
}  // namespace level

inline void set_level(level::level_enum) noexcept {}

template <typename... Args>
void trace(std::format_string<Args...>, Args &&...) noexcept {}

template <typename... Args>
void debug(std::format_string<Args...>, Args &&...) noexcept {}

template <typename... Args>
void info(std::format_string<Args...>, Args &&...) noexcept {}

template <typename... Args>
void warn(std::format_string<Args...>, Args &&...) noexcept {}

template <typename... Args>
void error(std::format_string<Args...>, Args &&...) noexcept {}

}  // namespace log
#endif

}  // namespace respress
