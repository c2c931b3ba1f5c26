#pragma once
#include <memory>

#include <spdlog/spdlog.h>

namespace qv::logging {

// Library logger ("qv", stderr). Created on first use; level taken from
// QV_LOG_LEVEL (trace|debug|info|warn|error|critical|off), default warn.
std::shared_ptr<spdlog::logger> logger();

void set_level(spdlog::level::level_enum level);
spdlog::level::level_enum level();

// Parse a level name; unknown or empty names return `fallback`.
spdlog::level::level_enum parse_level(const char* name, spdlog::level::level_enum fallback);

} // namespace qv::logging

#define QV_LOG_AT(lvl, ...) \
  ::qv::logging::logger()->log(::spdlog::source_loc{__FILE__, __LINE__, SPDLOG_FUNCTION}, lvl, __VA_ARGS__)

#define QV_LOG_TRACE(...) QV_LOG_AT(::spdlog::level::trace, __VA_ARGS__)
#define QV_LOG_DEBUG(...) QV_LOG_AT(::spdlog::level::debug, __VA_ARGS__)
#define QV_LOG_INFO(...)  QV_LOG_AT(::spdlog::level::info, __VA_ARGS__)
#define QV_LOG_WARN(...)  QV_LOG_AT(::spdlog::level::warn, __VA_ARGS__)
#define QV_LOG_ERROR(...) QV_LOG_AT(::spdlog::level::err, __VA_ARGS__)
