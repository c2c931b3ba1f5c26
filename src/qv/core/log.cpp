#include "qv/core/log.hpp"

#include <cstdlib>
#include <cstring>
#include <mutex>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace qv::logging {
namespace {

std::shared_ptr<spdlog::logger> make_logger() {
  auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto lg = std::make_shared<spdlog::logger>("qv", std::move(sink));
  lg->set_pattern("[%H:%M:%S.%e] [qv] [%^%l%$] %s:%# %v");
  lg->set_level(parse_level(std::getenv("QV_LOG_LEVEL"), spdlog::level::warn));
  return lg;
}

} // namespace

spdlog::level::level_enum parse_level(const char* name, spdlog::level::level_enum fallback) {
  if (!name || !*name) return fallback;
  // from_str maps unknown names to off, so only trust it for "off" itself
  const auto lvl = spdlog::level::from_str(name);
  if (lvl == spdlog::level::off && std::strcmp(name, "off") != 0) return fallback;
  return lvl;
}

std::shared_ptr<spdlog::logger> logger() {
  static std::shared_ptr<spdlog::logger> lg = make_logger();
  return lg;
}

void set_level(spdlog::level::level_enum level) { logger()->set_level(level); }

spdlog::level::level_enum level() { return logger()->level(); }

} // namespace qv::logging
