#include "test_framework.hpp"
#include "qv/core/log.hpp"

using spdlog::level::level_enum;

TEST("core/log/parse_level") {
  ASSERT_TRUE(qv::logging::parse_level("debug", spdlog::level::warn) == spdlog::level::debug);
  ASSERT_TRUE(qv::logging::parse_level("error", spdlog::level::warn) == spdlog::level::err);
  ASSERT_TRUE(qv::logging::parse_level("off", spdlog::level::info) == spdlog::level::off);
  ASSERT_TRUE(qv::logging::parse_level("loud", spdlog::level::info) == spdlog::level::info);
  ASSERT_TRUE(qv::logging::parse_level("", spdlog::level::trace) == spdlog::level::trace);
  ASSERT_TRUE(qv::logging::parse_level(nullptr, spdlog::level::warn) == spdlog::level::warn);
}

TEST("core/log/set_level_round_trip") {
  const level_enum saved = qv::logging::level();
  qv::logging::set_level(spdlog::level::trace);
  ASSERT_TRUE(qv::logging::level() == spdlog::level::trace);
  ASSERT_TRUE(qv::logging::logger()->should_log(spdlog::level::debug));
  QV_LOG_TRACE("log test at {} with {}", "trace", 42);
  qv::logging::set_level(spdlog::level::off);
  ASSERT_FALSE(qv::logging::logger()->should_log(spdlog::level::err));
  qv::logging::set_level(saved);
  ASSERT_TRUE(qv::logging::level() == saved);
}
