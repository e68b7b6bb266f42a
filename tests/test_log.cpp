/**
 * @file test_log.cpp
 * @brief Tests for log.hpp
 */

#include "ppx/log.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstring>
#include <string>

TEST_CASE("Log level defaults", "[log]") {
#ifdef NDEBUG
  REQUIRE(ppx::log::GetLevel() == ppx::log::Level::kInfo);
#else
  REQUIRE(ppx::log::GetLevel() == ppx::log::Level::kDebug);
#endif
}

TEST_CASE("Log SetLevel", "[log]") {
  auto prev = ppx::log::GetLevel();
  ppx::log::SetLevel(ppx::log::Level::kError);
  REQUIRE(ppx::log::GetLevel() == ppx::log::Level::kError);
  ppx::log::SetLevel(prev);
}

TEST_CASE("Log Init and Shutdown", "[log]") {
  REQUIRE(!ppx::log::IsInitialized());
  ppx::log::Init();
  REQUIRE(ppx::log::IsInitialized());
  ppx::log::Shutdown();
  REQUIRE(!ppx::log::IsInitialized());
}

TEST_CASE("Log ParseLevel", "[log]") {
  REQUIRE(ppx::log::ParseLevel("debug").value() == ppx::log::Level::kDebug);
  REQUIRE(ppx::log::ParseLevel("info").value() == ppx::log::Level::kInfo);
  REQUIRE(ppx::log::ParseLevel("warn").value() == ppx::log::Level::kWarn);
  REQUIRE(ppx::log::ParseLevel("warning").value() == ppx::log::Level::kWarn);
  REQUIRE(ppx::log::ParseLevel("error").value() == ppx::log::Level::kError);
  REQUIRE(ppx::log::ParseLevel("off").value() == ppx::log::Level::kOff);
  REQUIRE(!ppx::log::ParseLevel("verbose").has_value());
  REQUIRE(!ppx::log::ParseLevel(nullptr).has_value());
}

TEST_CASE("Log macros compile and run", "[log]") {
  ppx::log::SetLevel(ppx::log::Level::kDebug);
  PPX_LOG_DEBUG("TEST", "debug %d", 1);
  PPX_LOG_INFO("TEST", "info %s", "msg");
  PPX_LOG_WARN("TEST", "warn");
  PPX_LOG_ERROR("TEST", "error %d %d", 1, 2);
  REQUIRE(true);
}

TEST_CASE("Log runtime level filtering", "[log]") {
  ppx::log::SetLevel(ppx::log::Level::kOff);
  PPX_LOG_DEBUG("TEST", "should not appear");
  PPX_LOG_ERROR("TEST", "should not appear");
  ppx::log::SetLevel(ppx::log::Level::kDebug);
  REQUIRE(true);
}

TEST_CASE("Log with very long message", "[log]") {
  ppx::log::SetLevel(ppx::log::Level::kDebug);
  std::string long_msg(2000, 'x');
  PPX_LOG_INFO("TEST", "%s", long_msg.c_str());
  REQUIRE(true);
}

TEST_CASE("Log detail helpers", "[log]") {
  REQUIRE(std::strcmp(ppx::log::detail::Basename("/a/b/dispatcher.hpp"),
                      "dispatcher.hpp") == 0);
  REQUIRE(std::strcmp(ppx::log::detail::Basename("plain.cpp"), "plain.cpp") == 0);
  char ts[32];
  ppx::log::detail::FormatTimestamp(ts, sizeof(ts));
  REQUIRE(std::strlen(ts) == 23U);
}
