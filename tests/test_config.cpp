/**
 * @file test_config.cpp
 * @brief Tests for config.hpp - flattened store, format backends, env overlay.
 */

#include "ppx/config.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstdlib>
#include <cstring>
#include <string>

// ============================================================================
// ConfigStore
// ============================================================================

TEST_CASE("ConfigStore Set and typed getters", "[config]") {
  ppx::ConfigStore store;
  REQUIRE(store.Set("proxy", "queue_capacity", "12"));
  REQUIRE(store.Set("proxy", "verbose", "yes"));
  REQUIRE(store.Set("proxy", "offset", "-4"));

  REQUIRE(store.GetUint("proxy", "queue_capacity", 0) == 12U);
  REQUIRE(store.GetInt("proxy", "offset", 0) == -4);
  REQUIRE(store.GetBool("proxy", "verbose", false));
  REQUIRE(store.GetUint("proxy", "missing", 99) == 99U);
  REQUIRE(std::strcmp(store.GetString("proxy", "missing", "dflt"), "dflt") == 0);
  REQUIRE(store.EntryCount() == 3U);
}

TEST_CASE("ConfigStore lookups are case-insensitive", "[config]") {
  ppx::ConfigStore store;
  REQUIRE(store.Set("Health", "Interval_MS", "250"));
  REQUIRE(store.HasSection("health"));
  REQUIRE(store.HasKey("HEALTH", "interval_ms"));
  REQUIRE(store.GetUint("health", "interval_ms", 0) == 250U);
}

TEST_CASE("ConfigStore Set overwrites", "[config]") {
  ppx::ConfigStore store;
  REQUIRE(store.Set("log", "level", "info"));
  REQUIRE(store.Set("log", "level", "debug"));
  REQUIRE(store.EntryCount() == 1U);
  REQUIRE(std::strcmp(store.GetString("log", "level"), "debug") == 0);
}

TEST_CASE("ConfigStore FindUint rejects malformed values", "[config]") {
  ppx::ConfigStore store;
  REQUIRE(store.Set("proxy", "a", "-1"));
  REQUIRE(store.Set("proxy", "b", "12abc"));
  REQUIRE(store.Set("proxy", "c", ""));
  REQUIRE(store.Set("proxy", "d", "4294967295"));
  REQUIRE(!store.FindUint("proxy", "a").has_value());
  REQUIRE(!store.FindUint("proxy", "b").has_value());
  REQUIRE(!store.FindUint("proxy", "c").has_value());
  REQUIRE(store.FindUint("proxy", "d").value() == 4294967295U);
  REQUIRE(!store.FindUint("proxy", "absent").has_value());
}

TEST_CASE("ConfigStore GetList splits on commas and whitespace", "[config]") {
  ppx::ConfigStore store;
  REQUIRE(store.Set("workers", "addresses", " 10.0.0.1:9000, 10.0.0.2:9000 ,,host:1 "));
  auto list = store.GetList("workers", "addresses");
  REQUIRE(list.size() == 3U);
  REQUIRE(list[0] == "10.0.0.1:9000");
  REQUIRE(list[1] == "10.0.0.2:9000");
  REQUIRE(list[2] == "host:1");
  REQUIRE(store.GetList("workers", "none").empty());
}

TEST_CASE("ConfigStore ApplyEnvironment overrides set variables", "[config]") {
  ppx::ConfigStore store;
  REQUIRE(store.Set("proxy", "max_retries", "1"));
  const ppx::EnvBinding bindings[] = {
      {"PPX_TEST_CFG_RETRIES", "proxy", "max_retries"},
      {"PPX_TEST_CFG_UNSET", "proxy", "queue_capacity"},
      {"PPX_TEST_CFG_EMPTY", "proxy", "job_deadline_ms"},
  };
  ::setenv("PPX_TEST_CFG_RETRIES", "4", 1);
  ::unsetenv("PPX_TEST_CFG_UNSET");
  ::setenv("PPX_TEST_CFG_EMPTY", "", 1);

  REQUIRE(store.ApplyEnvironment(bindings, 3) == 1U);
  REQUIRE(store.GetUint("proxy", "max_retries", 0) == 4U);
  REQUIRE(!store.HasKey("proxy", "queue_capacity"));
  REQUIRE(!store.HasKey("proxy", "job_deadline_ms"));

  ::unsetenv("PPX_TEST_CFG_RETRIES");
  ::unsetenv("PPX_TEST_CFG_EMPTY");
}

TEST_CASE("FormatFromPath maps extensions", "[config]") {
  REQUIRE(ppx::FormatFromPath("proof-proxy.ini") == ppx::ConfigFormat::kIni);
  REQUIRE(ppx::FormatFromPath("proof-proxy.JSON") == ppx::ConfigFormat::kJson);
  REQUIRE(ppx::FormatFromPath("a/b.yml") == ppx::ConfigFormat::kYaml);
  REQUIRE(ppx::FormatFromPath("a/b.yaml") == ppx::ConfigFormat::kYaml);
  REQUIRE(ppx::FormatFromPath("noext") == ppx::ConfigFormat::kIni);
}

// ============================================================================
// INI Backend
// ============================================================================

#ifdef PPX_CONFIG_INI_ENABLED

TEST_CASE("INI LoadBuffer sections and keys", "[config][ini]") {
  const char* ini =
      "; comment\n"
      "[proxy]\n"
      "queue_capacity = 32\n"
      "load_balancing = least_loaded\n"
      "[workers]\n"
      "addresses = 127.0.0.1:9001,127.0.0.1:9002\n";
  ppx::IniConfig cfg;
  auto r = cfg.LoadBuffer(ini, static_cast<uint32_t>(std::strlen(ini)),
                          ppx::ConfigFormat::kIni);
  REQUIRE(r.has_value());
  REQUIRE(cfg.GetUint("proxy", "queue_capacity", 0) == 32U);
  REQUIRE(std::strcmp(cfg.GetString("proxy", "load_balancing"), "least_loaded") == 0);
  REQUIRE(cfg.GetList("workers", "addresses").size() == 2U);
}

TEST_CASE("INI LoadFile missing file", "[config][ini]") {
  ppx::IniConfig cfg;
  auto r = cfg.LoadFile("/nonexistent/dir/proof-proxy.ini");
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == ppx::ConfigError::kFileNotFound);
}

TEST_CASE("INI only config rejects other formats", "[config][ini]") {
  REQUIRE(ppx::IniConfig::Supports(ppx::ConfigFormat::kIni));
  REQUIRE(!ppx::IniConfig::Supports(ppx::ConfigFormat::kJson));
  ppx::IniConfig cfg;
  const char* json = "{}";
  auto r = cfg.LoadBuffer(json, 2U, ppx::ConfigFormat::kJson);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == ppx::ConfigError::kFormatNotSupported);
}

#endif  // PPX_CONFIG_INI_ENABLED

// ============================================================================
// JSON Backend
// ============================================================================

#ifdef PPX_CONFIG_JSON_ENABLED

TEST_CASE("JSON LoadBuffer nested sections", "[config][json]") {
  const char* json =
      "{\n"
      "  \"proxy\": {\"max_retries\": 3, \"load_balancing\": \"round_robin\"},\n"
      "  \"workers\": {\"addresses\": [\"10.0.0.1:1\", \"10.0.0.2:2\"]},\n"
      "  \"health\": {\"enabled\": true}\n"
      "}\n";
  ppx::JsonConfig cfg;
  auto r = cfg.LoadBuffer(json, static_cast<uint32_t>(std::strlen(json)),
                          ppx::ConfigFormat::kJson);
  REQUIRE(r.has_value());
  REQUIRE(cfg.GetUint("proxy", "max_retries", 0) == 3U);
  REQUIRE(std::strcmp(cfg.GetString("proxy", "load_balancing"), "round_robin") == 0);
  REQUIRE(std::strcmp(cfg.GetString("workers", "addresses"),
                      "10.0.0.1:1,10.0.0.2:2") == 0);
  REQUIRE(cfg.GetBool("health", "enabled", false));
}

TEST_CASE("JSON LoadBuffer rejects malformed input", "[config][json]") {
  const char* json = "{\"proxy\": ";
  ppx::JsonConfig cfg;
  auto r = cfg.LoadBuffer(json, static_cast<uint32_t>(std::strlen(json)),
                          ppx::ConfigFormat::kJson);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == ppx::ConfigError::kParseError);
}

#endif  // PPX_CONFIG_JSON_ENABLED

// ============================================================================
// YAML Backend
// ============================================================================

#ifdef PPX_CONFIG_YAML_ENABLED

TEST_CASE("YAML LoadBuffer mapping sections", "[config][yaml]") {
  const char* yaml =
      "proxy:\n"
      "  queue_capacity: 7\n"
      "workers:\n"
      "  addresses:\n"
      "    - 10.0.0.1:1\n"
      "    - 10.0.0.2:2\n";
  ppx::YamlConfig cfg;
  auto r = cfg.LoadBuffer(yaml, static_cast<uint32_t>(std::strlen(yaml)),
                          ppx::ConfigFormat::kYaml);
  REQUIRE(r.has_value());
  REQUIRE(cfg.GetUint("proxy", "queue_capacity", 0) == 7U);
  REQUIRE(cfg.GetList("workers", "addresses").size() == 2U);
}

#endif  // PPX_CONFIG_YAML_ENABLED
