/**
 * @file proxy_config.hpp
 * @brief Typed proxy configuration: defaults, file + environment loading,
 *        validation and the default file written by `init`.
 */

#ifndef PPX_PROXY_CONFIG_HPP_
#define PPX_PROXY_CONFIG_HPP_

#include "ppx/config.hpp"
#include "ppx/dispatcher.hpp"
#include "ppx/health_monitor.hpp"
#include "ppx/log.hpp"
#include "ppx/proxy_server.hpp"
#include "ppx/vocabulary.hpp"
#include "ppx/worker_registry.hpp"

#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

namespace ppx {

struct ProxyConfig {
  uint32_t queue_capacity = 10;
  uint32_t max_retries = 1;
  uint32_t job_deadline_ms = 100000;
  LoadBalancePolicy policy = LoadBalancePolicy::kRoundRobin;
  uint32_t max_req_per_sec = 5;
  uint32_t max_connections = 64;
  uint32_t send_timeout_ms = 5000;

  uint32_t health_interval_ms = 1000;
  uint32_t failure_threshold = 3;
  uint32_t probe_timeout_ms = 500;
  uint32_t remove_after_failures = 0;

  std::vector<std::string> workers;
  uint32_t connect_timeout_ms = 10000;

  log::Level log_level = log::Level::kInfo;

  DispatcherConfig ToDispatcherConfig() const noexcept {
    DispatcherConfig c;
    c.queue_capacity = queue_capacity;
    c.max_retries = max_retries;
    c.failure_threshold = failure_threshold;
    c.job_deadline_ms = job_deadline_ms;
    c.remove_after_failures = remove_after_failures;
    c.policy = policy;
    return c;
  }

  HealthMonitorConfig ToHealthMonitorConfig() const noexcept {
    HealthMonitorConfig c;
    c.interval_ms = health_interval_ms;
    c.probe_timeout_ms = probe_timeout_ms;
    return c;
  }

  ProxyServerConfig ToServerConfig() const noexcept {
    ProxyServerConfig c;
    c.max_connections = max_connections;
    c.max_req_per_sec = max_req_per_sec;
    c.send_timeout_ms = send_timeout_ms;
    return c;
  }
};

/// Environment variables that override file values.
inline const EnvBinding* ProxyEnvBindings(uint32_t& count) noexcept {
  static constexpr EnvBinding kBindings[] = {
      {"PPX_QUEUE_CAPACITY", "proxy", "queue_capacity"},
      {"PPX_MAX_RETRIES", "proxy", "max_retries"},
      {"PPX_JOB_DEADLINE_MS", "proxy", "job_deadline_ms"},
      {"PPX_LOAD_BALANCING", "proxy", "load_balancing"},
      {"PPX_MAX_REQ_PER_SEC", "proxy", "max_req_per_sec"},
      {"PPX_MAX_CONNECTIONS", "proxy", "max_connections"},
      {"PPX_SEND_TIMEOUT_MS", "proxy", "send_timeout_ms"},
      {"PPX_HEALTH_INTERVAL_MS", "health", "interval_ms"},
      {"PPX_FAILURE_THRESHOLD", "health", "failure_threshold"},
      {"PPX_PROBE_TIMEOUT_MS", "health", "probe_timeout_ms"},
      {"PPX_REMOVE_AFTER_FAILURES", "health", "remove_after_failures"},
      {"PPX_WORKERS", "workers", "addresses"},
      {"PPX_CONNECT_TIMEOUT_MS", "workers", "connect_timeout_ms"},
      {"PPX_LOG_LEVEL", "log", "level"},
  };
  count = static_cast<uint32_t>(sizeof(kBindings) / sizeof(kBindings[0]));
  return kBindings;
}

namespace detail {

/// Present-but-malformed numbers are errors; absent ones keep the default.
inline bool ReadUint(const ConfigStore& store, const char* section,
                     const char* key, uint32_t& out) {
  if (!store.HasKey(section, key)) return true;
  optional<uint32_t> v = store.FindUint(section, key);
  if (!v.has_value()) {
    PPX_LOG_ERROR("CONFIG", "%s.%s: '%s' is not a non-negative integer",
                  section, key, store.GetString(section, key));
    return false;
  }
  out = v.value();
  return true;
}

}  // namespace detail

/**
 * @brief Build a ProxyConfig from a flattened store.
 *
 * Missing keys keep their defaults. Fails with kInvalidValue on a malformed
 * number, an unknown policy or log level, or a value out of range.
 */
inline expected<ProxyConfig, ConfigError> ProxyConfigFromStore(
    const ConfigStore& store) {
  using Result = expected<ProxyConfig, ConfigError>;
  ProxyConfig c;
  bool ok = detail::ReadUint(store, "proxy", "queue_capacity", c.queue_capacity) &&
            detail::ReadUint(store, "proxy", "max_retries", c.max_retries) &&
            detail::ReadUint(store, "proxy", "job_deadline_ms", c.job_deadline_ms) &&
            detail::ReadUint(store, "proxy", "max_req_per_sec", c.max_req_per_sec) &&
            detail::ReadUint(store, "proxy", "max_connections", c.max_connections) &&
            detail::ReadUint(store, "proxy", "send_timeout_ms", c.send_timeout_ms) &&
            detail::ReadUint(store, "health", "interval_ms", c.health_interval_ms) &&
            detail::ReadUint(store, "health", "failure_threshold", c.failure_threshold) &&
            detail::ReadUint(store, "health", "probe_timeout_ms", c.probe_timeout_ms) &&
            detail::ReadUint(store, "health", "remove_after_failures",
                             c.remove_after_failures) &&
            detail::ReadUint(store, "workers", "connect_timeout_ms",
                             c.connect_timeout_ms);
  if (!ok) return Result::error(ConfigError::kInvalidValue);

  if (store.HasKey("proxy", "load_balancing")) {
    const char* name = store.GetString("proxy", "load_balancing");
    optional<LoadBalancePolicy> p = ParseLoadBalancePolicy(name);
    if (!p.has_value()) {
      PPX_LOG_ERROR("CONFIG", "unknown load balancing policy '%s'", name);
      return Result::error(ConfigError::kInvalidValue);
    }
    c.policy = p.value();
  }
  if (store.HasKey("log", "level")) {
    const char* name = store.GetString("log", "level");
    optional<log::Level> lv = log::ParseLevel(name);
    if (!lv.has_value()) {
      PPX_LOG_ERROR("CONFIG", "unknown log level '%s'", name);
      return Result::error(ConfigError::kInvalidValue);
    }
    c.log_level = lv.value();
  }
  c.workers = store.GetList("workers", "addresses");
  return Result::success(std::move(c));
}

inline expected<void, ConfigError> ValidateProxyConfig(const ProxyConfig& c) {
  const char* bad = nullptr;
  if (c.queue_capacity < 1U) bad = "proxy.queue_capacity";
  else if (c.job_deadline_ms < 1U) bad = "proxy.job_deadline_ms";
  else if (c.send_timeout_ms < 1U) bad = "proxy.send_timeout_ms";
  else if (c.health_interval_ms < 1U) bad = "health.interval_ms";
  else if (c.failure_threshold < 1U) bad = "health.failure_threshold";
  if (bad != nullptr) {
    PPX_LOG_ERROR("CONFIG", "%s must be at least 1", bad);
    return expected<void, ConfigError>::error(ConfigError::kInvalidValue);
  }
  for (const std::string& w : c.workers) {
    if (!SocketAddress::Parse(w.c_str()).has_value()) {
      PPX_LOG_ERROR("CONFIG", "invalid worker address '%s'", w.c_str());
      return expected<void, ConfigError>::error(ConfigError::kInvalidValue);
    }
  }
  return expected<void, ConfigError>::success();
}

/**
 * @brief Load file values (if any), apply environment overrides, validate.
 * @param path            Config file path, may be nullptr for defaults only.
 * @param require_file    When false a missing file falls back to defaults.
 */
inline expected<ProxyConfig, ConfigError> LoadProxyConfig(const char* path,
                                                          bool require_file) {
  using Result = expected<ProxyConfig, ConfigError>;
#ifdef PPX_CONFIG_HAS_BACKEND
  MultiConfig store;
  if (path != nullptr) {
    auto r = store.LoadFile(path);
    if (!r.has_value()) {
      if (r.get_error() == ConfigError::kFileNotFound && !require_file) {
        PPX_LOG_INFO("CONFIG", "%s not found, using defaults", path);
      } else {
        PPX_LOG_ERROR("CONFIG", "failed to load %s (error %u)", path,
                      static_cast<unsigned>(r.get_error()));
        return Result::error(r.get_error());
      }
    }
  }
#else
  ConfigStore store;
  if (path != nullptr && require_file) {
    PPX_LOG_ERROR("CONFIG", "no config backend compiled in, cannot read %s", path);
    return Result::error(ConfigError::kFormatNotSupported);
  }
#endif
  uint32_t count = 0;
  const EnvBinding* bindings = ProxyEnvBindings(count);
  const uint32_t applied = store.ApplyEnvironment(bindings, count);
  if (applied > 0U) {
    PPX_LOG_DEBUG("CONFIG", "%u value(s) overridden from environment", applied);
  }

  auto c = ProxyConfigFromStore(store);
  if (!c.has_value()) return c;
  auto v = ValidateProxyConfig(c.value());
  if (!v.has_value()) return Result::error(v.get_error());
  return c;
}

/// @brief Default configuration text in the format implied by @p format.
inline std::string RenderDefaultConfig(ConfigFormat format) {
  const ProxyConfig d;
  char buf[1024];
  int n = 0;
  if (format == ConfigFormat::kJson) {
    n = std::snprintf(
        buf, sizeof(buf),
        "{\n"
        "  \"proxy\": {\n"
        "    \"queue_capacity\": %u,\n"
        "    \"max_retries\": %u,\n"
        "    \"job_deadline_ms\": %u,\n"
        "    \"load_balancing\": \"%s\",\n"
        "    \"max_req_per_sec\": %u,\n"
        "    \"max_connections\": %u,\n"
        "    \"send_timeout_ms\": %u\n"
        "  },\n"
        "  \"health\": {\n"
        "    \"interval_ms\": %u,\n"
        "    \"failure_threshold\": %u,\n"
        "    \"probe_timeout_ms\": %u,\n"
        "    \"remove_after_failures\": %u\n"
        "  },\n"
        "  \"workers\": {\n"
        "    \"addresses\": [],\n"
        "    \"connect_timeout_ms\": %u\n"
        "  },\n"
        "  \"log\": {\n"
        "    \"level\": \"info\"\n"
        "  }\n"
        "}\n",
        d.queue_capacity, d.max_retries, d.job_deadline_ms,
        LoadBalancePolicyToString(d.policy), d.max_req_per_sec,
        d.max_connections, d.send_timeout_ms, d.health_interval_ms,
        d.failure_threshold, d.probe_timeout_ms, d.remove_after_failures,
        d.connect_timeout_ms);
  } else if (format == ConfigFormat::kYaml) {
    n = std::snprintf(
        buf, sizeof(buf),
        "proxy:\n"
        "  queue_capacity: %u\n"
        "  max_retries: %u\n"
        "  job_deadline_ms: %u\n"
        "  load_balancing: %s\n"
        "  max_req_per_sec: %u\n"
        "  max_connections: %u\n"
        "  send_timeout_ms: %u\n"
        "health:\n"
        "  interval_ms: %u\n"
        "  failure_threshold: %u\n"
        "  probe_timeout_ms: %u\n"
        "  remove_after_failures: %u\n"
        "workers:\n"
        "  addresses: \"\"\n"
        "  connect_timeout_ms: %u\n"
        "log:\n"
        "  level: info\n",
        d.queue_capacity, d.max_retries, d.job_deadline_ms,
        LoadBalancePolicyToString(d.policy), d.max_req_per_sec,
        d.max_connections, d.send_timeout_ms, d.health_interval_ms,
        d.failure_threshold, d.probe_timeout_ms, d.remove_after_failures,
        d.connect_timeout_ms);
  } else {
    n = std::snprintf(
        buf, sizeof(buf),
        "; proof-proxy configuration\n"
        "\n"
        "[proxy]\n"
        "queue_capacity = %u\n"
        "max_retries = %u\n"
        "job_deadline_ms = %u\n"
        "; round_robin | least_recently_used | least_loaded\n"
        "load_balancing = %s\n"
        "; per client address, 0 = unlimited\n"
        "max_req_per_sec = %u\n"
        "max_connections = %u\n"
        "; give up on a client that stops reading results\n"
        "send_timeout_ms = %u\n"
        "\n"
        "[health]\n"
        "interval_ms = %u\n"
        "failure_threshold = %u\n"
        "probe_timeout_ms = %u\n"
        "; drop a worker after this many failed probes, 0 = never\n"
        "remove_after_failures = %u\n"
        "\n"
        "[workers]\n"
        "; comma separated host:port list\n"
        "addresses =\n"
        "connect_timeout_ms = %u\n"
        "\n"
        "[log]\n"
        "level = info\n",
        d.queue_capacity, d.max_retries, d.job_deadline_ms,
        LoadBalancePolicyToString(d.policy), d.max_req_per_sec,
        d.max_connections, d.send_timeout_ms, d.health_interval_ms,
        d.failure_threshold, d.probe_timeout_ms, d.remove_after_failures,
        d.connect_timeout_ms);
  }
  if (n < 0) return std::string();
  return std::string(buf, static_cast<size_t>(n) < sizeof(buf)
                              ? static_cast<size_t>(n)
                              : sizeof(buf) - 1U);
}

}  // namespace ppx

#endif  // PPX_PROXY_CONFIG_HPP_
