/**
 * @file config.hpp
 * @brief Multi-format configuration reader with template-based backend dispatch.
 *
 * Backends are tag types selected at compile time (CMake opt-in):
 *   - IniBackend  : inih          (PPX_CONFIG_INI_ENABLED)
 *   - JsonBackend : nlohmann/json (PPX_CONFIG_JSON_ENABLED)
 *   - YamlBackend : fkYAML        (PPX_CONFIG_YAML_ENABLED)
 *
 * Every format is flattened to "section + key = value". Values loaded from
 * a file can then be overridden from the process environment through
 * ConfigStore::ApplyEnvironment().
 *
 * Usage:
 * @code
 *   ppx::MultiConfig cfg;
 *   if (cfg.LoadFile("proof-proxy.ini")) {
 *     uint32_t cap = cfg.GetUint("proxy", "queue_capacity", 10);
 *   }
 * @endcode
 */

#ifndef PPX_CONFIG_HPP_
#define PPX_CONFIG_HPP_

#include "ppx/platform.hpp"
#include "ppx/vocabulary.hpp"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <tuple>
#include <vector>

#ifdef PPX_CONFIG_INI_ENABLED
#include "ini.h"
#endif

#ifdef PPX_CONFIG_JSON_ENABLED
#include <nlohmann/json.hpp>
#endif

#ifdef PPX_CONFIG_YAML_ENABLED
#include <fkYAML/node.hpp>
#endif

namespace ppx {

// ============================================================================
// ConfigFormat
// ============================================================================

enum class ConfigFormat : uint8_t {
  kAuto = 0,
  kIni,
  kJson,
  kYaml,
};

namespace detail {

inline bool StrCaseEqual(const char* a, const char* b) noexcept {
  while (*a != '\0' && *b != '\0') {
    char la = (*a >= 'A' && *a <= 'Z') ? static_cast<char>(*a + 32) : *a;
    char lb = (*b >= 'A' && *b <= 'Z') ? static_cast<char>(*b + 32) : *b;
    if (la != lb) return false;
    ++a;
    ++b;
  }
  return *a == *b;
}

inline const char* FileExtension(const char* path) noexcept {
  const char* dot = std::strrchr(path, '.');
  const char* slash = std::strrchr(path, '/');
  if (dot == nullptr || (slash != nullptr && dot < slash)) return nullptr;
  return dot + 1;
}

}  // namespace detail

// ============================================================================
// Backend Tag Types
// ============================================================================

struct IniBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kIni;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::StrCaseEqual(ext, "ini") ||
           detail::StrCaseEqual(ext, "cfg") ||
           detail::StrCaseEqual(ext, "conf");
  }
};

struct JsonBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kJson;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::StrCaseEqual(ext, "json");
  }
};

struct YamlBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kYaml;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::StrCaseEqual(ext, "yaml") ||
           detail::StrCaseEqual(ext, "yml");
  }
};

/// @brief Map a path's extension to a format without consulting backends.
inline ConfigFormat FormatFromPath(const char* path) noexcept {
  const char* ext = detail::FileExtension(path);
  if (ext == nullptr) return ConfigFormat::kIni;
  if (JsonBackend::MatchesExtension(ext)) return ConfigFormat::kJson;
  if (YamlBackend::MatchesExtension(ext)) return ConfigFormat::kYaml;
  return ConfigFormat::kIni;
}

// ============================================================================
// EnvBinding - environment variable -> section/key
// ============================================================================

struct EnvBinding {
  const char* env_name;
  const char* section;
  const char* key;
};

// ============================================================================
// ConfigStore - flat section/key/value storage
// ============================================================================

#ifndef PPX_CONFIG_MAX_ENTRIES
#define PPX_CONFIG_MAX_ENTRIES 256U
#endif

class ConfigStore {
 public:
  // --- Typed Getters ---

  const char* GetString(const char* section, const char* key,
                        const char* default_val = "") const {
    const Entry* e = FindEntry(section, key);
    return (e != nullptr) ? e->value.c_str() : default_val;
  }

  int32_t GetInt(const char* section, const char* key,
                 int32_t default_val = 0) const {
    optional<int32_t> v = FindInt(section, key);
    return v.value_or(default_val);
  }

  uint32_t GetUint(const char* section, const char* key,
                   uint32_t default_val = 0) const {
    optional<uint32_t> v = FindUint(section, key);
    return v.value_or(default_val);
  }

  bool GetBool(const char* section, const char* key,
               bool default_val = false) const {
    const Entry* e = FindEntry(section, key);
    return (e != nullptr) ? ParseBool(e->value.c_str()) : default_val;
  }

  /**
   * @brief Split a comma or whitespace separated value into items.
   *
   * Empty items are dropped; a missing key yields an empty list.
   */
  std::vector<std::string> GetList(const char* section, const char* key) const {
    std::vector<std::string> out;
    const Entry* e = FindEntry(section, key);
    if (e == nullptr) return out;
    std::string cur;
    for (char c : e->value) {
      if (c == ',' || c == ' ' || c == '\t' || c == '\n' || c == '\r') {
        if (!cur.empty()) out.push_back(cur);
        cur.clear();
      } else {
        cur.push_back(c);
      }
    }
    if (!cur.empty()) out.push_back(cur);
    return out;
  }

  // --- Optional Getters ---

  optional<int32_t> FindInt(const char* section, const char* key) const {
    const Entry* e = FindEntry(section, key);
    if (e == nullptr) return optional<int32_t>();
    const char* s = e->value.c_str();
    char* end = nullptr;
    long val = std::strtol(s, &end, 10);
    if (end == s || *end != '\0') return optional<int32_t>();
    return optional<int32_t>(static_cast<int32_t>(val));
  }

  /// Rejects negative and non-numeric values.
  optional<uint32_t> FindUint(const char* section, const char* key) const {
    const Entry* e = FindEntry(section, key);
    if (e == nullptr) return optional<uint32_t>();
    const char* s = e->value.c_str();
    if (*s == '-') return optional<uint32_t>();
    char* end = nullptr;
    unsigned long val = std::strtoul(s, &end, 10);
    if (end == s || *end != '\0' || val > 0xFFFFFFFFUL) {
      return optional<uint32_t>();
    }
    return optional<uint32_t>(static_cast<uint32_t>(val));
  }

  optional<bool> FindBool(const char* section, const char* key) const {
    const Entry* e = FindEntry(section, key);
    return (e == nullptr) ? optional<bool>()
                          : optional<bool>(ParseBool(e->value.c_str()));
  }

  // --- Query ---

  bool HasSection(const char* section) const {
    PPX_ASSERT(section != nullptr);
    for (const Entry& e : entries_) {
      if (detail::StrCaseEqual(e.section.c_str(), section)) return true;
    }
    return false;
  }

  bool HasKey(const char* section, const char* key) const {
    return FindEntry(section, key) != nullptr;
  }

  uint32_t EntryCount() const noexcept {
    return static_cast<uint32_t>(entries_.size());
  }

  // --- Mutation ---

  /// @brief Insert or overwrite one value. False when the store is full.
  bool Set(const char* section, const char* key, const char* value) {
    PPX_ASSERT(section != nullptr && key != nullptr);
    for (Entry& e : entries_) {
      if (detail::StrCaseEqual(e.section.c_str(), section) &&
          detail::StrCaseEqual(e.key.c_str(), key)) {
        e.value = (value != nullptr) ? value : "";
        return true;
      }
    }
    if (entries_.size() >= PPX_CONFIG_MAX_ENTRIES) return false;
    entries_.push_back(Entry{section, key, (value != nullptr) ? value : ""});
    return true;
  }

  /**
   * @brief Override values from environment variables.
   * @return Number of bindings whose variable was set (and non-empty).
   */
  uint32_t ApplyEnvironment(const EnvBinding* bindings, uint32_t count) {
    uint32_t applied = 0;
    for (uint32_t i = 0; i < count; ++i) {
      const char* v = std::getenv(bindings[i].env_name);
      if (v == nullptr || *v == '\0') continue;
      if (Set(bindings[i].section, bindings[i].key, v)) ++applied;
    }
    return applied;
  }

 protected:
  struct Entry {
    std::string section;
    std::string key;
    std::string value;
  };

  static expected<std::string, ConfigError> ReadFile(const char* path) {
    FILE* f = std::fopen(path, "rb");
    if (f == nullptr) {
      return expected<std::string, ConfigError>::error(
          ConfigError::kFileNotFound);
    }
    std::string data;
    char chunk[4096];
    size_t n = 0;
    while ((n = std::fread(chunk, 1, sizeof(chunk), f)) > 0) {
      data.append(chunk, n);
    }
    const bool failed = std::ferror(f) != 0;
    (void)std::fclose(f);
    if (failed) {
      return expected<std::string, ConfigError>::error(
          ConfigError::kParseError);
    }
    return expected<std::string, ConfigError>::success(std::move(data));
  }

  const Entry* FindEntry(const char* section, const char* key) const {
    PPX_ASSERT(section != nullptr && key != nullptr);
    for (const Entry& e : entries_) {
      if (detail::StrCaseEqual(e.section.c_str(), section) &&
          detail::StrCaseEqual(e.key.c_str(), key)) {
        return &e;
      }
    }
    return nullptr;
  }

  static bool ParseBool(const char* str) noexcept {
    return detail::StrCaseEqual(str, "true") || detail::StrCaseEqual(str, "1") ||
           detail::StrCaseEqual(str, "yes") || detail::StrCaseEqual(str, "on");
  }

  std::vector<Entry> entries_;

  template <typename>
  friend struct ConfigParser;
};

// ============================================================================
// ConfigParser<Backend> - one specialization per enabled format
// ============================================================================

/** Default: format not compiled in. */
template <typename Backend>
struct ConfigParser {
  static expected<void, ConfigError> ParseFile(ConfigStore&, const char*) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
  static expected<void, ConfigError> ParseBuffer(ConfigStore&, const char*,
                                                 uint32_t) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
};

// --- INI Backend ---

#ifdef PPX_CONFIG_INI_ENABLED
template <>
struct ConfigParser<IniBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                               const char* path) {
    int result = ini_parse(path, Handler, &store);
    if (result == -1) {
      return expected<void, ConfigError>::error(ConfigError::kFileNotFound);
    }
    if (result != 0) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    return expected<void, ConfigError>::success();
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const char* data,
                                                 uint32_t size) {
    // ini_parse_string() needs a terminated buffer.
    std::string text(data, size);
    int result = ini_parse_string(text.c_str(), Handler, &store);
    if (result != 0) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static int Handler(void* user, const char* section, const char* name,
                     const char* value) {
    auto* s = static_cast<ConfigStore*>(user);
    return s->Set(section ? section : "", name ? name : "", value) ? 1 : 0;
  }
};
#endif

// --- JSON Backend ---

#ifdef PPX_CONFIG_JSON_ENABLED
template <>
struct ConfigParser<JsonBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                               const char* path) {
    auto r = ConfigStore::ReadFile(path);
    if (!r.has_value()) {
      return expected<void, ConfigError>::error(r.get_error());
    }
    return ParseBuffer(store, r.value().data(),
                       static_cast<uint32_t>(r.value().size()));
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const char* data,
                                                 uint32_t size) {
    auto j = nlohmann::json::parse(data, data + size, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    for (auto it = j.begin(); it != j.end(); ++it) {
      if (it->is_object()) {
        for (auto kit = it->begin(); kit != it->end(); ++kit) {
          if (!store.Set(it.key().c_str(), kit.key().c_str(),
                         ToStr(*kit).c_str())) {
            return expected<void, ConfigError>::error(ConfigError::kBufferFull);
          }
        }
      } else if (!store.Set("", it.key().c_str(), ToStr(*it).c_str())) {
        return expected<void, ConfigError>::error(ConfigError::kBufferFull);
      }
    }
    return expected<void, ConfigError>::success();
  }

 private:
  // Arrays flatten to a comma separated list, e.g. worker addresses.
  static std::string ToStr(const nlohmann::json& n) {
    if (n.is_string()) return n.get<std::string>();
    if (n.is_boolean()) return n.get<bool>() ? "true" : "false";
    if (n.is_array()) {
      std::string out;
      for (const auto& item : n) {
        if (!out.empty()) out.push_back(',');
        out += ToStr(item);
      }
      return out;
    }
    return n.dump();
  }
};
#endif

// --- YAML Backend ---

#ifdef PPX_CONFIG_YAML_ENABLED
template <>
struct ConfigParser<YamlBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                               const char* path) {
    auto r = ConfigStore::ReadFile(path);
    if (!r.has_value()) {
      return expected<void, ConfigError>::error(r.get_error());
    }
    return ParseBuffer(store, r.value().data(),
                       static_cast<uint32_t>(r.value().size()));
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const char* data,
                                                 uint32_t size) {
    std::string yaml_str(data, size);
    auto root = fkyaml::node::deserialize(yaml_str);
    if (root.is_null() || !root.is_mapping()) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    for (auto it = root.begin(); it != root.end(); ++it) {
      auto sec = it.key().get_value<std::string>();
      auto& node = *it;
      if (node.is_mapping()) {
        for (auto kit = node.begin(); kit != node.end(); ++kit) {
          auto key = kit.key().get_value<std::string>();
          if (!store.Set(sec.c_str(), key.c_str(), ToStr(*kit).c_str())) {
            return expected<void, ConfigError>::error(ConfigError::kBufferFull);
          }
        }
      } else if (!store.Set("", sec.c_str(), ToStr(node).c_str())) {
        return expected<void, ConfigError>::error(ConfigError::kBufferFull);
      }
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static std::string ToStr(const fkyaml::node& n) {
    if (n.is_string()) return n.get_value<std::string>();
    if (n.is_boolean()) return n.get_value<bool>() ? "true" : "false";
    if (n.is_integer()) return std::to_string(n.get_value<int64_t>());
    if (n.is_float_number()) return std::to_string(n.get_value<double>());
    if (n.is_sequence()) {
      std::string out;
      for (auto it = n.begin(); it != n.end(); ++it) {
        if (!out.empty()) out.push_back(',');
        out += ToStr(*it);
      }
      return out;
    }
    return std::string();
  }
};
#endif

// ============================================================================
// Config<Backends...>
// ============================================================================

template <typename... Backends>
class Config final : public ConfigStore {
  static_assert(sizeof...(Backends) > 0, "Config requires at least one backend");

 public:
  Config() = default;

  expected<void, ConfigError> LoadFile(
      const char* path, ConfigFormat format = ConfigFormat::kAuto) {
    PPX_ASSERT(path != nullptr);
    if (format == ConfigFormat::kAuto) format = DetectFormat(path);
    return DispatchFile<Backends...>(path, format);
  }

  expected<void, ConfigError> LoadBuffer(const char* data, uint32_t size,
                                         ConfigFormat format) {
    PPX_ASSERT(data != nullptr);
    return DispatchBuffer<Backends...>(data, size, format);
  }

  /// @brief True when one of the compiled-in backends handles `format`.
  static constexpr bool Supports(ConfigFormat format) noexcept {
    return ((Backends::kFormat == format) || ...);
  }

 private:
  template <typename First, typename... Rest>
  expected<void, ConfigError> DispatchFile(const char* path,
                                           ConfigFormat format) {
    if (First::kFormat == format) {
      return ConfigParser<First>::ParseFile(*this, path);
    }
    if constexpr (sizeof...(Rest) > 0) {
      return DispatchFile<Rest...>(path, format);
    }
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }

  template <typename First, typename... Rest>
  expected<void, ConfigError> DispatchBuffer(const char* data, uint32_t size,
                                             ConfigFormat format) {
    if (First::kFormat == format) {
      return ConfigParser<First>::ParseBuffer(*this, data, size);
    }
    if constexpr (sizeof...(Rest) > 0) {
      return DispatchBuffer<Rest...>(data, size, format);
    }
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }

  ConfigFormat DetectFormat(const char* path) const noexcept {
    const char* ext = detail::FileExtension(path);
    if (ext == nullptr) return Head::kFormat;
    return DetectExt<Backends...>(ext);
  }

  template <typename First, typename... Rest>
  ConfigFormat DetectExt(const char* ext) const noexcept {
    if (First::MatchesExtension(ext)) return First::kFormat;
    if constexpr (sizeof...(Rest) > 0) return DetectExt<Rest...>(ext);
    return Head::kFormat;
  }

  using Head = typename std::tuple_element<0, std::tuple<Backends...>>::type;
};

// ============================================================================
// Convenience Type Aliases
// ============================================================================

#if defined(PPX_CONFIG_INI_ENABLED) || defined(PPX_CONFIG_JSON_ENABLED) || \
    defined(PPX_CONFIG_YAML_ENABLED)
#define PPX_CONFIG_HAS_BACKEND 1

using MultiConfig = Config<
#ifdef PPX_CONFIG_INI_ENABLED
    IniBackend
#endif
#if defined(PPX_CONFIG_INI_ENABLED) && \
    (defined(PPX_CONFIG_JSON_ENABLED) || defined(PPX_CONFIG_YAML_ENABLED))
    ,
#endif
#ifdef PPX_CONFIG_JSON_ENABLED
    JsonBackend
#endif
#if defined(PPX_CONFIG_JSON_ENABLED) && defined(PPX_CONFIG_YAML_ENABLED)
    ,
#endif
#ifdef PPX_CONFIG_YAML_ENABLED
    YamlBackend
#endif
    >;
#endif

#ifdef PPX_CONFIG_INI_ENABLED
using IniConfig = Config<IniBackend>;
#endif
#ifdef PPX_CONFIG_JSON_ENABLED
using JsonConfig = Config<JsonBackend>;
#endif
#ifdef PPX_CONFIG_YAML_ENABLED
using YamlConfig = Config<YamlBackend>;
#endif

}  // namespace ppx

#endif  // PPX_CONFIG_HPP_
