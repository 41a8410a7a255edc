/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file config.hpp
 * @brief Driver configuration: DriverConfig plus multi-format file loading.
 *
 * Backends are selected at build time and dispatched by tag type:
 *   - IniBackend  : inih library   (DGT_CONFIG_INI_ENABLED)
 *   - JsonBackend : nlohmann/json  (DGT_CONFIG_JSON_ENABLED)
 *   - YamlBackend : fkYAML         (DGT_CONFIG_YAML_ENABLED)
 *
 * Every format is flattened to "section + key = value". Lists (JSON arrays,
 * YAML sequences) become comma-separated values, which is also how INI
 * files spell them.
 *
 * Recognised keys:
 * @code
 *   [driver]
 *   ports = /dev/ttyUSB*, /dev/ttyACM*
 *   baud_rate = 9600
 *   scan_interval_ms = 200
 *   max_backoff_ms = 8000
 *   handshake_timeout_ms = 2000
 *   enable_updates = true
 *
 *   [log]
 *   level = info
 * @endcode
 */

#ifndef DGT_CONFIG_HPP_
#define DGT_CONFIG_HPP_

#include "dgt/log.hpp"
#include "dgt/platform.hpp"
#include "dgt/vocabulary.hpp"

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <tuple>
#include <type_traits>
#include <vector>

#ifdef DGT_CONFIG_INI_ENABLED
#include "ini.h"
#endif

#ifdef DGT_CONFIG_JSON_ENABLED
#include <nlohmann/json.hpp>
#endif

#ifdef DGT_CONFIG_YAML_ENABLED
#include <fkYAML/node.hpp>
#endif

namespace dgt {

// ============================================================================
// ConfigFormat / Backend Tags
// ============================================================================

enum class ConfigFormat : uint8_t {
  kAuto = 0,
  kIni,
  kJson,
  kYaml,
};

namespace detail {

inline bool CaseEqual(const char* a, const char* b) noexcept {
  while (*a != '\0' && *b != '\0') {
    char la = (*a >= 'A' && *a <= 'Z') ? static_cast<char>(*a + 32) : *a;
    char lb = (*b >= 'A' && *b <= 'Z') ? static_cast<char>(*b + 32) : *b;
    if (la != lb) return false;
    ++a;
    ++b;
  }
  return *a == *b;
}

inline std::string Trim(const std::string& s) {
  size_t begin = 0U;
  size_t end = s.size();
  while (begin < end && (s[begin] == ' ' || s[begin] == '\t')) ++begin;
  while (end > begin && (s[end - 1U] == ' ' || s[end - 1U] == '\t')) --end;
  return s.substr(begin, end - begin);
}

/// @brief Split "a, b ,c" into {"a", "b", "c"}; empty items are dropped.
inline std::vector<std::string> SplitList(const std::string& value) {
  std::vector<std::string> out;
  size_t start = 0U;
  while (start <= value.size()) {
    size_t comma = value.find(',', start);
    if (comma == std::string::npos) comma = value.size();
    std::string item = Trim(value.substr(start, comma - start));
    if (!item.empty()) out.push_back(item);
    start = comma + 1U;
  }
  return out;
}

}  // namespace detail

struct IniBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kIni;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::CaseEqual(ext, "ini") || detail::CaseEqual(ext, "cfg") ||
           detail::CaseEqual(ext, "conf");
  }
};

struct JsonBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kJson;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::CaseEqual(ext, "json");
  }
};

struct YamlBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kYaml;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::CaseEqual(ext, "yaml") || detail::CaseEqual(ext, "yml");
  }
};

// ============================================================================
// ConfigStore - Flat section/key/value storage
// ============================================================================

class ConfigStore {
 public:
  /// @return nullptr when absent.
  const std::string* Find(const char* section, const char* key) const {
    for (const auto& e : entries_) {
      if (detail::CaseEqual(e.section.c_str(), section) &&
          detail::CaseEqual(e.key.c_str(), key)) {
        return &e.value;
      }
    }
    return nullptr;
  }

  std::string GetString(const char* section, const char* key,
                        const std::string& default_val = "") const {
    const std::string* v = Find(section, key);
    return (v != nullptr) ? *v : default_val;
  }

  /// @return kInvalidValue when present but not an unsigned integer.
  expected<uint32_t, ConfigError> GetUint(const char* section, const char* key,
                                          uint32_t default_val) const {
    const std::string* v = Find(section, key);
    if (v == nullptr) {
      return expected<uint32_t, ConfigError>::success(default_val);
    }
    const std::string s = detail::Trim(*v);
    char* end = nullptr;
    const unsigned long val = std::strtoul(s.c_str(), &end, 10);
    if (s.empty() || s[0] == '-' || end == s.c_str() || *end != '\0' ||
        val > UINT32_MAX) {
      DGT_LOG_WARN("Config", "[%s] %s: '%s' is not a number", section, key,
                   v->c_str());
      return expected<uint32_t, ConfigError>::error(ConfigError::kInvalidValue);
    }
    return expected<uint32_t, ConfigError>::success(
        static_cast<uint32_t>(val));
  }

  expected<bool, ConfigError> GetBool(const char* section, const char* key,
                                      bool default_val) const {
    const std::string* v = Find(section, key);
    if (v == nullptr) {
      return expected<bool, ConfigError>::success(default_val);
    }
    const std::string s = detail::Trim(*v);
    const char* str = s.c_str();
    if (detail::CaseEqual(str, "true") || detail::CaseEqual(str, "1") ||
        detail::CaseEqual(str, "yes") || detail::CaseEqual(str, "on")) {
      return expected<bool, ConfigError>::success(true);
    }
    if (detail::CaseEqual(str, "false") || detail::CaseEqual(str, "0") ||
        detail::CaseEqual(str, "no") || detail::CaseEqual(str, "off")) {
      return expected<bool, ConfigError>::success(false);
    }
    return expected<bool, ConfigError>::error(ConfigError::kInvalidValue);
  }

  bool HasSection(const char* section) const {
    for (const auto& e : entries_) {
      if (detail::CaseEqual(e.section.c_str(), section)) return true;
    }
    return false;
  }

  size_t EntryCount() const noexcept { return entries_.size(); }

  /// @brief Insert or overwrite one entry.
  void AddEntry(const std::string& section, const std::string& key,
                const std::string& value) {
    for (auto& e : entries_) {
      if (detail::CaseEqual(e.section.c_str(), section.c_str()) &&
          detail::CaseEqual(e.key.c_str(), key.c_str())) {
        e.value = value;
        return;
      }
    }
    entries_.push_back(Entry{section, key, value});
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
    char buf[1024];
    size_t n;
    while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0U) {
      data.append(buf, n);
    }
    std::fclose(f);
    return expected<std::string, ConfigError>::success(std::move(data));
  }

  static const char* GetExtension(const char* path) noexcept {
    const char* dot = nullptr;
    for (const char* p = path; *p != '\0'; ++p) {
      if (*p == '.') dot = p;
      if (*p == '/') dot = nullptr;
    }
    return (dot != nullptr) ? dot + 1 : nullptr;
  }

  std::vector<Entry> entries_;

  template <typename>
  friend struct ConfigParser;
};

// ============================================================================
// ConfigParser<Backend> - Template specialization per format
// ============================================================================

/** Default: format not supported. */
template <typename Backend>
struct ConfigParser {
  static expected<void, ConfigError> ParseFile(ConfigStore&, const char*) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
  static expected<void, ConfigError> ParseBuffer(ConfigStore&, const char*,
                                                 size_t) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
};

// --- INI Backend ---

#ifdef DGT_CONFIG_INI_ENABLED
template <>
struct ConfigParser<IniBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                               const char* path) {
    int result = ini_parse(path, Handler, &store);
    if (result == -1)
      return expected<void, ConfigError>::error(ConfigError::kFileNotFound);
    if (result != 0)
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    return expected<void, ConfigError>::success();
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const char* data, size_t size) {
    std::string text(data, size);
    int result = ini_parse_string(text.c_str(), Handler, &store);
    if (result != 0)
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    return expected<void, ConfigError>::success();
  }

 private:
  static int Handler(void* user, const char* section, const char* name,
                     const char* value) {
    auto* s = static_cast<ConfigStore*>(user);
    s->AddEntry(section ? section : "", name ? name : "", value ? value : "");
    return 1;
  }
};
#endif

// --- JSON Backend ---

#ifdef DGT_CONFIG_JSON_ENABLED
template <>
struct ConfigParser<JsonBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                               const char* path) {
    auto r = ConfigStore::ReadFile(path);
    if (!r.has_value()) return expected<void, ConfigError>::error(r.get_error());
    return ParseBuffer(store, r.value().data(), r.value().size());
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const char* data, size_t size) {
    auto j = nlohmann::json::parse(data, data + size, nullptr, false);
    if (j.is_discarded() || !j.is_object())
      return expected<void, ConfigError>::error(ConfigError::kParseError);

    for (auto it = j.begin(); it != j.end(); ++it) {
      if (it->is_object()) {
        for (auto kit = it->begin(); kit != it->end(); ++kit) {
          store.AddEntry(it.key(), kit.key(), ToStr(*kit));
        }
      } else {
        store.AddEntry("", it.key(), ToStr(*it));
      }
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static std::string ToStr(const nlohmann::json& n) {
    if (n.is_string()) {
      return n.get<std::string>();
    } else if (n.is_boolean()) {
      return n.get<bool>() ? "true" : "false";
    } else if (n.is_number_integer()) {
      return std::to_string(n.get<int64_t>());
    } else if (n.is_array()) {
      std::string out;
      for (const auto& item : n) {
        if (!out.empty()) out += ",";
        out += ToStr(item);
      }
      return out;
    }
    return n.dump();
  }
};
#endif

// --- YAML Backend ---

#ifdef DGT_CONFIG_YAML_ENABLED
template <>
struct ConfigParser<YamlBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                               const char* path) {
    auto r = ConfigStore::ReadFile(path);
    if (!r.has_value()) return expected<void, ConfigError>::error(r.get_error());
    return ParseBuffer(store, r.value().data(), r.value().size());
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const char* data, size_t size) {
    std::string yaml_str(data, size);
    auto root = fkyaml::node::deserialize(yaml_str);
    if (root.is_null() || !root.is_mapping())
      return expected<void, ConfigError>::error(ConfigError::kParseError);

    for (auto it = root.begin(); it != root.end(); ++it) {
      auto sec = it.key().get_value<std::string>();
      auto& node = *it;
      if (node.is_mapping()) {
        for (auto kit = node.begin(); kit != node.end(); ++kit) {
          store.AddEntry(sec, kit.key().get_value<std::string>(), ToStr(*kit));
        }
      } else {
        store.AddEntry("", sec, ToStr(node));
      }
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static std::string ToStr(const fkyaml::node& n) {
    if (n.is_string()) {
      return n.get_value<std::string>();
    } else if (n.is_boolean()) {
      return n.get_value<bool>() ? "true" : "false";
    } else if (n.is_integer()) {
      return std::to_string(n.get_value<int64_t>());
    } else if (n.is_sequence()) {
      std::string out;
      for (const auto& item : n) {
        if (!out.empty()) out += ",";
        out += ToStr(item);
      }
      return out;
    }
    return std::string();
  }
};
#endif

// ============================================================================
// Config<Backends...> - Compile-time composable reader
// ============================================================================

template <typename... Backends>
class Config final : public ConfigStore {
  static_assert(sizeof...(Backends) > 0, "Config requires at least one backend");

 public:
  expected<void, ConfigError> LoadFile(
      const char* path, ConfigFormat format = ConfigFormat::kAuto) {
    DGT_ASSERT(path != nullptr);
    if (format == ConfigFormat::kAuto) format = DetectFormat(path);
    return DispatchFile<Backends...>(path, format);
  }

  expected<void, ConfigError> LoadBuffer(const char* data, size_t size,
                                         ConfigFormat format) {
    DGT_ASSERT(data != nullptr);
    return DispatchBuffer<Backends...>(data, size, format);
  }

 private:
  template <typename First, typename... Rest>
  expected<void, ConfigError> DispatchFile(const char* path,
                                           ConfigFormat format) {
    if (First::kFormat == format)
      return ConfigParser<First>::ParseFile(*this, path);
    if constexpr (sizeof...(Rest) > 0)
      return DispatchFile<Rest...>(path, format);
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }

  template <typename First, typename... Rest>
  expected<void, ConfigError> DispatchBuffer(const char* data, size_t size,
                                             ConfigFormat format) {
    if (First::kFormat == format)
      return ConfigParser<First>::ParseBuffer(*this, data, size);
    if constexpr (sizeof...(Rest) > 0)
      return DispatchBuffer<Rest...>(data, size, format);
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }

  ConfigFormat DetectFormat(const char* path) const noexcept {
    const char* ext = GetExtension(path);
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

#if defined(DGT_CONFIG_INI_ENABLED) || defined(DGT_CONFIG_JSON_ENABLED) || \
    defined(DGT_CONFIG_YAML_ENABLED)
#define DGT_CONFIG_HAS_BACKEND 1

using MultiConfig = Config<
#ifdef DGT_CONFIG_INI_ENABLED
    IniBackend
#endif
#if defined(DGT_CONFIG_INI_ENABLED) && \
    (defined(DGT_CONFIG_JSON_ENABLED) || defined(DGT_CONFIG_YAML_ENABLED))
    ,
#endif
#ifdef DGT_CONFIG_JSON_ENABLED
    JsonBackend
#endif
#if defined(DGT_CONFIG_JSON_ENABLED) && defined(DGT_CONFIG_YAML_ENABLED)
    ,
#endif
#ifdef DGT_CONFIG_YAML_ENABLED
    YamlBackend
#endif
    >;
#endif

// ============================================================================
// DriverConfig
// ============================================================================

struct DriverConfig {
  /// Glob patterns matched against port paths and names.
  std::vector<std::string> port_patterns;
  uint32_t baud_rate = 9600U;
  /// First delay between scans; doubles on every empty scan.
  uint32_t scan_interval_ms = 200U;
  uint32_t max_backoff_ms = 8000U;
  /// How long a candidate has to answer the version handshake.
  uint32_t handshake_timeout_ms = 2000U;
  /// Ask the board for field updates after connecting.
  bool enable_updates = true;
  log::Level log_level = log::Level::kInfo;

  expected<void, ConfigError> Validate() const {
    const bool baud_ok = baud_rate == 9600U || baud_rate == 19200U ||
                         baud_rate == 38400U || baud_rate == 57600U ||
                         baud_rate == 115200U;
    if (!baud_ok || scan_interval_ms == 0U || handshake_timeout_ms == 0U ||
        max_backoff_ms < scan_interval_ms) {
      return expected<void, ConfigError>::error(ConfigError::kInvalidValue);
    }
    return expected<void, ConfigError>::success();
  }

  /// @brief Build from a loaded store; missing keys keep their defaults.
  static expected<DriverConfig, ConfigError> FromStore(
      const ConfigStore& store) {
    using Result = expected<DriverConfig, ConfigError>;
    DriverConfig cfg;

    const std::string* ports = store.Find("driver", "ports");
    if (ports != nullptr) {
      cfg.port_patterns = detail::SplitList(*ports);
    }

    auto baud = store.GetUint("driver", "baud_rate", cfg.baud_rate);
    auto scan = store.GetUint("driver", "scan_interval_ms", cfg.scan_interval_ms);
    auto backoff = store.GetUint("driver", "max_backoff_ms", cfg.max_backoff_ms);
    auto handshake = store.GetUint("driver", "handshake_timeout_ms",
                                   cfg.handshake_timeout_ms);
    auto updates = store.GetBool("driver", "enable_updates", cfg.enable_updates);
    if (!baud || !scan || !backoff || !handshake || !updates) {
      return Result::error(ConfigError::kInvalidValue);
    }
    cfg.baud_rate = baud.value();
    cfg.scan_interval_ms = scan.value();
    cfg.max_backoff_ms = backoff.value();
    cfg.handshake_timeout_ms = handshake.value();
    cfg.enable_updates = updates.value();

    const std::string* level = store.Find("log", "level");
    if (level != nullptr &&
        !log::ParseLevel(detail::Trim(*level).c_str(), cfg.log_level)) {
      DGT_LOG_WARN("Config", "unknown log level '%s'", level->c_str());
      return Result::error(ConfigError::kInvalidValue);
    }

    auto valid = cfg.Validate();
    if (!valid) {
      return Result::error(valid.get_error());
    }
    return Result::success(std::move(cfg));
  }
};

/**
 * @brief Load a DriverConfig from @p path.
 * @return kFormatNotSupported when no backend for the format is built in.
 */
inline expected<DriverConfig, ConfigError> LoadDriverConfig(
    const char* path, ConfigFormat format = ConfigFormat::kAuto) {
#ifdef DGT_CONFIG_HAS_BACKEND
  MultiConfig cfg;
  auto r = cfg.LoadFile(path, format);
  if (!r) {
    DGT_LOG_WARN("Config", "cannot load %s", path);
    return expected<DriverConfig, ConfigError>::error(r.get_error());
  }
  return DriverConfig::FromStore(cfg);
#else
  (void)path;
  (void)format;
  return expected<DriverConfig, ConfigError>::error(
      ConfigError::kFormatNotSupported);
#endif
}

inline expected<DriverConfig, ConfigError> LoadDriverConfigBuffer(
    const char* data, size_t size, ConfigFormat format) {
#ifdef DGT_CONFIG_HAS_BACKEND
  MultiConfig cfg;
  auto r = cfg.LoadBuffer(data, size, format);
  if (!r) {
    return expected<DriverConfig, ConfigError>::error(r.get_error());
  }
  return DriverConfig::FromStore(cfg);
#else
  (void)data;
  (void)size;
  (void)format;
  return expected<DriverConfig, ConfigError>::error(
      ConfigError::kFormatNotSupported);
#endif
}

}  // namespace dgt

#endif  // DGT_CONFIG_HPP_
