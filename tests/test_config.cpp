/**
 * @file test_config.cpp
 * @brief Tests for config.hpp: ConfigStore lookups, DriverConfig, file
 *        backends.
 */

#include <catch2/catch.hpp>
#include "dgt/config.hpp"

#include <cstdio>
#include <cstring>
#include <string>

#include <unistd.h>

using dgt::ConfigError;

// ============================================================================
// Helpers
// ============================================================================

static std::string WriteTempFile(const char* suffix, const char* content) {
  char tmpl[64];
  std::snprintf(tmpl, sizeof(tmpl), "/tmp/dgt_cfg_XXXXXX%s", suffix);
  const int fd = ::mkstemps(tmpl, static_cast<int>(std::strlen(suffix)));
  if (fd < 0) return std::string();
  const size_t len = std::strlen(content);
  const bool ok = ::write(fd, content, len) == static_cast<ssize_t>(len);
  ::close(fd);
  return ok ? std::string(tmpl) : std::string();
}

// ============================================================================
// ConfigStore
// ============================================================================

TEST_CASE("config - Store lookups are case-insensitive", "[config]") {
  dgt::ConfigStore store;
  store.AddEntry("driver", "baud_rate", "19200");
  store.AddEntry("Driver", "BAUD_RATE", "38400");
  REQUIRE(store.EntryCount() == 1U);
  REQUIRE(store.HasSection("DRIVER"));
  REQUIRE_FALSE(store.HasSection("log"));
  REQUIRE(store.GetString("driver", "baud_rate") == "38400");
  REQUIRE(store.GetString("driver", "missing", "fallback") == "fallback");
  REQUIRE(store.Find("log", "level") == nullptr);
}

TEST_CASE("config - Unsigned values", "[config]") {
  dgt::ConfigStore store;
  store.AddEntry("driver", "good", " 1500 ");
  store.AddEntry("driver", "negative", "-3");
  store.AddEntry("driver", "text", "fast");
  REQUIRE(store.GetUint("driver", "good", 0).value() == 1500U);
  REQUIRE(store.GetUint("driver", "absent", 42).value() == 42U);
  REQUIRE(store.GetUint("driver", "negative", 0).get_error() ==
          ConfigError::kInvalidValue);
  REQUIRE(store.GetUint("driver", "text", 0).get_error() ==
          ConfigError::kInvalidValue);
}

TEST_CASE("config - Boolean values", "[config]") {
  dgt::ConfigStore store;
  store.AddEntry("driver", "a", "yes");
  store.AddEntry("driver", "b", "OFF");
  store.AddEntry("driver", "c", "maybe");
  REQUIRE(store.GetBool("driver", "a", false).value());
  REQUIRE_FALSE(store.GetBool("driver", "b", true).value());
  REQUIRE(store.GetBool("driver", "absent", true).value());
  REQUIRE(store.GetBool("driver", "c", true).get_error() ==
          ConfigError::kInvalidValue);
}

// ============================================================================
// DriverConfig
// ============================================================================

TEST_CASE("config - DriverConfig defaults", "[config]") {
  dgt::DriverConfig cfg;
  REQUIRE(cfg.port_patterns.empty());
  REQUIRE(cfg.baud_rate == 9600U);
  REQUIRE(cfg.scan_interval_ms == 200U);
  REQUIRE(cfg.max_backoff_ms == 8000U);
  REQUIRE(cfg.enable_updates);
  REQUIRE(cfg.Validate().has_value());
}

TEST_CASE("config - DriverConfig validation", "[config]") {
  dgt::DriverConfig cfg;
  cfg.baud_rate = 12345U;
  REQUIRE(cfg.Validate().get_error() == ConfigError::kInvalidValue);

  cfg = dgt::DriverConfig();
  cfg.scan_interval_ms = 0U;
  REQUIRE_FALSE(cfg.Validate().has_value());

  cfg = dgt::DriverConfig();
  cfg.max_backoff_ms = 100U;
  REQUIRE_FALSE(cfg.Validate().has_value());
}

TEST_CASE("config - DriverConfig from a store", "[config]") {
  dgt::ConfigStore store;
  store.AddEntry("driver", "ports", "/dev/ttyUSB*, /dev/ttyACM* ,");
  store.AddEntry("driver", "baud_rate", "9600");
  store.AddEntry("driver", "scan_interval_ms", "250");
  store.AddEntry("driver", "max_backoff_ms", "4000");
  store.AddEntry("driver", "enable_updates", "false");
  store.AddEntry("log", "level", "Warning");

  auto r = dgt::DriverConfig::FromStore(store);
  REQUIRE(r.has_value());
  const auto& cfg = r.value();
  REQUIRE(cfg.port_patterns.size() == 2U);
  REQUIRE(cfg.port_patterns[0] == "/dev/ttyUSB*");
  REQUIRE(cfg.port_patterns[1] == "/dev/ttyACM*");
  REQUIRE(cfg.scan_interval_ms == 250U);
  REQUIRE(cfg.max_backoff_ms == 4000U);
  REQUIRE(cfg.handshake_timeout_ms == 2000U);
  REQUIRE_FALSE(cfg.enable_updates);
  REQUIRE(cfg.log_level == dgt::log::Level::kWarn);
}

TEST_CASE("config - DriverConfig rejects bad values", "[config]") {
  dgt::ConfigStore bad_number;
  bad_number.AddEntry("driver", "handshake_timeout_ms", "soon");
  REQUIRE(dgt::DriverConfig::FromStore(bad_number).get_error() ==
          ConfigError::kInvalidValue);

  dgt::ConfigStore bad_level;
  bad_level.AddEntry("log", "level", "chatty");
  REQUIRE(dgt::DriverConfig::FromStore(bad_level).get_error() ==
          ConfigError::kInvalidValue);

  dgt::ConfigStore bad_baud;
  bad_baud.AddEntry("driver", "baud_rate", "300");
  REQUIRE(dgt::DriverConfig::FromStore(bad_baud).get_error() ==
          ConfigError::kInvalidValue);
}

// ============================================================================
// JSON Backend
// ============================================================================

#ifdef DGT_CONFIG_JSON_ENABLED

TEST_CASE("config - JSON buffer", "[config][json]") {
  const char* json = R"({
    "driver": {
      "ports": ["/dev/ttyUSB*", "DGT*"],
      "baud_rate": 9600,
      "handshake_timeout_ms": 500,
      "enable_updates": true
    },
    "log": { "level": "debug" }
  })";
  auto r = dgt::LoadDriverConfigBuffer(json, std::strlen(json),
                                       dgt::ConfigFormat::kJson);
  REQUIRE(r.has_value());
  REQUIRE(r.value().port_patterns.size() == 2U);
  REQUIRE(r.value().port_patterns[1] == "DGT*");
  REQUIRE(r.value().handshake_timeout_ms == 500U);
  REQUIRE(r.value().log_level == dgt::log::Level::kDebug);
}

TEST_CASE("config - JSON file detected by extension", "[config][json]") {
  const std::string path = WriteTempFile(
      ".json", R"({"driver": {"ports": "/dev/ttyACM*", "max_backoff_ms": 2000}})");
  REQUIRE_FALSE(path.empty());
  auto r = dgt::LoadDriverConfig(path.c_str());
  ::unlink(path.c_str());
  REQUIRE(r.has_value());
  REQUIRE(r.value().port_patterns.size() == 1U);
  REQUIRE(r.value().port_patterns[0] == "/dev/ttyACM*");
  REQUIRE(r.value().max_backoff_ms == 2000U);
}

TEST_CASE("config - Invalid JSON", "[config][json]") {
  const char* json = "{ driver: ";
  auto r = dgt::LoadDriverConfigBuffer(json, std::strlen(json),
                                       dgt::ConfigFormat::kJson);
  REQUIRE(r.get_error() == ConfigError::kParseError);
}

TEST_CASE("config - Missing file", "[config][json]") {
  auto r = dgt::LoadDriverConfig("/nonexistent/dgt.json");
  REQUIRE(r.get_error() == ConfigError::kFileNotFound);
}

#endif  // DGT_CONFIG_JSON_ENABLED

// ============================================================================
// INI Backend
// ============================================================================

#ifdef DGT_CONFIG_INI_ENABLED

TEST_CASE("config - INI buffer", "[config][ini]") {
  const char* ini =
      "[driver]\n"
      "ports = /dev/ttyUSB*, /dev/ttyACM*\n"
      "scan_interval_ms = 500\n"
      "[log]\n"
      "level = error\n";
  auto r = dgt::LoadDriverConfigBuffer(ini, std::strlen(ini),
                                       dgt::ConfigFormat::kIni);
  REQUIRE(r.has_value());
  REQUIRE(r.value().port_patterns.size() == 2U);
  REQUIRE(r.value().scan_interval_ms == 500U);
  REQUIRE(r.value().log_level == dgt::log::Level::kError);
}

#endif  // DGT_CONFIG_INI_ENABLED

// ============================================================================
// YAML Backend
// ============================================================================

#ifdef DGT_CONFIG_YAML_ENABLED

TEST_CASE("config - YAML buffer", "[config][yaml]") {
  const char* yaml =
      "driver:\n"
      "  ports:\n"
      "    - /dev/ttyUSB*\n"
      "  handshake_timeout_ms: 750\n";
  auto r = dgt::LoadDriverConfigBuffer(yaml, std::strlen(yaml),
                                       dgt::ConfigFormat::kYaml);
  REQUIRE(r.has_value());
  REQUIRE(r.value().port_patterns.size() == 1U);
  REQUIRE(r.value().handshake_timeout_ms == 750U);
}

#endif  // DGT_CONFIG_YAML_ENABLED

#ifndef DGT_CONFIG_HAS_BACKEND

TEST_CASE("config - No backend built in", "[config]") {
  auto r = dgt::LoadDriverConfig("driver.json");
  REQUIRE(r.get_error() == ConfigError::kFormatNotSupported);
}

#endif
