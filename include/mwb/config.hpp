/**
 * @file config.hpp
 * @brief Bridge options loaded from JSON, INI or YAML files.
 *
 * Backends are selected by tag type and dispatched at compile time:
 *   - JsonBackend : nlohmann/json (always available)
 *   - IniBackend  : inih          (MWB_CONFIG_INI_ENABLED)
 *   - YamlBackend : fkYAML        (MWB_CONFIG_YAML_ENABLED)
 *
 * Every format is flattened to "section + key = value". Top-level scalars
 * land in the empty section, one level of nesting becomes the section name.
 * Section and key lookup is case-insensitive.
 *
 * Usage:
 * @code
 *   mwb::BridgeConfig cfg;
 *   if (cfg.LoadFile("/data/options.json")) {
 *     mwb::BridgeOptions opts = mwb::LoadBridgeOptions(cfg);
 *   }
 * @endcode
 */

#ifndef MWB_CONFIG_HPP_
#define MWB_CONFIG_HPP_

#include "mwb/json_util.hpp"
#include "mwb/log.hpp"
#include "mwb/platform.hpp"
#include "mwb/vocabulary.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <map>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

#ifdef MWB_CONFIG_INI_ENABLED
#include <ini.h>
#endif

#ifdef MWB_CONFIG_YAML_ENABLED
#include <fkYAML/node.hpp>
#endif

namespace mwb {

enum class ConfigError : uint8_t {
  kFileNotFound = 0,
  kParseError,
  kFormatNotSupported,
  kFileTooLarge,
};

inline const char* ConfigErrorName(ConfigError e) noexcept {
  switch (e) {
    case ConfigError::kFileNotFound: return "file not found";
    case ConfigError::kParseError: return "parse error";
    case ConfigError::kFormatNotSupported: return "format not supported";
    case ConfigError::kFileTooLarge: return "file too large";
  }
  return "unknown";
}

enum class ConfigFormat : uint8_t {
  kAuto = 0,
  kIni,
  kJson,
  kYaml,
};

// ============================================================================
// Backend Tags
// ============================================================================

struct IniBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kIni;
  static bool MatchesExtension(const std::string& ext) {
    return ext == "ini" || ext == "cfg" || ext == "conf";
  }
};

struct JsonBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kJson;
  static bool MatchesExtension(const std::string& ext) { return ext == "json"; }
};

struct YamlBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kYaml;
  static bool MatchesExtension(const std::string& ext) {
    return ext == "yaml" || ext == "yml";
  }
};

// ============================================================================
// ConfigStore
// ============================================================================

#ifndef MWB_CONFIG_MAX_FILE_SIZE
#define MWB_CONFIG_MAX_FILE_SIZE (256U * 1024U)
#endif

class ConfigStore {
 public:
  std::string GetString(const std::string& section, const std::string& key,
                        const std::string& default_val = "") const {
    const std::string* v = Find(section, key);
    return (v != nullptr) ? *v : default_val;
  }

  int32_t GetInt(const std::string& section, const std::string& key,
                 int32_t default_val = 0) const {
    optional<int32_t> v = FindInt(section, key);
    return v.has_value() ? *v : default_val;
  }

  /// Clamped to [0, 65535].
  uint16_t GetPort(const std::string& section, const std::string& key,
                   uint16_t default_val = 0) const {
    optional<int32_t> v = FindInt(section, key);
    if (!v.has_value()) return default_val;
    if (*v < 0) return 0;
    if (*v > 65535) return 65535;
    return static_cast<uint16_t>(*v);
  }

  bool GetBool(const std::string& section, const std::string& key,
               bool default_val = false) const {
    optional<bool> v = FindBool(section, key);
    return v.has_value() ? *v : default_val;
  }

  double GetDouble(const std::string& section, const std::string& key,
                   double default_val = 0.0) const {
    const std::string* v = Find(section, key);
    if (v == nullptr) return default_val;
    optional<double> d = ParseDecimal(*v);
    return d.has_value() ? *d : default_val;
  }

  optional<int32_t> FindInt(const std::string& section,
                            const std::string& key) const {
    const std::string* v = Find(section, key);
    if (v == nullptr) return nullopt;
    return AsIntOrNone(Json(*v));
  }

  optional<bool> FindBool(const std::string& section,
                          const std::string& key) const {
    const std::string* v = Find(section, key);
    if (v == nullptr) return nullopt;
    const std::string s = ToLowerAscii(TrimAscii(*v));
    return s == "true" || s == "1" || s == "yes" || s == "on";
  }

  bool HasSection(const std::string& section) const {
    const std::string lsec = ToLowerAscii(section);
    for (const auto& kv : entries_) {
      if (kv.first.first == lsec) return true;
    }
    return false;
  }

  bool HasKey(const std::string& section, const std::string& key) const {
    return Find(section, key) != nullptr;
  }

  uint32_t EntryCount() const noexcept {
    return static_cast<uint32_t>(entries_.size());
  }

  /// Later writes to the same section/key replace earlier ones.
  void Set(const std::string& section, const std::string& key,
           std::string value) {
    entries_[{ToLowerAscii(section), ToLowerAscii(key)}] = std::move(value);
  }

 protected:
  static expected<std::string, ConfigError> ReadFile(const std::string& path) {
    using Result = expected<std::string, ConfigError>;
    FILE* f = std::fopen(path.c_str(), "rb");
    if (f == nullptr) return Result::error(ConfigError::kFileNotFound);
    std::string data;
    char chunk[4096];
    size_t n = 0;
    while ((n = std::fread(chunk, 1, sizeof(chunk), f)) > 0) {
      data.append(chunk, n);
      if (data.size() > MWB_CONFIG_MAX_FILE_SIZE) {
        std::fclose(f);
        return Result::error(ConfigError::kFileTooLarge);
      }
    }
    std::fclose(f);
    return Result::success(std::move(data));
  }

  static std::string Extension(const std::string& path) {
    size_t slash = path.find_last_of('/');
    size_t dot = path.find_last_of('.');
    if (dot == std::string::npos ||
        (slash != std::string::npos && dot < slash)) {
      return std::string();
    }
    return ToLowerAscii(path.substr(dot + 1));
  }

 private:
  const std::string* Find(const std::string& section,
                          const std::string& key) const {
    auto it = entries_.find({ToLowerAscii(section), ToLowerAscii(key)});
    return (it != entries_.end()) ? &it->second : nullptr;
  }

  std::map<std::pair<std::string, std::string>, std::string> entries_;

  template <typename> friend struct ConfigParser;
};

// ============================================================================
// ConfigParser<Backend>
// ============================================================================

template <typename Backend>
struct ConfigParser {
  static expected<void, ConfigError> ParseBuffer(ConfigStore&,
                                                 const std::string&) {
    return expected<void, ConfigError>::error(
        ConfigError::kFormatNotSupported);
  }
};

template <>
struct ConfigParser<JsonBackend> {
  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const std::string& data) {
    optional<Json> root = ParseJsonObject(data);
    if (!root.has_value()) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    for (auto it = root->begin(); it != root->end(); ++it) {
      if (it->is_object()) {
        for (auto kit = it->begin(); kit != it->end(); ++kit) {
          store.Set(it.key(), kit.key(), ToStr(*kit));
        }
      } else {
        store.Set("", it.key(), ToStr(*it));
      }
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static std::string ToStr(const Json& n) {
    if (n.is_string()) return n.get<std::string>();
    if (n.is_boolean()) return n.get<bool>() ? "true" : "false";
    if (n.is_null()) return std::string();
    // Arrays of strings become comma separated lists.
    if (n.is_array()) {
      std::string out;
      for (const auto& item : n) {
        if (!out.empty()) out += ',';
        out += item.is_string() ? item.get<std::string>() : DumpJson(item);
      }
      return out;
    }
    return DumpJson(n);
  }
};

#ifdef MWB_CONFIG_INI_ENABLED
template <>
struct ConfigParser<IniBackend> {
  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const std::string& data) {
    if (ini_parse_string(data.c_str(), Handler, &store) != 0) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static int Handler(void* user, const char* section, const char* name,
                     const char* value) {
    auto* store = static_cast<ConfigStore*>(user);
    store->Set(section ? section : "", name ? name : "", value ? value : "");
    return 1;
  }
};
#endif

#ifdef MWB_CONFIG_YAML_ENABLED
template <>
struct ConfigParser<YamlBackend> {
  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const std::string& data) {
    fkyaml::node root = fkyaml::node::deserialize(data);
    if (root.is_null() || !root.is_mapping()) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    for (auto it = root.begin(); it != root.end(); ++it) {
      std::string name = it.key().get_value<std::string>();
      const fkyaml::node& node = *it;
      if (node.is_mapping()) {
        for (auto kit = node.begin(); kit != node.end(); ++kit) {
          store.Set(name, kit.key().get_value<std::string>(), ToStr(*kit));
        }
      } else {
        store.Set("", name, ToStr(node));
      }
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static std::string ToStr(const fkyaml::node& n) {
    if (n.is_string()) return n.get_value<std::string>();
    if (n.is_boolean()) return n.get_value<bool>() ? "true" : "false";
    if (n.is_integer()) return std::to_string(n.get_value<int64_t>());
    if (n.is_float_number()) {
      char buf[64];
      (void)std::snprintf(buf, sizeof(buf), "%g", n.get_value<double>());
      return buf;
    }
    if (n.is_sequence()) {
      std::string out;
      for (const auto& item : n) {
        if (!out.empty()) out += ',';
        out += ToStr(item);
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
  expected<void, ConfigError> LoadFile(
      const std::string& path, ConfigFormat format = ConfigFormat::kAuto) {
    auto data = ReadFile(path);
    if (!data.has_value()) {
      MWB_LOG_WARN("Config", "Cannot read %s: %s", path.c_str(),
                   ConfigErrorName(data.get_error()));
      return expected<void, ConfigError>::error(data.get_error());
    }
    if (format == ConfigFormat::kAuto) format = DetectFormat(path);
    auto r = Dispatch<Backends...>(data.value(), format);
    if (!r.has_value()) {
      MWB_LOG_WARN("Config", "Cannot load %s: %s", path.c_str(),
                   ConfigErrorName(r.get_error()));
    }
    return r;
  }

  expected<void, ConfigError> LoadBuffer(const std::string& data,
                                         ConfigFormat format) {
    return Dispatch<Backends...>(data, format);
  }

 private:
  using Head = typename std::tuple_element<0, std::tuple<Backends...>>::type;

  template <typename First, typename... Rest>
  expected<void, ConfigError> Dispatch(const std::string& data,
                                       ConfigFormat format) {
    if (First::kFormat == format) {
      return ConfigParser<First>::ParseBuffer(*this, data);
    }
    if constexpr (sizeof...(Rest) > 0) {
      return Dispatch<Rest...>(data, format);
    }
    return expected<void, ConfigError>::error(
        ConfigError::kFormatNotSupported);
  }

  ConfigFormat DetectFormat(const std::string& path) const {
    const std::string ext = Extension(path);
    if (ext.empty()) return Head::kFormat;
    return DetectExt<Backends...>(ext);
  }

  template <typename First, typename... Rest>
  ConfigFormat DetectExt(const std::string& ext) const {
    if (First::MatchesExtension(ext)) return First::kFormat;
    if constexpr (sizeof...(Rest) > 0) return DetectExt<Rest...>(ext);
    return Head::kFormat;
  }
};

/// Every backend compiled into this build, JSON first.
using BridgeConfig = Config<JsonBackend
#ifdef MWB_CONFIG_INI_ENABLED
                            , IniBackend
#endif
#ifdef MWB_CONFIG_YAML_ENABLED
                            , YamlBackend
#endif
                            >;

// ============================================================================
// BridgeOptions
// ============================================================================

/// Longest sweep period accepted from configuration (one week).
constexpr uint32_t kMaxSweepIntervalS = 7U * 24U * 3600U;

struct BridgeOptions {
  std::string mqtt_broker = "core-mosquitto";
  uint16_t mqtt_port = 1883;
  std::string mqtt_username;
  std::string mqtt_password;
  std::string base_topic = "zigbee2mqtt";
  std::vector<std::string> schema_paths;
  double stale_after_s = 3600.0;
  uint32_t sweep_interval_s = 60;
  uint32_t target_throttle_ms = 100;
  log::Level log_level = log::Level::kInfo;
};

/// Sweep period in milliseconds, capped at kMaxSweepIntervalS.
inline uint32_t SweepPeriodMs(const BridgeOptions& opts) noexcept {
  uint64_t ms = static_cast<uint64_t>(opts.sweep_interval_s) * 1000U;
  uint64_t cap = static_cast<uint64_t>(kMaxSweepIntervalS) * 1000U;
  return static_cast<uint32_t>(ms < cap ? ms : cap);
}

/// Split "a, b,,c" into {"a", "b", "c"}.
inline std::vector<std::string> SplitList(const std::string& raw) {
  std::vector<std::string> out;
  size_t start = 0;
  while (start <= raw.size()) {
    size_t comma = raw.find(',', start);
    if (comma == std::string::npos) comma = raw.size();
    std::string item = TrimAscii(raw.substr(start, comma - start));
    if (!item.empty()) out.push_back(std::move(item));
    start = comma + 1;
  }
  return out;
}

/**
 * @brief Build BridgeOptions from a loaded store.
 *
 * Each key is looked up in the "bridge" section first, then at top level.
 * Missing or unparsable values keep their defaults.
 */
inline BridgeOptions LoadBridgeOptions(const ConfigStore& store) {
  BridgeOptions opts;
  auto section_of = [&store](const char* key) -> const char* {
    return store.HasKey("bridge", key) ? "bridge" : "";
  };

  opts.mqtt_broker = store.GetString(section_of("mqtt_broker"), "mqtt_broker",
                                     opts.mqtt_broker);
  opts.mqtt_port =
      store.GetPort(section_of("mqtt_port"), "mqtt_port", opts.mqtt_port);
  opts.mqtt_username =
      store.GetString(section_of("mqtt_username"), "mqtt_username");
  opts.mqtt_password =
      store.GetString(section_of("mqtt_password"), "mqtt_password");

  std::string base = TrimAscii(store.GetString(
      section_of("mqtt_base_topic"), "mqtt_base_topic", opts.base_topic));
  while (!base.empty() && base.back() == '/') base.pop_back();
  if (!base.empty()) opts.base_topic = base;

  opts.schema_paths =
      SplitList(store.GetString(section_of("schema_paths"), "schema_paths"));

  double stale = store.GetDouble(section_of("stale_after_s"), "stale_after_s",
                                 opts.stale_after_s);
  if (stale > 0.0) opts.stale_after_s = stale;

  int32_t sweep = store.GetInt(section_of("sweep_interval_s"),
                               "sweep_interval_s",
                               static_cast<int32_t>(opts.sweep_interval_s));
  if (sweep > 0) {
    opts.sweep_interval_s =
        std::min(static_cast<uint32_t>(sweep), kMaxSweepIntervalS);
  }

  int32_t throttle = store.GetInt(
      section_of("target_throttle_ms"), "target_throttle_ms",
      static_cast<int32_t>(opts.target_throttle_ms));
  if (throttle >= 0) opts.target_throttle_ms = static_cast<uint32_t>(throttle);

  std::string level = store.GetString(section_of("log_level"), "log_level");
  if (!level.empty() && !log::ParseLevel(level.c_str(), opts.log_level)) {
    MWB_LOG_WARN("Config", "Unknown log_level '%s', keeping default",
                 level.c_str());
  }
  return opts;
}

}  // namespace mwb

#endif  // MWB_CONFIG_HPP_
