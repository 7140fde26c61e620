/**
 * @file schema_service.hpp
 * @brief Device capability manifest: field metadata, write validation and
 *        read-request construction.
 *
 * The manifest is a zigbee2mqtt device definition (JSON object with
 * "exposes" and "options" arrays). The first configured path that loads
 * wins; when none does, a built-in manifest of the mmWave presence fields
 * is used instead.
 *
 * A loaded manifest is immutable. Reload() swaps in a new snapshot; readers
 * keep whatever snapshot they already hold, so concurrent requests never
 * observe a half-built manifest.
 *
 * Access bits (zigbee2mqtt convention):
 *   1 = state is published, 2 = settable, 4 = gettable.
 */

#ifndef MWB_SCHEMA_SERVICE_HPP_
#define MWB_SCHEMA_SERVICE_HPP_

#include "mwb/json_util.hpp"
#include "mwb/log.hpp"
#include "mwb/platform.hpp"
#include "mwb/vocabulary.hpp"

#include <cmath>
#include <cstdint>
#include <cstdio>
#include <initializer_list>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace mwb {

// ============================================================================
// Field Types
// ============================================================================

enum class FieldType : uint8_t {
  kNumeric = 0,
  kEnum,
  kBinary,
  kComposite,
  kList,
  kOther,
};

inline FieldType ParseFieldType(const std::string& name) noexcept {
  if (name == "numeric") return FieldType::kNumeric;
  if (name == "enum") return FieldType::kEnum;
  if (name == "binary") return FieldType::kBinary;
  if (name == "composite") return FieldType::kComposite;
  if (name == "list") return FieldType::kList;
  return FieldType::kOther;
}

static constexpr uint32_t kAccessState = 1;
static constexpr uint32_t kAccessSet = 2;
static constexpr uint32_t kAccessGet = 4;

// ============================================================================
// SchemaField
// ============================================================================

struct SchemaField {
  std::string name;
  Json property;        ///< null when absent
  std::string label;
  std::string description;
  Json type;            ///< raw type string (null when absent)
  FieldType kind = FieldType::kOther;
  std::string category = "none";
  std::string source;   ///< "exposes", "options" or "fallback"
  uint32_t access = 0;
  bool can_read = false;
  bool can_write = false;
  optional<double> value_min;
  optional<double> value_max;
  optional<double> value_step;
  Json unit;            ///< null when absent
  std::vector<std::string> values;
  Json value_on;        ///< null when absent
  Json value_off;       ///< null when absent
  Json presets = Json::array();
  Json item_type;       ///< normalized feature or null
  std::vector<SchemaField> features;
  std::string tab;      ///< empty for nested features
  std::string section;
};

struct SchemaModel {
  std::string source;   ///< "zigbee2mqtt_definition" or "fallback"
  optional<std::string> source_path;
  Json model;
  Json vendor;
  double generated_at = 0.0;
  std::vector<SchemaField> fields;
  std::vector<SchemaField> options;
};

/// Fields the presence UI shows first.
static const char* const kPresenceFields[] = {
    "mmwaveControlWiredDevice", "mmWaveRoomSizePreset",
    "mmWaveHoldTime",           "mmWaveDetectSensitivity",
    "mmWaveDetectTrigger",      "mmWaveTargetInfoReport",
    "mmWaveStayLife",           "mmWaveVersion",
};

static constexpr const char* kTargetReportField = "mmWaveTargetInfoReport";

namespace detail {

inline Json OptionalNumber(const optional<double>& v) {
  if (!v.has_value()) return Json();
  double d = *v;
  if (std::fabs(d) < 9.0e15 && d == std::floor(d)) {
    return Json(static_cast<int64_t>(d));
  }
  return Json(d);
}

inline std::string FormatNumber(double d) {
  char buf[64];
  if (std::fabs(d) < 9.0e15 && d == std::floor(d)) {
    (void)std::snprintf(buf, sizeof(buf), "%lld", static_cast<long long>(d));
  } else {
    (void)std::snprintf(buf, sizeof(buf), "%g", d);
  }
  return buf;
}

inline bool ContainsAny(const std::string& s,
                        std::initializer_list<const char*> keys) {
  for (const char* k : keys) {
    if (s.find(k) != std::string::npos) return true;
  }
  return false;
}

inline bool OneOf(const std::string& s,
                  std::initializer_list<const char*> keys) {
  for (const char* k : keys) {
    if (s == k) return true;
  }
  return false;
}

inline bool EndsWith(const std::string& s, const char* suffix) {
  std::string suf(suffix);
  return s.size() >= suf.size() &&
         s.compare(s.size() - suf.size(), suf.size(), suf) == 0;
}

inline std::string StringOr(const Json& obj, const char* key,
                            const std::string& fallback) {
  auto it = obj.find(key);
  if (it == obj.end() || !it->is_string()) return fallback;
  const std::string& s = it->get_ref<const std::string&>();
  return s.empty() ? fallback : s;
}

inline Json ValueOrNull(const Json& obj, const char* key) {
  auto it = obj.find(key);
  return (it == obj.end()) ? Json() : *it;
}

inline optional<double> NumberField(const Json& obj, const char* key) {
  auto it = obj.find(key);
  if (it == obj.end() || !it->is_number()) return nullopt;
  return it->get<double>();
}

}  // namespace detail

// ============================================================================
// Grouping Hints
// ============================================================================

/// @brief UI tab a top-level field belongs to.
inline std::string InferTab(const std::string& name,
                            const std::string& category) {
  if (name.empty()) return "Advanced";
  using detail::ContainsAny;
  using detail::OneOf;
  const std::string lname = ToLowerAscii(name);
  const std::string lcat = ToLowerAscii(category);

  if (lname.find("mmwave") != std::string::npos) {
    if (detail::EndsWith(lname, "_areas") || lname == "mmwave_control_commands") {
      return "Zones";
    }
    if (detail::EndsWith(lname, "occupancy") ||
        OneOf(name, {"occupancy", "illuminance"})) {
      return "Live";
    }
    return "Presence";
  }

  if (OneOf(lname, {"occupancy", "illuminance", "power", "voltage", "current",
                    "energy", "action", "linkquality", "area1occupancy",
                    "area2occupancy", "area3occupancy", "area4occupancy"})) {
    return "Live";
  }

  if (ContainsAny(lname, {"dimming", "ramprate", "defaultlevel",
                          "minimumlevel", "maximumlevel", "outputmode",
                          "quickstart", "autotimeroff",
                          "stateafterpowerrestored",
                          "loadlevelindicatortimeout", "switchtype",
                          "invertswitch", "smartbulbmode",
                          "bindingofftoonsynclevel",
                          "higheroutputinnonneutral"})) {
    return "Load & Dimming";
  }

  if (ContainsAny(lname, {"led", "notification"}) ||
      OneOf(lname, {"led_effect", "individual_led_effect",
                    "firmwareupdateinprogressindicator"})) {
    return "LED & Notifications";
  }

  if (ContainsAny(lname, {"tap", "button", "scene", "aux", "multitap",
                          "doubletap", "singletap", "held", "delay"})) {
    return "Buttons & Scenes";
  }

  if (OneOf(lname, {"identify", "energy_reset", "otaimagetype",
                    "localprotection", "remoteprotection", "powertype",
                    "internaltemperature", "overheat", "devicebindnumber",
                    "activepowerreports", "periodicpowerandenergyreports",
                    "activeenergyreports", "fancontrolmode", "fantimermode",
                    "lowlevelforfancontrolmode",
                    "mediumlevelforfancontrolmode",
                    "highlevelforfancontrolmode"}) ||
      ContainsAny(lname, {"calibration", "precision", "transition",
                          "identify_timeout", "state_action",
                          "illuminance_raw", "no_occupancy_since"})) {
    return "Power & Device";
  }

  if (lcat == "diagnostic") return "Live";
  return "Advanced";
}

/// @brief Section inside the tab returned by InferTab().
inline std::string InferSection(const std::string& name,
                                const std::string& category) {
  const std::string tab = InferTab(name, category);
  const std::string lname = ToLowerAscii(name);
  const std::string lcat = ToLowerAscii(category);

  if (tab == "Presence") {
    return (name == "mmWaveVersion") ? "Presence Diagnostics"
                                     : "Presence Controls";
  }
  if (tab == "Zones") return "Zone Definitions";
  if (tab == "Live") {
    return detail::OneOf(lname, {"action", "linkquality"}) ? "Live Diagnostics"
                                                           : "Live Sensors";
  }
  if (tab == "Load & Dimming") return "Load Behavior & Dimming";
  if (tab == "LED & Notifications") return "LED Effects & Notifications";
  if (tab == "Buttons & Scenes") return "Buttons & Scene Behavior";
  if (tab == "Power & Device") {
    if (detail::OneOf(lname, {"identify", "energy_reset"})) {
      return "Device Actions";
    }
    if (lcat == "diagnostic" ||
        detail::OneOf(lname, {"internaltemperature", "overheat",
                              "devicebindnumber", "linkquality", "action"})) {
      return "Diagnostics";
    }
    if (detail::ContainsAny(lname, {"calibration", "precision", "transition",
                                    "identify_timeout", "state_action",
                                    "illuminance_raw",
                                    "no_occupancy_since"})) {
      return "Runtime Options";
    }
    return "Power & Device Settings";
  }
  return "Advanced";
}

// ============================================================================
// Manifest Normalization
// ============================================================================

/**
 * @brief Normalize one manifest entry.
 * @param top_level  true for "exposes"/"options" entries (tab/section set).
 */
inline SchemaField NormalizeField(const Json& entry, const std::string& source,
                                  bool top_level) {
  SchemaField f;
  f.name = detail::StringOr(entry, "name", "");
  f.property = detail::ValueOrNull(entry, "property");
  f.label = detail::StringOr(entry, "label", f.name.empty() ? "Unknown" : f.name);
  f.description = detail::StringOr(entry, "description", "");
  f.type = detail::ValueOrNull(entry, "type");
  f.kind = f.type.is_string() ? ParseFieldType(f.type.get<std::string>())
                              : FieldType::kOther;
  f.source = source;

  auto access = entry.find("access");
  if (access != entry.end()) {
    optional<int32_t> a = AsIntOrNone(*access);
    if (a.has_value() && *a > 0) f.access = static_cast<uint32_t>(*a);
  }
  f.can_read = (f.access & (kAccessState | kAccessGet)) != 0;
  f.can_write = (f.access & kAccessSet) != 0;

  f.value_min = detail::NumberField(entry, "value_min");
  f.value_max = detail::NumberField(entry, "value_max");
  f.value_step = detail::NumberField(entry, "value_step");
  f.unit = detail::ValueOrNull(entry, "unit");

  auto values = entry.find("values");
  if (values != entry.end() && values->is_array()) {
    for (const auto& v : *values) {
      if (v.is_string()) f.values.push_back(v.get<std::string>());
    }
  }
  f.value_on = detail::ValueOrNull(entry, "value_on");
  f.value_off = detail::ValueOrNull(entry, "value_off");

  auto features = entry.find("features");
  if (features != entry.end() && features->is_array()) {
    for (const auto& child : *features) {
      if (child.is_object()) f.features.push_back(NormalizeField(child, source, false));
    }
  }

  if (top_level) {
    f.category = detail::StringOr(entry, "category", "none");
    auto presets = entry.find("presets");
    if (presets != entry.end() && presets->is_array()) f.presets = *presets;
    auto item = entry.find("item_type");
    if (item != entry.end() && item->is_object()) {
      SchemaField item_field = NormalizeField(*item, source, false);
      f.item_type = Json{{"name", item_field.name}, {"type", item_field.type}};
    }
    f.tab = InferTab(f.name, f.category);
    f.section = InferSection(f.name, f.category);
  }
  return f;
}

inline Json ToJson(const SchemaField& f) {
  Json values = Json::array();
  for (const auto& v : f.values) values.push_back(v);
  Json features = Json::array();
  for (const auto& child : f.features) features.push_back(ToJson(child));

  Json j = {{"name", f.name.empty() ? Json() : Json(f.name)},
            {"property", f.property},
            {"label", f.label},
            {"description", f.description},
            {"type", f.type},
            {"access", f.access},
            {"can_read", f.can_read},
            {"can_write", f.can_write},
            {"value_min", detail::OptionalNumber(f.value_min)},
            {"value_max", detail::OptionalNumber(f.value_max)},
            {"value_step", detail::OptionalNumber(f.value_step)},
            {"unit", f.unit},
            {"values", values},
            {"value_on", f.value_on},
            {"value_off", f.value_off},
            {"features", features}};
  if (!f.tab.empty()) {
    j["category"] = f.category;
    j["source"] = f.source;
    j["presets"] = f.presets;
    j["item_type"] = f.item_type;
    j["tab"] = f.tab;
    j["section"] = f.section;
  }
  return j;
}

inline Json ToJson(const SchemaModel& m) {
  Json fields = Json::array();
  for (const auto& f : m.fields) fields.push_back(ToJson(f));
  Json options = Json::array();
  for (const auto& f : m.options) options.push_back(ToJson(f));
  Json presence = Json::array();
  for (const char* name : kPresenceFields) presence.push_back(name);

  return Json{{"source", m.source},
              {"source_path", m.source_path.has_value() ? Json(*m.source_path)
                                                        : Json()},
              {"model", m.model},
              {"vendor", m.vendor},
              {"generated_at", m.generated_at},
              {"field_count", m.fields.size()},
              {"option_count", m.options.size()},
              {"fields", fields},
              {"options", options},
              {"mmwave_presence_fields", presence}};
}

// ============================================================================
// Built-in Manifest
// ============================================================================

namespace detail {

inline SchemaField FallbackEnum(const char* name, const char* label,
                                const char* description,
                                std::vector<std::string> values) {
  Json entry = {{"name", name},      {"property", name},
                {"label", label},    {"description", description},
                {"type", "enum"},    {"category", "config"},
                {"access", 7}};
  SchemaField f = NormalizeField(entry, "fallback", true);
  f.values = std::move(values);
  return f;
}

inline SchemaField FallbackNumeric(const char* name, const char* label,
                                   const char* description, uint32_t access,
                                   const char* unit, const char* category) {
  Json entry = {{"name", name},        {"property", name},
                {"label", label},      {"description", description},
                {"type", "numeric"},   {"category", category},
                {"access", access},    {"value_min", 0},
                {"value_max", 4294967295LL}, {"value_step", 1}};
  if (unit != nullptr) entry["unit"] = unit;
  return NormalizeField(entry, "fallback", true);
}

}  // namespace detail

/// @brief Presence fields of the VZM32-SN used when no manifest loads.
inline SchemaModel FallbackSchema(double generated_at) {
  SchemaModel m;
  m.source = "fallback";
  m.model = "VZM32-SN";
  m.vendor = "Inovelli";
  m.generated_at = generated_at;
  m.fields.push_back(detail::FallbackEnum(
      "mmwaveControlWiredDevice", "Wired Device Control",
      "Controls automatic on/off behavior using presence.",
      {"Disabled", "Occupancy (default)", "Vacancy", "Wasteful Occupancy",
       "Mirrored Occupancy", "Mirrored Vacancy",
       "Mirrored Wasteful Occupancy"}));
  m.fields.push_back(detail::FallbackEnum(
      "mmWaveRoomSizePreset", "Room Preset",
      "Predefined room dimensions for mmWave processing.",
      {"Custom", "Small", "Medium", "Large"}));
  m.fields.push_back(detail::FallbackEnum(
      "mmWaveDetectSensitivity", "Sensitivity",
      "The sensitivity of the mmWave sensor.",
      {"Low", "Medium", "High (default)"}));
  m.fields.push_back(detail::FallbackEnum(
      "mmWaveDetectTrigger", "Trigger Speed",
      "The time from detecting a person to triggering an action.",
      {"Slow (5s)", "Medium (1s)", "Fast (0.2s, default)"}));
  m.fields.push_back(detail::FallbackNumeric(
      "mmWaveHoldTime", "Hold Time",
      "Duration in seconds to hold occupancy after motion stops.", 7, "s",
      "config"));
  m.fields.push_back(detail::FallbackNumeric(
      "mmWaveStayLife", "Stay Life", "Stationary-presence timing parameter.",
      7, nullptr, "config"));
  m.fields.push_back(detail::FallbackEnum(
      kTargetReportField, "Target Reporting",
      "Enable raw target report stream when cluster binding is configured.",
      {"Disable (default)", "Enable"}));
  m.fields.push_back(detail::FallbackNumeric(
      "mmWaveVersion", "mmWave Version",
      "Firmware version of the mmWave module.", 5, nullptr, "none"));
  return m;
}

// ============================================================================
// ValidationResult
// ============================================================================

struct ValidationResult {
  bool ok = false;
  Json normalized;       ///< Value to publish (valid only when ok).
  std::string error;     ///< Human-readable reason (only when !ok).
  bool unknown_field = false;

  static ValidationResult Accept(Json value, bool unknown = false) {
    ValidationResult r;
    r.ok = true;
    r.normalized = std::move(value);
    r.unknown_field = unknown;
    return r;
  }

  static ValidationResult Reject(std::string reason) {
    ValidationResult r;
    r.error = std::move(reason);
    return r;
  }
};

// ============================================================================
// SchemaService
// ============================================================================

class SchemaService final {
 public:
  using ModelPtr = std::shared_ptr<const SchemaModel>;

  explicit SchemaService(std::vector<std::string> definition_paths = {},
                         const Clock& clock = SystemClock::Instance())
      : paths_(std::move(definition_paths)), clock_(clock) {
    Reload();
  }

  SchemaService(const SchemaService&) = delete;
  SchemaService& operator=(const SchemaService&) = delete;

  /// @brief Load the first usable manifest (or the built-in one).
  void Reload() {
    std::string error;
    auto model = std::make_shared<SchemaModel>(LoadFirst(error));
    auto index = std::make_shared<FieldIndex>();
    for (const auto& f : model->fields) {
      if (!f.name.empty()) (*index)[f.name] = &f;
    }
    for (const auto& f : model->options) {
      if (!f.name.empty()) (*index)[f.name] = &f;
    }

    MWB_LOG_INFO("Schema", "Schema loaded: source=%s path=%s fields=%zu",
                 model->source.c_str(),
                 model->source_path.has_value() ? model->source_path->c_str()
                                                : "-",
                 model->fields.size());

    std::lock_guard<std::mutex> lock(mutex_);
    model_ = model;
    index_ = index;
    load_error_ = error;
  }

  ModelPtr Model() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return model_;
  }

  /// @brief Exposed fields of the current manifest.
  std::vector<SchemaField> Fields() const { return Model()->fields; }

  Json ToJson() const { return mwb::ToJson(*Model()); }

  /// @brief Last manifest load error (empty when none).
  std::string LoadError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return load_error_;
  }

  /**
   * @brief Look up a field by name in exposes and options.
   * @return Copy of the field, or nullopt.
   */
  optional<SchemaField> FindField(const std::string& name) const {
    Snapshot snap = Take();
    auto it = snap.index->find(name);
    if (it == snap.index->end()) return nullopt;
    return *it->second;
  }

  /**
   * @brief Validate and normalize one write.
   *
   * Unknown fields pass through unchanged and are flagged, so new firmware
   * attributes stay writable before the manifest learns about them.
   */
  ValidationResult Validate(const std::string& name, const Json& value) const {
    Snapshot snap = Take();
    auto it = snap.index->find(name);
    if (it == snap.index->end()) {
      return ValidationResult::Accept(value, true);
    }
    const SchemaField& field = *it->second;
    if (!field.can_write) {
      return ValidationResult::Reject("Field '" + name + "' is read-only");
    }
    return Normalize(field, value);
  }

  /**
   * @brief Payload for "<topic>/get" asking the device for every readable
   *        exposed field, plus state and brightness.
   */
  Json BuildFullReadPayload() const {
    ModelPtr model = Model();
    Json payload = Json::object();
    for (const auto& f : model->fields) {
      if (f.name.empty() || !f.can_read) continue;
      payload[f.name] = "";
    }
    if (payload.empty()) {
      static const char* kMinimal[] = {
          "state",          "occupancy",           "illuminance",
          "mmWaveDepthMax", "mmWaveDepthMin",      "mmWaveWidthMax",
          "mmWaveWidthMin", "mmWaveHeightMax",     "mmWaveHeightMin",
          "mmWaveDetectSensitivity", "mmWaveDetectTrigger", "mmWaveHoldTime",
          "mmWaveStayLife", "mmWaveRoomSizePreset", "mmWaveTargetInfoReport",
          "mmWaveVersion",  "mmwaveControlWiredDevice"};
      for (const char* name : kMinimal) payload[name] = "";
    }
    payload["state"] = "";
    payload["brightness"] = "";
    return payload;
  }

  /**
   * @brief Pick the enum literal that turns a feature on or off.
   *
   * Prefers a declared value containing "enable" / "disable"; otherwise the
   * last (on) or first (off) declared value; "Enable" / "Disable (default)"
   * when the field is missing or declares no values.
   */
  std::string ResolveEnumToken(const std::string& field_name,
                               bool want_enabled) const {
    optional<SchemaField> field = FindField(field_name);
    if (!field.has_value() || field->values.empty()) {
      return want_enabled ? "Enable" : "Disable (default)";
    }
    const char* needle = want_enabled ? "enable" : "disable";
    for (const auto& v : field->values) {
      std::string lower = ToLowerAscii(v);
      if (lower.find(needle) == std::string::npos) continue;
      if (want_enabled && lower.find("disable") != std::string::npos) continue;
      return v;
    }
    return want_enabled ? field->values.back() : field->values.front();
  }

 private:
  using FieldIndex = std::map<std::string, const SchemaField*>;

  struct Snapshot {
    ModelPtr model;  ///< Keeps the index targets alive.
    std::shared_ptr<const FieldIndex> index;
  };

  Snapshot Take() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return Snapshot{model_, index_};
  }

  SchemaModel LoadFirst(std::string& error) const {
    for (const auto& path : paths_) {
      if (path.empty()) continue;
      optional<std::string> text = ReadWholeFile(path);
      if (!text.has_value()) continue;
      Json def = Json::parse(*text, nullptr, false);
      if (def.is_discarded() || !def.is_object()) {
        error = "Invalid manifest: " + path;
        MWB_LOG_WARN("Schema", "Manifest %s is not a JSON object",
                     path.c_str());
        continue;
      }
      error.clear();
      return BuildModel(def, path);
    }
    return FallbackSchema(clock_.WallSeconds());
  }

  static optional<std::string> ReadWholeFile(const std::string& path) {
    FILE* f = std::fopen(path.c_str(), "rb");
    if (f == nullptr) return nullopt;
    std::string data;
    char chunk[4096];
    size_t n = 0;
    while ((n = std::fread(chunk, 1, sizeof(chunk), f)) > 0) data.append(chunk, n);
    std::fclose(f);
    return data;
  }

  SchemaModel BuildModel(const Json& def, const std::string& path) const {
    SchemaModel m;
    m.source = "zigbee2mqtt_definition";
    m.source_path = path;
    m.model = detail::ValueOrNull(def, "model");
    m.vendor = detail::ValueOrNull(def, "vendor");
    m.generated_at = clock_.WallSeconds();

    auto exposes = def.find("exposes");
    if (exposes != def.end() && exposes->is_array()) {
      for (const auto& e : *exposes) {
        if (e.is_object()) m.fields.push_back(NormalizeField(e, "exposes", true));
      }
    }
    auto options = def.find("options");
    if (options != def.end() && options->is_array()) {
      for (const auto& e : *options) {
        if (e.is_object()) m.options.push_back(NormalizeField(e, "options", true));
      }
    }
    return m;
  }

  static ValidationResult Normalize(const SchemaField& field,
                                    const Json& value) {
    switch (field.kind) {
      case FieldType::kNumeric: return NormalizeNumeric(field, value);
      case FieldType::kEnum:    return NormalizeEnum(field, value);
      case FieldType::kBinary:  return NormalizeBinary(field, value);
      case FieldType::kComposite:
        if (!value.is_object()) {
          return ValidationResult::Reject("Composite value must be an object");
        }
        return ValidationResult::Accept(value);
      case FieldType::kList:
        if (!value.is_array()) {
          return ValidationResult::Reject("List value must be an array");
        }
        return ValidationResult::Accept(value);
      case FieldType::kOther:
        break;
    }
    return ValidationResult::Accept(value);
  }

  static ValidationResult NormalizeNumeric(const SchemaField& field,
                                           const Json& value) {
    optional<double> num = AsNumber(value);
    if (!num.has_value()) {
      return ValidationResult::Reject("Field '" + field.name +
                                      "' requires a numeric value");
    }
    if (field.value_min.has_value() && *num < *field.value_min) {
      return ValidationResult::Reject("Field '" + field.name +
                                      "' is below min " +
                                      detail::FormatNumber(*field.value_min));
    }
    if (field.value_max.has_value() && *num > *field.value_max) {
      return ValidationResult::Reject("Field '" + field.name +
                                      "' is above max " +
                                      detail::FormatNumber(*field.value_max));
    }
    bool integral_step = !field.value_step.has_value() ||
                         *field.value_step == std::floor(*field.value_step);
    if (integral_step) {
      // Ties round to even. 2^63 itself is not representable as int64_t.
      double rounded = std::nearbyint(*num);
      if (!(rounded >= -9223372036854775808.0 &&
            rounded < 9223372036854775808.0)) {
        return ValidationResult::Reject("Field '" + field.name +
                                        "' is out of range");
      }
      return ValidationResult::Accept(Json(static_cast<int64_t>(rounded)));
    }
    return ValidationResult::Accept(Json(*num));
  }

  static ValidationResult NormalizeEnum(const SchemaField& field,
                                        const Json& value) {
    if (!value.is_string()) {
      return ValidationResult::Reject("Field '" + field.name +
                                      "' requires an enum string");
    }
    const std::string& s = value.get_ref<const std::string&>();
    if (!field.values.empty()) {
      bool allowed = false;
      for (const auto& v : field.values) {
        if (v == s) {
          allowed = true;
          break;
        }
      }
      if (!allowed) {
        return ValidationResult::Reject("Field '" + field.name + "' value '" +
                                        s + "' is not allowed");
      }
    }
    return ValidationResult::Accept(value);
  }

  static ValidationResult NormalizeBinary(const SchemaField& field,
                                          const Json& value) {
    if (value.is_boolean()) return ValidationResult::Accept(value);

    Json on = field.value_on.is_null() ? Json(true) : field.value_on;
    Json off = field.value_off.is_null() ? Json(false) : field.value_off;

    if (value.is_string()) {
      std::string token = ToLowerAscii(TrimAscii(value.get<std::string>()));
      if (detail::OneOf(token, {"true", "1", "on", "yes"})) {
        return ValidationResult::Accept(on);
      }
      if (detail::OneOf(token, {"false", "0", "off", "no"})) {
        return ValidationResult::Accept(off);
      }
    }
    if (value == on || value == off) return ValidationResult::Accept(value);

    return ValidationResult::Reject("Field '" + field.name +
                                    "' requires a binary value");
  }

  std::vector<std::string> paths_;
  const Clock& clock_;
  mutable std::mutex mutex_;
  ModelPtr model_;
  std::shared_ptr<const FieldIndex> index_;
  std::string load_error_;
};

}  // namespace mwb

#endif  // MWB_SCHEMA_SERVICE_HPP_
