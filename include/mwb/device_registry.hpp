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
 * @file device_registry.hpp
 * @brief Thread-safe store of per-device state with discovery and eviction.
 *
 * One mutex guards the whole store. Every operation holds it for its own
 * duration only and never calls out while holding it; readers receive deep
 * copies (Snapshot / SnapshotByTopic) that stay valid after later mutation.
 *
 * Time is read from an injected Clock:
 *   - MonotonicMs() drives the per-device target-frame throttle
 *   - WallSeconds() drives last_seen and SweepStale()
 */

#ifndef MWB_DEVICE_REGISTRY_HPP_
#define MWB_DEVICE_REGISTRY_HPP_

#include "mwb/frame_decoder.hpp"
#include "mwb/json_util.hpp"
#include "mwb/log.hpp"
#include "mwb/platform.hpp"
#include "mwb/vocabulary.hpp"

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace mwb {

// ============================================================================
// Registry Error
// ============================================================================

enum class RegistryError : uint8_t {
  kInvalidTopic = 0,
};

// ============================================================================
// DeviceRecord
// ============================================================================

struct DeviceRecord {
  std::string name;
  std::string topic;
  ZoneRect zone_config;
  std::vector<Zone3D> interference_zones;
  std::vector<Zone3D> detection_zones;
  std::vector<Zone3D> stay_zones;
  Json last_config = Json::object();
  optional<uint64_t> last_update_ms;  ///< Last accepted target frame.
  double last_seen = 0.0;             ///< Wall-clock seconds.

  const std::vector<Zone3D>& Zones(ZoneKind kind) const noexcept {
    switch (kind) {
      case ZoneKind::kInterference: return interference_zones;
      case ZoneKind::kDetection:    return detection_zones;
      case ZoneKind::kStay:         break;
    }
    return stay_zones;
  }

  std::vector<Zone3D>& Zones(ZoneKind kind) noexcept {
    return const_cast<std::vector<Zone3D>&>(
        static_cast<const DeviceRecord&>(*this).Zones(kind));
  }
};

/// @brief Session-facing view of a record (device_list entries, snapshots).
inline Json ToJson(const DeviceRecord& d) {
  return Json{{"friendly_name", d.name},
              {"topic", d.topic},
              {"zone_config", ToJson(d.zone_config)},
              {"interference_zones", ToJson(d.interference_zones)},
              {"detection_zones", ToJson(d.detection_zones)},
              {"stay_zones", ToJson(d.stay_zones)},
              {"last_config", d.last_config},
              {"last_seen", d.last_seen}};
}

// ============================================================================
// ConfigUpdateOutcome
// ============================================================================

struct ConfigUpdateOutcome {
  bool found = false;                ///< Device exists.
  bool zone_config_changed = false;  ///< A width/depth attribute applied.
  ZoneRect zone_config;              ///< Envelope after the update.
};

/// Attribute names of the standard detection envelope.
static constexpr const char* kWidthMinField = "mmWaveWidthMin";
static constexpr const char* kWidthMaxField = "mmWaveWidthMax";
static constexpr const char* kDepthMinField = "mmWaveDepthMin";
static constexpr const char* kDepthMaxField = "mmWaveDepthMax";

// ============================================================================
// DeviceRegistry
// ============================================================================

struct RegistryOptions {
  std::string base_topic = "zigbee2mqtt";
  uint32_t target_throttle_ms = 100;
};

class DeviceRegistry final {
 public:
  explicit DeviceRegistry(const RegistryOptions& options = {},
                          const Clock& clock = SystemClock::Instance())
      : options_(options), clock_(clock) {}

  DeviceRegistry(const DeviceRegistry&) = delete;
  DeviceRegistry& operator=(const DeviceRegistry&) = delete;

  /**
   * @brief Register the device behind @p topic, or refresh its last_seen.
   * @return true when a new record was created, false when it existed,
   *         kInvalidTopic when @p topic is not "<base>/<name>".
   */
  expected<bool, RegistryError> Discover(const std::string& topic) {
    optional<std::string> name = DeviceNameFromTopic(options_.base_topic, topic);
    if (!name.has_value()) {
      return expected<bool, RegistryError>::error(RegistryError::kInvalidTopic);
    }

    double now = clock_.WallSeconds();
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = devices_.find(*name);
      if (it != devices_.end()) {
        it->second.last_seen = now;
        return expected<bool, RegistryError>::success(false);
      }
      DeviceRecord rec;
      rec.name = *name;
      rec.topic = DeviceTopic(options_.base_topic, *name);
      rec.last_seen = now;
      devices_.emplace(*name, std::move(rec));
    }
    MWB_LOG_INFO("Registry", "Discovered device: %s", name->c_str());
    return expected<bool, RegistryError>::success(true);
  }

  /// @brief Refresh last_seen. @return false if @p name is unknown.
  bool Touch(const std::string& name) {
    double now = clock_.WallSeconds();
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = devices_.find(name);
    if (it == devices_.end()) return false;
    it->second.last_seen = now;
    return true;
  }

  /**
   * @brief Admit a target frame through the per-device throttle.
   *
   * Target data is not stored; only the throttle timestamp advances.
   * @return true when the frame should be broadcast.
   */
  bool ApplyTargetFrame(const std::string& name, const Json& /*seq*/,
                        const std::vector<TargetInfo>& /*targets*/) {
    uint64_t now = clock_.MonotonicMs();
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = devices_.find(name);
    if (it == devices_.end()) return false;
    DeviceRecord& rec = it->second;
    if (rec.last_update_ms.has_value() &&
        now - *rec.last_update_ms < options_.target_throttle_ms) {
      return false;
    }
    rec.last_update_ms = now;
    return true;
  }

  /// @brief Replace one zone list wholesale. @return false if unknown.
  bool ApplyZoneFrame(const std::string& name, ZoneKind kind,
                      const std::vector<Zone3D>& zones) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = devices_.find(name);
    if (it == devices_.end()) return false;
    it->second.Zones(kind) = zones;
    return true;
  }

  /**
   * @brief Merge semantic fields into last_config and track the envelope.
   *
   * Width/depth attributes that do not parse as integers leave their
   * component untouched; the rest of the update still applies.
   */
  ConfigUpdateOutcome ApplyConfigUpdate(const std::string& name,
                                        const Json& fields) {
    ConfigUpdateOutcome out;
    if (!fields.is_object()) return out;

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = devices_.find(name);
    if (it == devices_.end()) return out;
    DeviceRecord& rec = it->second;
    out.found = true;

    if (!rec.last_config.is_object()) rec.last_config = Json::object();
    rec.last_config.update(fields);

    ZoneRect zone = rec.zone_config;
    out.zone_config_changed |= ApplyEnvelopeField(fields, kWidthMinField, zone.x_min);
    out.zone_config_changed |= ApplyEnvelopeField(fields, kWidthMaxField, zone.x_max);
    out.zone_config_changed |= ApplyEnvelopeField(fields, kDepthMinField, zone.y_min);
    out.zone_config_changed |= ApplyEnvelopeField(fields, kDepthMaxField, zone.y_max);
    if (out.zone_config_changed) rec.zone_config = zone;
    out.zone_config = rec.zone_config;
    return out;
  }

  /// @brief Deep copy of every record, ordered by name.
  std::vector<DeviceRecord> Snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<DeviceRecord> out;
    out.reserve(devices_.size());
    for (const auto& kv : devices_) out.push_back(kv.second);
    return out;
  }

  /// @brief Deep copy of the record whose topic equals @p topic.
  optional<DeviceRecord> SnapshotByTopic(const std::string& topic) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& kv : devices_) {
      if (kv.second.topic == topic) return kv.second;
    }
    return nullopt;
  }

  /// @brief Name of the device whose topic equals @p topic.
  optional<std::string> FindNameByTopic(const std::string& topic) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& kv : devices_) {
      if (kv.second.topic == topic) return kv.first;
    }
    return nullopt;
  }

  bool Contains(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return devices_.find(name) != devices_.end();
  }

  /**
   * @brief Remove every record silent for more than @p max_age_s seconds.
   * @return Names of removed devices (empty when nothing was stale).
   */
  std::vector<std::string> SweepStale(double max_age_s) {
    double now = clock_.WallSeconds();
    std::vector<std::string> removed;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      for (auto it = devices_.begin(); it != devices_.end();) {
        if (now - it->second.last_seen > max_age_s) {
          removed.push_back(it->first);
          it = devices_.erase(it);
        } else {
          ++it;
        }
      }
    }
    for (const auto& name : removed) {
      MWB_LOG_INFO("Registry", "Evicted stale device: %s", name.c_str());
    }
    return removed;
  }

  uint32_t Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<uint32_t>(devices_.size());
  }

  const std::string& BaseTopic() const noexcept { return options_.base_topic; }

 private:
  static bool ApplyEnvelopeField(const Json& fields, const char* key,
                                 int32_t& component) {
    auto it = fields.find(key);
    if (it == fields.end()) return false;
    optional<int32_t> v = AsIntOrNone(*it);
    if (!v.has_value()) return false;
    component = *v;
    return true;
  }

  RegistryOptions options_;
  const Clock& clock_;
  mutable std::mutex mutex_;
  std::map<std::string, DeviceRecord> devices_;
};

}  // namespace mwb

#endif  // MWB_DEVICE_REGISTRY_HPP_
