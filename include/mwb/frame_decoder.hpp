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
 * @file frame_decoder.hpp
 * @brief Classifier and decoder for ingest messages from mmWave switches.
 *
 * Ingest payloads are flat JSON objects. Semantic attributes arrive as named
 * keys; the vendor sensor protocol (manufacturer cluster 0xFC32) arrives as
 * a byte array spread over decimal-string keys "0", "1", "2", ...
 *
 * Raw frame layout (byte indices):
 *
 *   0..2   cluster signature 29 47 18
 *   3      sequence number
 *   4      command id  (1=target info, 2/3/4=interference/detection/stay)
 *   5      element count n
 *   6..    n elements
 *            target: x y z dop (int16 LE each), id (uint8)   =  9 bytes
 *            zone:   x_min x_max y_min y_max z_min z_max     = 12 bytes
 *
 * Decoding is pure: DecodeIngest() returns a description of the message and
 * never touches device state. A truncated or malformed raw frame is reported
 * as a FrameFault and contributes no elements at all.
 */

#ifndef MWB_FRAME_DECODER_HPP_
#define MWB_FRAME_DECODER_HPP_

#include "mwb/json_util.hpp"
#include "mwb/vocabulary.hpp"

#include <cstdint>
#include <cstdlib>
#include <string>
#include <variant>
#include <vector>

namespace mwb {

// ============================================================================
// Protocol Constants
// ============================================================================

static constexpr int32_t kClusterSignature[3] = {29, 47, 18};

static constexpr uint32_t kSeqIndex = 3;
static constexpr uint32_t kCommandIndex = 4;
static constexpr uint32_t kCountIndex = 5;
static constexpr uint32_t kFirstElementIndex = 6;

static constexpr uint32_t kTargetStride = 9;
static constexpr uint32_t kZoneStride = 12;

/// Indices above this bound are ignored (255 zones * 12 + header fits).
static constexpr uint32_t kMaxFrameIndex = 4095;

enum class FrameCommand : uint8_t {
  kTargetInfo = 1,
  kInterferenceZones = 2,
  kDetectionZones = 3,
  kStayZones = 4,
};

// ============================================================================
// Decoded Records
// ============================================================================

struct TargetInfo {
  int32_t id = 0;
  int32_t x = 0;
  int32_t y = 0;
  int32_t z = 0;
  int32_t dop = 0;  ///< Degree of presence (motion strength).
};

/// Standard 2-D detection envelope (attributes width/depth min/max).
struct ZoneRect {
  int32_t x_min = -400;
  int32_t x_max = 400;
  int32_t y_min = 0;
  int32_t y_max = 600;

  bool operator==(const ZoneRect& o) const noexcept {
    return x_min == o.x_min && x_max == o.x_max && y_min == o.y_min &&
           y_max == o.y_max;
  }
  bool operator!=(const ZoneRect& o) const noexcept { return !(*this == o); }
};

struct Zone3D {
  int32_t x_min = 0;
  int32_t x_max = 0;
  int32_t y_min = 0;
  int32_t y_max = 0;
  int32_t z_min = 0;
  int32_t z_max = 0;

  /// All six values zero: the device reports an unconfigured slot.
  bool IsUnset() const noexcept {
    return x_min == 0 && x_max == 0 && y_min == 0 && y_max == 0 &&
           z_min == 0 && z_max == 0;
  }

  bool operator==(const Zone3D& o) const noexcept {
    return x_min == o.x_min && x_max == o.x_max && y_min == o.y_min &&
           y_max == o.y_max && z_min == o.z_min && z_max == o.z_max;
  }
};

enum class ZoneKind : uint8_t {
  kInterference = 0,
  kDetection,
  kStay,
};

inline const char* ZoneKindName(ZoneKind kind) noexcept {
  switch (kind) {
    case ZoneKind::kInterference: return "interference_zones";
    case ZoneKind::kDetection:    return "detection_zones";
    case ZoneKind::kStay:         return "stay_zones";
  }
  return "?";
}

inline Json ToJson(const TargetInfo& t) {
  return Json{{"id", t.id}, {"x", t.x}, {"y", t.y}, {"z", t.z},
              {"dop", t.dop}};
}

inline Json ToJson(const ZoneRect& r) {
  return Json{{"x_min", r.x_min}, {"x_max", r.x_max},
              {"y_min", r.y_min}, {"y_max", r.y_max}};
}

inline Json ToJson(const Zone3D& z) {
  return Json{{"x_min", z.x_min}, {"x_max", z.x_max}, {"y_min", z.y_min},
              {"y_max", z.y_max}, {"z_min", z.z_min}, {"z_max", z.z_max}};
}

inline Json ToJson(const std::vector<Zone3D>& zones) {
  Json arr = Json::array();
  for (const auto& z : zones) arr.push_back(ToJson(z));
  return arr;
}

inline Json ToJson(const std::vector<TargetInfo>& targets) {
  Json arr = Json::array();
  for (const auto& t : targets) arr.push_back(ToJson(t));
  return arr;
}

// ============================================================================
// Raw Frame Results
// ============================================================================

enum class FrameFaultReason : uint8_t {
  kTruncated = 0,   ///< Key of an element's last byte is missing.
  kMalformed,       ///< Byte value not an integer in [0, 255], bad count.
  kUnsupported,     ///< Command id outside 1..4.
};

inline const char* FrameFaultReasonName(FrameFaultReason r) noexcept {
  switch (r) {
    case FrameFaultReason::kTruncated:   return "truncated";
    case FrameFaultReason::kMalformed:   return "malformed";
    case FrameFaultReason::kUnsupported: return "unsupported";
  }
  return "?";
}

struct TargetFrame {
  Json seq;  ///< Byte 3 as received (null when absent).
  std::vector<TargetInfo> targets;
};

struct ZoneFrame {
  ZoneKind kind = ZoneKind::kDetection;
  std::vector<Zone3D> zones;
};

struct FrameFault {
  Json command_id;
  FrameFaultReason reason = FrameFaultReason::kMalformed;
};

using RawFrame = std::variant<TargetFrame, ZoneFrame, FrameFault>;

// ============================================================================
// Signed 16-bit reconstruction
// ============================================================================

/// @brief Little-endian two's-complement 16-bit value from two bytes.
constexpr int32_t DecodeInt16Le(uint8_t low, uint8_t high) noexcept {
  int32_t raw = (static_cast<int32_t>(high) << 8) | static_cast<int32_t>(low);
  return (raw >= 32768) ? raw - 65536 : raw;
}

// ============================================================================
// ByteFrame - ordered view over the byte-indexed keys of one payload
// ============================================================================

/**
 * @brief Dense byte table built from the decimal-string keys of an object.
 *
 * Each slot is either absent, a valid byte, or invalid (present but not an
 * integer in [0, 255]). Keys beyond kMaxFrameIndex are ignored so a hostile
 * payload cannot force a large allocation.
 */
class ByteFrame {
 public:
  explicit ByteFrame(const Json& obj) {
    if (!obj.is_object()) return;
    for (auto it = obj.begin(); it != obj.end(); ++it) {
      const std::string& key = it.key();
      if (!IsByteIndexKey(key) || key.size() > 4) continue;
      if (key.size() > 1 && key[0] == '0') continue;
      uint32_t idx = static_cast<uint32_t>(std::strtoul(key.c_str(), nullptr, 10));
      if (idx > kMaxFrameIndex) continue;
      if (idx >= slots_.size()) slots_.resize(idx + 1, kAbsent);
      slots_[idx] = ToSlot(*it);
    }
  }

  bool Has(uint32_t idx) const noexcept {
    return idx < slots_.size() && slots_[idx] != kAbsent;
  }

  /// @brief Byte at @p idx; absent keys and JSON null read as zero.
  optional<uint8_t> Byte(uint32_t idx) const noexcept {
    if (!Has(idx)) return static_cast<uint8_t>(0);
    if (slots_[idx] == kInvalid) return nullopt;
    return static_cast<uint8_t>(slots_[idx]);
  }

  optional<int32_t> Int16At(uint32_t idx) const noexcept {
    optional<uint8_t> lo = Byte(idx);
    optional<uint8_t> hi = Byte(idx + 1);
    if (!lo.has_value() || !hi.has_value()) return nullopt;
    return DecodeInt16Le(*lo, *hi);
  }

 private:
  static constexpr int32_t kAbsent = -1;
  static constexpr int32_t kInvalid = -2;

  static int32_t ToSlot(const Json& v) {
    if (v.is_null()) return 0;
    if (v.is_boolean()) return kInvalid;
    optional<double> d = AsNumber(v);
    if (!d.has_value()) return kInvalid;
    if (*d < 0.0 || *d > 255.0) return kInvalid;
    if (*d != static_cast<double>(static_cast<int32_t>(*d))) return kInvalid;
    return static_cast<int32_t>(*d);
  }

  std::vector<int32_t> slots_;
};

// ============================================================================
// Element Decoders
// ============================================================================

/**
 * @brief Decode @p count targets starting at byte 6.
 * @return Targets, or kTruncated / kMalformed. Never a partial list.
 */
inline expected<std::vector<TargetInfo>, FrameFaultReason> DecodeTargets(
    const ByteFrame& frame, uint32_t count) {
  using Result = expected<std::vector<TargetInfo>, FrameFaultReason>;
  std::vector<TargetInfo> targets;
  targets.reserve(count);
  uint32_t offset = kFirstElementIndex;
  for (uint32_t k = 0; k < count; ++k, offset += kTargetStride) {
    if (!frame.Has(offset + 8)) {
      return Result::error(FrameFaultReason::kTruncated);
    }
    optional<int32_t> x = frame.Int16At(offset);
    optional<int32_t> y = frame.Int16At(offset + 2);
    optional<int32_t> z = frame.Int16At(offset + 4);
    optional<int32_t> dop = frame.Int16At(offset + 6);
    optional<uint8_t> id = frame.Byte(offset + 8);
    if (!x || !y || !z || !dop || !id) {
      return Result::error(FrameFaultReason::kMalformed);
    }
    TargetInfo t;
    t.id = *id;
    t.x = *x;
    t.y = *y;
    t.z = *z;
    t.dop = *dop;
    targets.push_back(t);
  }
  return Result::success(std::move(targets));
}

/**
 * @brief Decode @p count zones starting at byte 6, dropping unset slots.
 * @return Zones, or kTruncated / kMalformed. Never a partial list.
 */
inline expected<std::vector<Zone3D>, FrameFaultReason> DecodeZones(
    const ByteFrame& frame, uint32_t count) {
  using Result = expected<std::vector<Zone3D>, FrameFaultReason>;
  std::vector<Zone3D> zones;
  uint32_t offset = kFirstElementIndex;
  for (uint32_t k = 0; k < count; ++k, offset += kZoneStride) {
    if (!frame.Has(offset + 11)) {
      return Result::error(FrameFaultReason::kTruncated);
    }
    int32_t v[6];
    for (uint32_t i = 0; i < 6; ++i) {
      optional<int32_t> value = frame.Int16At(offset + 2 * i);
      if (!value.has_value()) {
        return Result::error(FrameFaultReason::kMalformed);
      }
      v[i] = *value;
    }
    Zone3D zone;
    zone.x_min = v[0];
    zone.x_max = v[1];
    zone.y_min = v[2];
    zone.y_max = v[3];
    zone.z_min = v[4];
    zone.z_max = v[5];
    if (!zone.IsUnset()) zones.push_back(zone);
  }
  return Result::success(std::move(zones));
}

// ============================================================================
// Raw Frame Decoder
// ============================================================================

/// @brief true when keys "0", "1", "2" carry the cluster signature.
inline bool HasClusterSignature(const Json& obj) {
  if (!obj.is_object()) return false;
  static const char* kKeys[3] = {"0", "1", "2"};
  for (uint32_t i = 0; i < 3; ++i) {
    auto it = obj.find(kKeys[i]);
    if (it == obj.end() || !it->is_number()) return false;
    if (it->get<double>() != static_cast<double>(kClusterSignature[i])) {
      return false;
    }
  }
  return true;
}

/**
 * @brief Decode the raw protocol part of an object.
 * @return nullopt when the object carries no cluster signature.
 */
inline optional<RawFrame> DecodeRawFrame(const Json& obj) {
  if (!HasClusterSignature(obj)) return nullopt;

  Json cmd_json = obj.value("4", Json());
  Json seq = obj.value("3", Json());

  FrameFault fault;
  fault.command_id = cmd_json;

  if (!cmd_json.is_number_integer()) {
    fault.reason = FrameFaultReason::kUnsupported;
    return RawFrame(fault);
  }
  int64_t cmd = cmd_json.get<int64_t>();
  if (cmd < static_cast<int64_t>(FrameCommand::kTargetInfo) ||
      cmd > static_cast<int64_t>(FrameCommand::kStayZones)) {
    fault.reason = FrameFaultReason::kUnsupported;
    return RawFrame(fault);
  }

  Json count_json = obj.value("5", Json(0));
  if (!count_json.is_number_integer() || count_json.get<int64_t>() < 0 ||
      count_json.get<int64_t>() > 255) {
    fault.reason = FrameFaultReason::kMalformed;
    return RawFrame(fault);
  }
  uint32_t count = static_cast<uint32_t>(count_json.get<int64_t>());

  ByteFrame frame(obj);

  if (cmd == static_cast<int64_t>(FrameCommand::kTargetInfo)) {
    auto targets = DecodeTargets(frame, count);
    if (!targets.has_value()) {
      fault.reason = targets.get_error();
      return RawFrame(fault);
    }
    TargetFrame tf;
    tf.seq = seq;
    tf.targets = std::move(targets).value();
    return RawFrame(std::move(tf));
  }

  auto zones = DecodeZones(frame, count);
  if (!zones.has_value()) {
    fault.reason = zones.get_error();
    return RawFrame(fault);
  }
  ZoneFrame zf;
  zf.kind = (cmd == static_cast<int64_t>(FrameCommand::kInterferenceZones))
                ? ZoneKind::kInterference
                : (cmd == static_cast<int64_t>(FrameCommand::kDetectionZones))
                      ? ZoneKind::kDetection
                      : ZoneKind::kStay;
  zf.zones = std::move(zones).value();
  return RawFrame(std::move(zf));
}

// ============================================================================
// Topic Helpers
// ============================================================================

/**
 * @brief Device name of a device topic "<base>/<name>".
 * @return nullopt for other topics, including "<base>/<name>/get".
 */
inline optional<std::string> DeviceNameFromTopic(const std::string& base,
                                                 const std::string& topic) {
  if (topic.size() <= base.size() + 1) return nullopt;
  if (topic.compare(0, base.size(), base) != 0) return nullopt;
  if (topic[base.size()] != '/') return nullopt;
  std::string name = topic.substr(base.size() + 1);
  if (name.empty() || name.find('/') != std::string::npos) return nullopt;
  return name;
}

inline std::string DeviceTopic(const std::string& base,
                               const std::string& name) {
  return base + "/" + name;
}

// ============================================================================
// Discovery Markers
// ============================================================================

static constexpr const char* kDiscoveryMarkerKeys[] = {
    "mmWaveVersion",
    "mmwaveControlWiredDevice",
    "mmWaveTargetInfoReport",
};

static constexpr const char* kDiscoveryMarkerPrefixes[] = {
    "mmWave",
};

inline bool IsDiscoveryMarkerKey(const std::string& key) {
  for (const char* exact : kDiscoveryMarkerKeys) {
    if (key == exact) return true;
  }
  for (const char* prefix : kDiscoveryMarkerPrefixes) {
    if (key.rfind(prefix, 0) == 0) return true;
  }
  return false;
}

inline bool HasDiscoveryMarker(const Json& obj) {
  if (!obj.is_object()) return false;
  for (auto it = obj.begin(); it != obj.end(); ++it) {
    if (IsDiscoveryMarkerKey(it.key())) return true;
  }
  return false;
}

// ============================================================================
// Ingest Classification
// ============================================================================

enum class DecodeError : uint8_t {
  kNotJsonObject = 0,
};

struct DecoderOptions {
  std::string base_topic = "zigbee2mqtt";
};

/**
 * @brief Everything the decoder learned from one transport message.
 *
 * device_name is set only for exact device topics. The raw and plain
 * branches are independent: both may be populated for one message.
 */
struct IngestMessage {
  std::string topic;
  optional<std::string> device_name;
  bool discovery_marker = false;
  optional<RawFrame> raw_frame;
  Json config_fields = Json::object();

  bool HasConfigFields() const noexcept { return !config_fields.empty(); }
};

/// @brief Semantic (non byte-index) keys of an object.
inline Json ExtractConfigFields(const Json& obj) {
  Json fields = Json::object();
  if (!obj.is_object()) return fields;
  for (auto it = obj.begin(); it != obj.end(); ++it) {
    if (!IsByteIndexKey(it.key())) fields[it.key()] = *it;
  }
  return fields;
}

/**
 * @brief Classify and decode one transport message.
 * @param topic   Transport topic the message arrived on.
 * @param payload Raw payload bytes.
 */
inline expected<IngestMessage, DecodeError> DecodeIngest(
    const std::string& topic, const std::string& payload,
    const DecoderOptions& options) {
  using Result = expected<IngestMessage, DecodeError>;
  optional<Json> obj = ParseJsonObject(TrimAscii(payload));
  if (!obj.has_value()) return Result::error(DecodeError::kNotJsonObject);

  IngestMessage msg;
  msg.topic = topic;
  msg.device_name = DeviceNameFromTopic(options.base_topic, topic);
  if (!msg.device_name.has_value()) return Result::success(std::move(msg));

  msg.discovery_marker = HasDiscoveryMarker(*obj);
  msg.raw_frame = DecodeRawFrame(*obj);
  msg.config_fields = ExtractConfigFields(*obj);
  return Result::success(std::move(msg));
}

}  // namespace mwb

#endif  // MWB_FRAME_DECODER_HPP_
