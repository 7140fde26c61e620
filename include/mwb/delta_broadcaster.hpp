/**
 * @file delta_broadcaster.hpp
 * @brief Fans registry changes out to sessions.
 *
 * Every mutation is announced twice: once under its legacy event name
 * ("zone_config", "new_data", ...) with a {topic, payload} body, and once as
 * a tagged "device_delta" {kind, topic, payload, ts}. Nothing is buffered;
 * a session that misses an event catches up on the next update or by
 * requesting a force sync.
 *
 * The broadcaster reads the registry through snapshots only and therefore
 * never holds a registry lock while emitting.
 */

#ifndef MWB_DELTA_BROADCASTER_HPP_
#define MWB_DELTA_BROADCASTER_HPP_

#include "mwb/device_registry.hpp"
#include "mwb/frame_decoder.hpp"
#include "mwb/json_util.hpp"
#include "mwb/platform.hpp"
#include "mwb/transport.hpp"

#include <string>
#include <utility>
#include <vector>

namespace mwb {

/// Event names of the session protocol.
namespace event {
static constexpr const char* kDeviceList = "device_list";
static constexpr const char* kDeviceDelta = "device_delta";
static constexpr const char* kDeviceSnapshot = "device_snapshot";
static constexpr const char* kDeviceConfig = "device_config";
static constexpr const char* kZoneConfig = "zone_config";
static constexpr const char* kNewData = "new_data";
static constexpr const char* kSchemaModel = "schema_model";
static constexpr const char* kCommandResult = "command_result";
static constexpr const char* kSelectedDevice = "selected_device";
}  // namespace event

class DeltaBroadcaster final {
 public:
  DeltaBroadcaster(const DeviceRegistry& registry, SessionChannel& channel,
                   const Clock& clock = SystemClock::Instance())
      : registry_(registry), channel_(channel), clock_(clock) {}

  DeltaBroadcaster(const DeltaBroadcaster&) = delete;
  DeltaBroadcaster& operator=(const DeltaBroadcaster&) = delete;

  /// device_list (array) followed by device_delta{kind:"device_list"}.
  void BroadcastDeviceList(const optional<SessionId>& target = nullopt) {
    Json devices = Json::array();
    for (const auto& record : registry_.Snapshot()) {
      devices.push_back(ToJson(record));
    }
    channel_.Emit(event::kDeviceList, devices, target);
    EmitDeviceDelta(event::kDeviceList, Json(), Json{{"devices", devices}},
                    target);
  }

  /// Legacy event named @p kind plus the tagged device_delta.
  void BroadcastDelta(const std::string& kind, const std::string& topic,
                      const Json& payload,
                      const optional<SessionId>& target = nullopt) {
    channel_.Emit(kind, Json{{"topic", topic}, {"payload", payload}}, target);
    EmitDeviceDelta(kind, Json(topic), payload, target);
  }

  /// Tagged delta only (used where no legacy event exists).
  void EmitDeviceDelta(const std::string& kind, const Json& topic,
                       const Json& payload,
                       const optional<SessionId>& target = nullopt) {
    channel_.Emit(event::kDeviceDelta,
                  Json{{"kind", kind},
                       {"topic", topic},
                       {"payload", payload},
                       {"ts", clock_.WallSeconds()}},
                  target);
  }

  /**
   * @brief device_snapshot carrying the whole record of @p topic.
   * @return false (and nothing emitted) when the topic is unknown.
   */
  bool BroadcastSnapshot(const std::string& topic,
                         const optional<SessionId>& target = nullopt) {
    optional<DeviceRecord> record = registry_.SnapshotByTopic(topic);
    if (!record.has_value()) return false;
    channel_.Emit(event::kDeviceSnapshot,
                  Json{{"topic", topic},
                       {"payload", ToJson(*record)},
                       {"ts", clock_.WallSeconds()}},
                  target);
    return true;
  }

  /**
   * @brief Bring one session up to date on @p topic: snapshot plus the
   *        legacy zone_config and zone-list events.
   */
  bool ReplayCachedState(const std::string& topic,
                         const optional<SessionId>& target) {
    optional<DeviceRecord> record = registry_.SnapshotByTopic(topic);
    if (!record.has_value()) return false;
    channel_.Emit(event::kDeviceSnapshot,
                  Json{{"topic", topic},
                       {"payload", ToJson(*record)},
                       {"ts", clock_.WallSeconds()}},
                  target);
    channel_.Emit(event::kZoneConfig,
                  Json{{"topic", topic}, {"payload", ToJson(record->zone_config)}},
                  target);
    for (ZoneKind kind :
         {ZoneKind::kInterference, ZoneKind::kDetection, ZoneKind::kStay}) {
      channel_.Emit(ZoneKindName(kind),
                    Json{{"topic", topic}, {"payload", ToJson(record->Zones(kind))}},
                    target);
    }
    return true;
  }

  // --- Typed helpers for the ingest path ---

  void BroadcastTargets(const std::string& topic, const Json& seq,
                        const std::vector<TargetInfo>& targets) {
    BroadcastDelta(event::kNewData, topic,
                   Json{{"seq", seq}, {"targets", ToJson(targets)}});
  }

  void BroadcastZones(const std::string& topic, ZoneKind kind,
                      const std::vector<Zone3D>& zones) {
    BroadcastDelta(ZoneKindName(kind), topic, ToJson(zones));
  }

  void BroadcastConfig(const std::string& topic, const Json& fields) {
    BroadcastDelta(event::kDeviceConfig, topic, fields);
  }

  void BroadcastZoneConfig(const std::string& topic, const ZoneRect& rect) {
    BroadcastDelta(event::kZoneConfig, topic, ToJson(rect));
  }

 private:
  const DeviceRegistry& registry_;
  SessionChannel& channel_;
  const Clock& clock_;
};

}  // namespace mwb

#endif  // MWB_DELTA_BROADCASTER_HPP_
