/**
 * @file ingest_pipeline.hpp
 * @brief Transport message callback: decode, mutate the registry, broadcast.
 *
 * Per message:
 *   1. Not a JSON object                 -> rejected.
 *   2. Topic is not "<base>/<name>"      -> ignored.
 *   3. Discovery marker present          -> create the record; a new device
 *                                           triggers one device_list.
 *   4. Device unknown                    -> ignored.
 *   5. Known device: refresh last_seen, then the raw-frame branch and the
 *      plain-config branch, each independently.
 *
 * Each message is isolated: a failure in one never affects the next.
 */

#ifndef MWB_INGEST_PIPELINE_HPP_
#define MWB_INGEST_PIPELINE_HPP_

#include "mwb/delta_broadcaster.hpp"
#include "mwb/device_registry.hpp"
#include "mwb/frame_decoder.hpp"
#include "mwb/log.hpp"

#include <string>
#include <type_traits>
#include <variant>

namespace mwb {

/// What one message did; mostly for tests and tracing.
struct IngestReport {
  bool rejected = false;        ///< Not a JSON object.
  bool device_message = false;  ///< Exact topic of a known device.
  bool discovered = false;      ///< A new record was created.
  bool targets_broadcast = false;
  bool zones_applied = false;
  bool frame_fault = false;     ///< Raw frame discarded.
  bool config_applied = false;
  bool zone_config_changed = false;
};

class IngestPipeline final {
 public:
  IngestPipeline(DeviceRegistry& registry, DeltaBroadcaster& broadcaster)
      : registry_(registry), broadcaster_(broadcaster) {
    options_.base_topic = registry.BaseTopic();
  }

  IngestPipeline(const IngestPipeline&) = delete;
  IngestPipeline& operator=(const IngestPipeline&) = delete;

  IngestReport OnMessage(const std::string& topic, const std::string& payload) {
    IngestReport report;
    auto decoded = DecodeIngest(topic, payload, options_);
    if (!decoded.has_value()) {
      MWB_LOG_DEBUG("Ingest", "Dropped non-object payload on %s", topic.c_str());
      report.rejected = true;
      return report;
    }
    const IngestMessage& msg = decoded.value();
    if (!msg.device_name.has_value()) return report;
    const std::string& name = *msg.device_name;

    if (msg.discovery_marker) {
      auto created = registry_.Discover(topic);
      if (created.has_value() && created.value()) {
        report.discovered = true;
        broadcaster_.BroadcastDeviceList();
      }
    }

    if (!registry_.Touch(name)) return report;
    report.device_message = true;

    if (msg.raw_frame.has_value()) {
      std::visit([&](const auto& frame) { HandleFrame(topic, name, frame, report); },
                 *msg.raw_frame);
    }

    if (msg.HasConfigFields()) {
      broadcaster_.BroadcastConfig(topic, msg.config_fields);
      ConfigUpdateOutcome outcome =
          registry_.ApplyConfigUpdate(name, msg.config_fields);
      report.config_applied = outcome.found;
      if (outcome.zone_config_changed) {
        report.zone_config_changed = true;
        broadcaster_.BroadcastZoneConfig(topic, outcome.zone_config);
      }
    }
    return report;
  }

  const std::string& BaseTopic() const noexcept { return options_.base_topic; }

 private:
  void HandleFrame(const std::string& topic, const std::string& name,
                   const TargetFrame& frame, IngestReport& report) {
    if (!registry_.ApplyTargetFrame(name, frame.seq, frame.targets)) return;
    report.targets_broadcast = true;
    broadcaster_.BroadcastTargets(topic, frame.seq, frame.targets);
  }

  void HandleFrame(const std::string& topic, const std::string& name,
                   const ZoneFrame& frame, IngestReport& report) {
    if (!registry_.ApplyZoneFrame(name, frame.kind, frame.zones)) return;
    report.zones_applied = true;
    MWB_LOG_DEBUG("Ingest", "%s: %s updated (%zu zones)", name.c_str(),
                  ZoneKindName(frame.kind), frame.zones.size());
    broadcaster_.BroadcastZones(topic, frame.kind, frame.zones);
  }

  void HandleFrame(const std::string& topic, const std::string& name,
                   const FrameFault& fault, IngestReport& report) {
    (void)topic;
    report.frame_fault = true;
    std::string cmd = DumpJson(fault.command_id);
    MWB_LOG_DEBUG("Ingest", "%s: discarded raw frame cmd=%s (%s)", name.c_str(),
                  cmd.c_str(), FrameFaultReasonName(fault.reason));
  }

  DeviceRegistry& registry_;
  DeltaBroadcaster& broadcaster_;
  DecoderOptions options_;
};

}  // namespace mwb

#endif  // MWB_INGEST_PIPELINE_HPP_
