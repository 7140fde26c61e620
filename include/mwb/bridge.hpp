/**
 * @file bridge.hpp
 * @brief Composition root: wires the stores, the ingest path and the
 *        command path over the transport and session-channel seams.
 *
 * Usage:
 * @code
 *   mwb::LoopbackTransport transport;
 *   MyChannel channel;
 *   mwb::Bridge bridge(opts, transport, transport, channel);
 *   bridge.Start();
 *   bridge.OnSessionConnect("s1");
 *   bridge.OnSessionEvent("s1", "change_device", "zigbee2mqtt/office");
 * @endcode
 */

#ifndef MWB_BRIDGE_HPP_
#define MWB_BRIDGE_HPP_

#include "mwb/command_handler.hpp"
#include "mwb/config.hpp"
#include "mwb/delta_broadcaster.hpp"
#include "mwb/device_registry.hpp"
#include "mwb/ingest_pipeline.hpp"
#include "mwb/log.hpp"
#include "mwb/platform.hpp"
#include "mwb/schema_service.hpp"
#include "mwb/session_router.hpp"
#include "mwb/timer.hpp"
#include "mwb/transport.hpp"
#include "mwb/vocabulary.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace mwb {

enum class BridgeError : uint8_t {
  kAlreadyRunning = 0,
  kSubscribeFailed,
  kTimerFailed,
};

inline const char* BridgeErrorName(BridgeError e) noexcept {
  switch (e) {
    case BridgeError::kAlreadyRunning: return "already running";
    case BridgeError::kSubscribeFailed: return "subscribe failed";
    case BridgeError::kTimerFailed: return "timer failed";
  }
  return "unknown";
}

class Bridge final {
 public:
  Bridge(const BridgeOptions& options, Subscriber& subscriber,
         Publisher& publisher, SessionChannel& channel,
         const Clock& clock = SystemClock::Instance())
      : options_(options),
        subscriber_(subscriber),
        registry_(RegistryOptions{options.base_topic, options.target_throttle_ms},
                  clock),
        schema_(options.schema_paths, clock),
        broadcaster_(registry_, channel, clock),
        ingest_(registry_, broadcaster_),
        commands_(registry_, router_, schema_, broadcaster_, publisher, channel,
                  clock) {}

  ~Bridge() { Stop(); }

  Bridge(const Bridge&) = delete;
  Bridge& operator=(const Bridge&) = delete;

  /// Subscribe to "<base>/#" and start the periodic stale sweep.
  expected<void, BridgeError> Start() {
    using Result = expected<void, BridgeError>;
    if (subscription_.IsValid()) return Result::error(BridgeError::kAlreadyRunning);

    const std::string filter = options_.base_topic + "/#";
    subscription_ = subscriber_.Subscribe(
        filter, [this](const std::string& topic, const std::string& payload) {
          ingest_.OnMessage(topic, payload);
        });
    if (!subscription_.IsValid()) {
      MWB_LOG_ERROR("Bridge", "Subscribe to %s failed", filter.c_str());
      return Result::error(BridgeError::kSubscribeFailed);
    }

    auto task = timer_.Add(SweepPeriodMs(options_), &Bridge::SweepTick, this);
    if (!task.has_value() || !timer_.Start().has_value()) {
      MWB_LOG_ERROR("Bridge", "Sweep timer could not start");
      (void)subscriber_.Unsubscribe(subscription_);
      subscription_ = SubscriptionHandle::Invalid();
      if (task.has_value()) (void)timer_.Remove(task.value());
      return Result::error(BridgeError::kTimerFailed);
    }
    sweep_task_ = task.value();

    MWB_LOG_INFO("Bridge", "Started: filter=%s sweep=%us stale=%.0fs",
                 filter.c_str(), options_.sweep_interval_s,
                 options_.stale_after_s);
    return Result::success();
  }

  void Stop() {
    if (!subscription_.IsValid()) return;
    timer_.Stop();
    (void)timer_.Remove(sweep_task_);
    (void)subscriber_.Unsubscribe(subscription_);
    subscription_ = SubscriptionHandle::Invalid();
    MWB_LOG_INFO("Bridge", "Stopped");
  }

  bool IsRunning() const noexcept { return subscription_.IsValid(); }

  // --- Session entry points ---

  void OnSessionConnect(const SessionId& sid) { commands_.OnConnect(sid); }

  void OnSessionDisconnect(const SessionId& sid) { commands_.OnDisconnect(sid); }

  bool OnSessionEvent(const SessionId& sid, const std::string& name,
                      const Json& data = Json()) {
    return commands_.Dispatch(sid, name, data);
  }

  /// Transport message entry point (also reachable through the subscription).
  IngestReport OnMessage(const std::string& topic, const std::string& payload) {
    return ingest_.OnMessage(topic, payload);
  }

  /**
   * @brief Evict stale devices now; one device_list goes out when anything
   *        was removed.
   * @return Number of evicted devices.
   */
  uint32_t SweepNow() {
    std::vector<std::string> removed = registry_.SweepStale(options_.stale_after_s);
    if (!removed.empty()) broadcaster_.BroadcastDeviceList();
    return static_cast<uint32_t>(removed.size());
  }

  const DeviceRegistry& Registry() const noexcept { return registry_; }
  const SessionRouter& Router() const noexcept { return router_; }
  SchemaService& Schema() noexcept { return schema_; }
  const BridgeOptions& Options() const noexcept { return options_; }

 private:
  static void SweepTick(void* ctx) {
    static_cast<Bridge*>(ctx)->SweepNow();
  }

  BridgeOptions options_;
  Subscriber& subscriber_;
  DeviceRegistry registry_;
  SessionRouter router_;
  SchemaService schema_;
  DeltaBroadcaster broadcaster_;
  IngestPipeline ingest_;
  CommandHandler commands_;
  TimerScheduler<4> timer_;
  SubscriptionHandle subscription_ = SubscriptionHandle::Invalid();
  TimerTaskId sweep_task_;
};

}  // namespace mwb

#endif  // MWB_BRIDGE_HPP_
