// Copyright (c) 2024 liudegui. MIT License.
//
// Bridge demo: a simulated mmWave switch on the loopback transport and one
// session printing every event it receives.
// Usage: mwb_bridge_demo [config.json|.ini|.yaml]

#include "mwb/bridge.hpp"
#include "mwb/config.hpp"
#include "mwb/log.hpp"
#include "mwb/transport.hpp"

#include <cstdint>
#include <cstdio>
#include <mutex>
#include <string>
#include <vector>

// ============================================================================
// Console session channel
// ============================================================================

class ConsoleChannel final : public mwb::SessionChannel {
 public:
  void Emit(const std::string& event, const mwb::Json& payload,
            const mwb::optional<mwb::SessionId>& target) override {
    std::string body = mwb::DumpJson(payload);
    if (body.size() > 160) body = body.substr(0, 157) + "...";
    std::lock_guard<std::mutex> lock(mutex_);
    (void)std::printf("  -> [%s] %-18s %s\n",
                      target.has_value() ? target->c_str() : "*",
                      event.c_str(), body.c_str());
  }

 private:
  std::mutex mutex_;
};

// ============================================================================
// Simulated device traffic
// ============================================================================

static void PutInt16(mwb::Json& frame, uint32_t idx, int32_t v) {
  uint16_t u = static_cast<uint16_t>(v & 0xFFFF);
  frame[std::to_string(idx)] = u & 0xFF;
  frame[std::to_string(idx + 1)] = (u >> 8) & 0xFF;
}

static mwb::Json Header(uint32_t cmd, uint32_t count, uint32_t seq) {
  return mwb::Json{{"0", 29}, {"1", 47}, {"2", 18},
                   {"3", seq}, {"4", cmd}, {"5", count}};
}

static std::string TargetFrame(uint32_t seq, int32_t x, int32_t y) {
  mwb::Json f = Header(1, 1, seq);
  PutInt16(f, 6, x);
  PutInt16(f, 8, y);
  PutInt16(f, 10, 0);
  PutInt16(f, 12, 40);
  f["14"] = 1;
  return f.dump();
}

static std::string DetectionFrame() {
  mwb::Json f = Header(3, 1, 2);
  const int32_t zone[6] = {-150, 150, 0, 300, -100, 250};
  for (uint32_t i = 0; i < 6; ++i) PutInt16(f, 6 + i * 2, zone[i]);
  return f.dump();
}

static mwb::BridgeOptions LoadOptions(int argc, char* argv[]) {
  if (argc < 2) return mwb::BridgeOptions();
  mwb::BridgeConfig cfg;
  auto r = cfg.LoadFile(argv[1]);
  if (!r.has_value()) {
    MWB_LOG_WARN("main", "using defaults (%s)", mwb::ConfigErrorName(r.get_error()));
    return mwb::BridgeOptions();
  }
  MWB_LOG_INFO("main", "loaded %u config entries from %s", cfg.EntryCount(),
               argv[1]);
  return mwb::LoadBridgeOptions(cfg);
}

int main(int argc, char* argv[]) {
  mwb::log::Init();
  mwb::BridgeOptions opts = LoadOptions(argc, argv);
  mwb::log::SetLevel(opts.log_level);
  MWB_LOG_INFO("main", "=== mmWave Bridge Demo ===");
  MWB_LOG_INFO("main", "broker=%s:%u base=%s", opts.mqtt_broker.c_str(),
               static_cast<unsigned>(opts.mqtt_port), opts.base_topic.c_str());

  mwb::LoopbackTransport transport;
  ConsoleChannel channel;
  mwb::Bridge bridge(opts, transport, transport, channel);

  auto started = bridge.Start();
  if (!started.has_value()) {
    MWB_LOG_ERROR("main", "bridge start failed: %s",
                  mwb::BridgeErrorName(started.get_error()));
    mwb::log::Shutdown();
    return 1;
  }

  const std::string topic = opts.base_topic + "/Office Switch";

  (void)std::printf("--- device announces itself ---\n");
  transport.Deliver(topic, R"({"mmWaveVersion": 3, "state": "ON", "brightness": 80})");

  (void)std::printf("--- session connects and selects the device ---\n");
  bridge.OnSessionConnect("operator-1");
  bridge.OnSessionEvent("operator-1", "change_device", mwb::Json(topic));

  (void)std::printf("--- live traffic ---\n");
  transport.Deliver(topic, DetectionFrame());
  transport.Deliver(topic, TargetFrame(1, 35, 180));
  transport.Deliver(topic, TargetFrame(2, 36, 182));  // throttled
  transport.Deliver(topic, R"({"mmWaveWidthMin": -250, "mmWaveWidthMax": 250})");

  (void)std::printf("--- commands ---\n");
  bridge.OnSessionEvent("operator-1", "update_parameter",
                        mwb::Json{{"param", "mmWaveHoldTime"}, {"value", 45},
                                  {"request_id", "r-1"}});
  bridge.OnSessionEvent("operator-1", "update_parameter",
                        mwb::Json{{"param", "mmWaveHoldTime"}, {"value", -5}});
  bridge.OnSessionEvent("operator-1", "send_command", mwb::Json(2));
  bridge.OnSessionEvent("operator-1", "set_basic_control",
                        mwb::Json{{"state", "toggle"}, {"brightness", 300}});
  bridge.OnSessionEvent("operator-1", "set_reporting_auto_off",
                        mwb::Json{{"enabled", true}});

  (void)std::printf("--- session leaves ---\n");
  bridge.OnSessionDisconnect("operator-1");

  std::vector<mwb::LoopbackTransport::Message> published = transport.Published();
  (void)std::printf("--- %zu messages published to the broker ---\n",
                    published.size());
  for (const auto& m : published) {
    (void)std::printf("  %s %s\n", m.topic.c_str(), m.payload.c_str());
  }

  bridge.Stop();
  MWB_LOG_INFO("main", "done");
  mwb::log::Shutdown();
  return 0;
}
