/**
 * @file test_command_handler.cpp
 * @brief Tests for command_handler.hpp
 */

#include "mwb/command_handler.hpp"
#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using mwb_test::Json;

namespace {

const char* kA = "zigbee2mqtt/A";
const char* kB = "zigbee2mqtt/B";

struct Fixture {
  mwb_test::ManualClock clock;
  mwb::DeviceRegistry registry{mwb::RegistryOptions{}, clock};
  mwb::SessionRouter router;
  mwb::SchemaService schema{{}, clock};
  mwb_test::RecordingChannel channel;
  mwb::DeltaBroadcaster broadcaster{registry, channel, clock};
  mwb::LoopbackTransport bus;
  mwb::CommandHandler handler{registry, router, schema, broadcaster,
                              bus,      channel, clock};

  Fixture() {
    REQUIRE(registry.Discover(kA).has_value());
    REQUIRE(registry.Discover(kB).has_value());
  }

  void Watch(const std::string& sid, const std::string& topic) {
    handler.OnConnect(sid);
    REQUIRE(handler.Dispatch(sid, "change_device", Json(topic)));
  }

  /// The only command_result of @p action; fails when there is not exactly one.
  Json OnlyResult(const std::string& action) {
    auto results = channel.Results(action);
    REQUIRE(results.size() == 1);
    return results[0].payload;
  }

  Json PublishedBody(size_t i) const {
    return Json::parse(bus.Published().at(i).payload);
  }
};

}  // namespace

// ============================================================================
// Session lifecycle and queries
// ============================================================================

TEST_CASE("Connect sends the schema to that session", "[cmd][session]") {
  Fixture fx;
  fx.handler.OnConnect("s1");
  auto schema = fx.channel.Named("schema_model");
  REQUIRE(schema.size() == 1);
  REQUIRE(schema[0].target.value() == "s1");
  REQUIRE(schema[0].payload["field_count"] == 8);
  REQUIRE(fx.router.SessionCount() == 1);

  REQUIRE(fx.handler.Dispatch("s1", "request_devices", Json()));
  auto list = fx.channel.Named("device_list");
  REQUIRE(list.size() == 1);
  REQUIRE(list[0].target.value() == "s1");
  REQUIRE(list[0].payload.size() == 2);
}

TEST_CASE("change_device selects, announces and replays", "[cmd][select]") {
  Fixture fx;
  fx.handler.OnConnect("s1");
  fx.channel.Clear();

  REQUIRE(fx.handler.Dispatch("s1", "change_device", Json(kA)));
  REQUIRE(fx.router.CurrentTopic("s1").value() == kA);
  auto selected = fx.channel.Deltas("selected_device");
  REQUIRE(selected.size() == 1);
  REQUIRE(selected[0].target.value() == "s1");
  REQUIRE(selected[0].payload["payload"]["topic"] == kA);
  REQUIRE(fx.channel.Count("device_snapshot") == 1);
  REQUIRE(fx.channel.Count("stay_zones") == 1);
}

TEST_CASE("change_device edge cases", "[cmd][select]") {
  Fixture fx;
  fx.Watch("s1", kA);
  fx.channel.Clear();

  fx.handler.Dispatch("s1", "change_device", Json("other/A"));
  fx.handler.Dispatch("s1", "change_device", Json(42));
  auto errors = fx.channel.Results("change_device");
  REQUIRE(errors.size() == 2);
  REQUIRE(errors[0].payload["message"] == "Invalid device topic");
  REQUIRE(errors[1].payload["payload"]["topic"] == 42);
  REQUIRE(fx.router.CurrentTopic("s1").value() == kA);

  // Device-shaped but unknown: selected, nothing to replay.
  fx.channel.Clear();
  fx.handler.Dispatch("s1", "change_device", Json("zigbee2mqtt/Ghost"));
  REQUIRE(fx.router.CurrentTopic("s1").value() == "zigbee2mqtt/Ghost");
  REQUIRE(fx.channel.Count("device_snapshot") == 0);

  fx.handler.Dispatch("s1", "change_device", Json());
  REQUIRE_FALSE(fx.router.CurrentTopic("s1").has_value());
  fx.handler.Dispatch("s1", "change_device", Json("zigbee2mqtt/A"));
  fx.handler.Dispatch("s1", "change_device", Json(""));
  REQUIRE_FALSE(fx.router.CurrentTopic("s1").has_value());
}

TEST_CASE("Unknown events answer with an error", "[cmd]") {
  Fixture fx;
  fx.handler.OnConnect("s1");
  REQUIRE_FALSE(fx.handler.Dispatch("s1", "launch_rockets", Json{{"request_id", 9}}));
  Json r = fx.OnlyResult("launch_rockets");
  REQUIRE(r["status"] == "error");
  REQUIRE(r["message"] == "Unknown event");
  REQUIRE(r["request_id"] == 9);
  REQUIRE(fx.bus.Published().empty());
}

// ============================================================================
// update_parameter
// ============================================================================

TEST_CASE("Each session writes to its own device", "[cmd][routing]") {
  Fixture fx;
  fx.Watch("s1", kA);
  fx.Watch("s2", kB);
  fx.channel.Clear();

  fx.handler.Dispatch("s1", "update_parameter",
                      Json{{"param", "mmWaveHoldTime"}, {"value", 30}, {"request_id", "r1"}});
  fx.handler.Dispatch("s2", "update_parameter",
                      Json{{"param", "mmWaveHoldTime"}, {"value", "45"}});

  auto published = fx.bus.Published();
  REQUIRE(published.size() == 2);
  REQUIRE(published[0].topic == "zigbee2mqtt/A/set");
  REQUIRE(fx.PublishedBody(0) == Json({{"mmWaveHoldTime", 30}}));
  REQUIRE(published[1].topic == "zigbee2mqtt/B/set");
  REQUIRE(fx.PublishedBody(1) == Json({{"mmWaveHoldTime", 45}}));

  auto results = fx.channel.Results("update_parameter");
  REQUIRE(results.size() == 2);
  REQUIRE(results[0].target.value() == "s1");
  REQUIRE(results[0].payload["status"] == "sent");
  REQUIRE(results[0].payload["topic"] == kA);
  REQUIRE(results[0].payload["request_id"] == "r1");
  REQUIRE(results[0].payload["rc"] == 0);
  REQUIRE_FALSE(results[0].payload.contains("message"));
  REQUIRE(results[1].target.value() == "s2");
  REQUIRE(results[1].payload["topic"] == kB);
  REQUIRE(results[1].payload["request_id"].is_null());
}

TEST_CASE("update_parameter without a selection", "[cmd][routing]") {
  Fixture fx;
  fx.Watch("s1", kA);
  fx.handler.OnConnect("s2");
  fx.handler.Dispatch("s2", "update_parameter",
                      Json{{"param", "mmWaveHoldTime"}, {"value", 30}});
  Json r = fx.OnlyResult("update_parameter");
  REQUIRE(r["status"] == "error");
  REQUIRE(r["message"] == "No device selected");
  REQUIRE(r["topic"].is_null());
  REQUIRE(fx.bus.Published().empty());
}

TEST_CASE("update_parameter validation failures stay private", "[cmd][validate]") {
  Fixture fx;
  fx.Watch("s1", kA);
  fx.Watch("s2", kA);
  fx.channel.Clear();

  fx.handler.Dispatch("s1", "update_parameter",
                      Json{{"param", "mmWaveHoldTime"}, {"value", -1}, {"request_id", 3}});
  auto events = fx.channel.Events();
  REQUIRE(events.size() == 1);
  REQUIRE(events[0].target.value() == "s1");
  const Json& r = events[0].payload;
  REQUIRE(r["status"] == "error");
  REQUIRE(r["message"] == "Field 'mmWaveHoldTime' is below min 0");
  REQUIRE(r["payload"] == Json({{"mmWaveHoldTime", -1}}));
  REQUIRE(r["request_id"] == 3);
  REQUIRE_FALSE(r.contains("rc"));
  REQUIRE(fx.bus.Published().empty());
  REQUIRE(fx.registry.Snapshot()[0].last_config.empty());
}

TEST_CASE("update_parameter read-only and malformed requests", "[cmd][validate]") {
  Fixture fx;
  fx.Watch("s1", kA);
  fx.channel.Clear();

  fx.handler.Dispatch("s1", "update_parameter", Json{{"param", "mmWaveVersion"}, {"value", 2}});
  fx.handler.Dispatch("s1", "update_parameter", Json{{"value", 2}});
  fx.handler.Dispatch("s1", "update_parameter", Json("mmWaveHoldTime"));
  auto results = fx.channel.Results("update_parameter");
  REQUIRE(results.size() == 3);
  REQUIRE(results[0].payload["message"] == "Field 'mmWaveVersion' is read-only");
  REQUIRE(results[1].payload["message"] == "Missing param");
  REQUIRE(results[2].payload["message"] == "Invalid payload");
  REQUIRE(fx.bus.Published().empty());
}

TEST_CASE("update_parameter unknown field is sent unvalidated", "[cmd][validate]") {
  Fixture fx;
  fx.Watch("s1", kA);
  fx.channel.Clear();
  fx.handler.Dispatch("s1", "update_parameter",
                      Json{{"param", "ledIntensityWhenOn"}, {"value", "33"}});
  Json r = fx.OnlyResult("update_parameter");
  REQUIRE(r["status"] == "sent");
  REQUIRE(r["message"] == "Sent without schema validation (unknown field)");
  REQUIRE(fx.PublishedBody(0) == Json({{"ledIntensityWhenOn", "33"}}));
}

TEST_CASE("update_parameter publish failure reports rc", "[cmd][publish]") {
  Fixture fx;
  fx.Watch("s1", kA);
  fx.channel.Clear();
  fx.bus.SetFailureCode(4);
  fx.handler.Dispatch("s1", "update_parameter",
                      Json{{"param", "mmWaveDetectSensitivity"}, {"value", "Low"}});
  Json r = fx.OnlyResult("update_parameter");
  REQUIRE(r["status"] == "error");
  REQUIRE(r["rc"] == 4);
  REQUIRE(r["message"] == "MQTT publish failed");
  REQUIRE(r["payload"] == Json({{"mmWaveDetectSensitivity", "Low"}}));
}

// ============================================================================
// force_sync / send_command
// ============================================================================

TEST_CASE("force_sync replays and sends two requests", "[cmd][sync]") {
  Fixture fx;
  fx.Watch("s1", kA);
  fx.channel.Clear();

  REQUIRE(fx.handler.Dispatch("s1", "force_sync", Json{{"request_id", "sync-1"}}));
  REQUIRE(fx.channel.Count("device_snapshot") == 1);

  auto published = fx.bus.Published();
  REQUIRE(published.size() == 2);
  REQUIRE(published[0].topic == "zigbee2mqtt/A/get");
  Json read = fx.PublishedBody(0);
  REQUIRE(read.size() == 10);
  REQUIRE(read["brightness"] == "");
  REQUIRE(published[1].topic == "zigbee2mqtt/A/set");
  REQUIRE(fx.PublishedBody(1) ==
          Json({{"mmwave_control_commands", {{"controlID", "query_areas"}}}}));

  Json get = fx.OnlyResult("force_sync_get");
  REQUIRE(get["status"] == "sent");
  REQUIRE(get["request_id"] == "sync-1");
  REQUIRE(get["topic"] == kA);
  Json areas = fx.OnlyResult("force_sync_query_areas");
  REQUIRE(areas["status"] == "sent");
  REQUIRE(areas["rc"] == 0);
}

TEST_CASE("force_sync without a selection", "[cmd][sync]") {
  Fixture fx;
  fx.handler.OnConnect("s1");
  fx.handler.Dispatch("s1", "force_sync", Json::object());
  REQUIRE(fx.OnlyResult("force_sync")["message"] == "No device selected");
  REQUIRE(fx.bus.Published().empty());
}

TEST_CASE("send_command maps action ids", "[cmd][command]") {
  Fixture fx;
  fx.Watch("s1", kA);
  const char* expected_ids[] = {"reset_mmwave_module", "set_interference",
                                "query_areas",         "clear_interference",
                                "reset_detection_area", "clear_stay_areas"};
  for (int id = 0; id < 6; ++id) {
    fx.handler.Dispatch("s1", "send_command", Json(id));
  }
  auto published = fx.bus.Published();
  REQUIRE(published.size() == 6);
  for (size_t i = 0; i < 6; ++i) {
    REQUIRE(published[i].topic == "zigbee2mqtt/A/set");
    REQUIRE(fx.PublishedBody(i)["mmwave_control_commands"]["controlID"] ==
            expected_ids[i]);
  }
  auto results = fx.channel.Results("send_command");
  REQUIRE(results.size() == 6);
  REQUIRE(results[3].payload["payload"] ==
          Json({{"action_id", 3}, {"controlID", "clear_interference"}}));
}

TEST_CASE("send_command accepts numeric strings and truncates reals", "[cmd][command]") {
  Fixture fx;
  fx.Watch("s1", kA);
  fx.handler.Dispatch("s1", "send_command", Json(" 2 "));
  fx.handler.Dispatch("s1", "send_command", Json(4.9));
  REQUIRE(fx.PublishedBody(0)["mmwave_control_commands"]["controlID"] == "query_areas");
  REQUIRE(fx.PublishedBody(1)["mmwave_control_commands"]["controlID"] ==
          "reset_detection_area");
}

TEST_CASE("send_command rejects bad and unknown ids", "[cmd][command]") {
  Fixture fx;
  fx.Watch("s1", kA);
  fx.channel.Clear();
  fx.handler.Dispatch("s1", "send_command", Json(true));
  fx.handler.Dispatch("s1", "send_command", Json("two"));
  fx.handler.Dispatch("s1", "send_command", Json(6));
  fx.handler.Dispatch("s1", "send_command", Json(-1));

  auto results = fx.channel.Results("send_command");
  REQUIRE(results.size() == 4);
  REQUIRE(results[0].payload["message"] == "Invalid command action");
  REQUIRE(results[1].payload["message"] == "Invalid command action");
  REQUIRE(results[2].payload["message"] == "Unknown command action");
  REQUIRE(results[2].payload["payload"]["action_id"] == 6);
  REQUIRE(results[3].payload["message"] == "Unknown command action");
  REQUIRE(fx.bus.Published().empty());
}

// ============================================================================
// Reporting and basic control
// ============================================================================

TEST_CASE("set_target_reporting resolves enum tokens", "[cmd][reporting]") {
  Fixture fx;
  fx.Watch("s1", kA);
  fx.channel.Clear();

  fx.handler.Dispatch("s1", "set_target_reporting", Json{{"enabled", true}});
  fx.handler.Dispatch("s1", "set_target_reporting", Json{{"enabled", "off"}});
  REQUIRE(fx.PublishedBody(0) == Json({{"mmWaveTargetInfoReport", "Enable"}}));
  REQUIRE(fx.PublishedBody(1) == Json({{"mmWaveTargetInfoReport", "Disable (default)"}}));

  auto results = fx.channel.Results("set_target_reporting");
  REQUIRE(results[0].payload["status"] == "sent");
  REQUIRE(results[0].payload["payload"] ==
          Json({{"enabled", true}, {"mmWaveTargetInfoReport", "Enable"}}));

  fx.handler.Dispatch("s1", "set_target_reporting", Json{{"enabled", "sometimes"}});
  fx.handler.Dispatch("s1", "set_target_reporting", Json{{"enabled", Json::array()}});
  REQUIRE(fx.channel.Results("set_target_reporting")[2].payload["message"] ==
          "Invalid payload");
  REQUIRE(fx.channel.Results("set_target_reporting")[3].payload["message"] ==
          "Invalid payload");
  REQUIRE(fx.bus.Published().size() == 2);

  // Switch-style tokens and numbers are accepted like booleans.
  fx.handler.Dispatch("s1", "set_target_reporting", Json{{"enabled", "on"}});
  fx.handler.Dispatch("s1", "set_target_reporting", Json{{"enabled", 0}});
  REQUIRE(fx.PublishedBody(2) == Json({{"mmWaveTargetInfoReport", "Enable"}}));
  REQUIRE(fx.PublishedBody(3) == Json({{"mmWaveTargetInfoReport", "Disable (default)"}}));
}

TEST_CASE("set_basic_control brightness and state", "[cmd][basic]") {
  Fixture fx;
  fx.Watch("s1", kA);
  fx.channel.Clear();

  fx.handler.Dispatch("s1", "set_basic_control", Json{{"brightness", 130}});
  fx.handler.Dispatch("s1", "set_basic_control",
                      Json{{"brightness", 300.7}, {"state", "on"}});
  fx.handler.Dispatch("s1", "set_basic_control",
                      Json{{"brightness", -3}, {"state", false}});
  fx.handler.Dispatch("s1", "set_basic_control", Json{{"state", " toggle "}});

  REQUIRE(fx.PublishedBody(0) == Json({{"brightness", 130}}));
  REQUIRE(fx.PublishedBody(1) == Json({{"brightness", 254}, {"state", "ON"}}));
  REQUIRE(fx.PublishedBody(2) == Json({{"brightness", 0}, {"state", "OFF"}}));
  REQUIRE(fx.PublishedBody(3) == Json({{"state", "TOGGLE"}}));
  REQUIRE(fx.channel.Results("set_basic_control")[1].payload["status"] == "sent");
}

TEST_CASE("set_basic_control with nothing usable", "[cmd][basic]") {
  Fixture fx;
  fx.Watch("s1", kA);
  fx.channel.Clear();
  fx.handler.Dispatch("s1", "set_basic_control",
                      Json{{"state", "blink"}, {"brightness", true}});
  REQUIRE(fx.OnlyResult("set_basic_control")["message"] == "No control values provided");

  fx.handler.OnConnect("s2");
  fx.handler.Dispatch("s2", "set_basic_control", Json{{"brightness", 10}});
  auto results = fx.channel.Results("set_basic_control");
  REQUIRE(results.size() == 2);
  REQUIRE(results[1].payload["message"] == "No device selected");
  REQUIRE(fx.bus.Published().empty());
}

// ============================================================================
// Auto-off
// ============================================================================

TEST_CASE("set_reporting_auto_off is local", "[cmd][autooff]") {
  Fixture fx;
  fx.handler.OnConnect("s1");
  fx.handler.Dispatch("s1", "set_reporting_auto_off", Json{{"enabled", "yes"}});
  REQUIRE(fx.router.AutoOff("s1"));
  Json r = fx.OnlyResult("set_reporting_auto_off");
  REQUIRE(r["status"] == "ok");
  REQUIRE(r["payload"] == Json({{"enabled", true}}));
  REQUIRE(r["topic"].is_null());

  fx.handler.Dispatch("s1", "set_reporting_auto_off", Json(false));
  REQUIRE_FALSE(fx.router.AutoOff("s1"));
  fx.handler.Dispatch("s1", "set_reporting_auto_off", Json{{"enabled", "perhaps"}});
  auto results = fx.channel.Results("set_reporting_auto_off");
  REQUIRE(results[2].payload["status"] == "error");
  REQUIRE(results[2].payload["message"] == "Invalid payload");
  REQUIRE(fx.bus.Published().empty());
}

TEST_CASE("Auto-off waits for the last watcher", "[cmd][autooff]") {
  Fixture fx;
  fx.Watch("s1", kA);
  fx.Watch("s2", kA);
  fx.handler.Dispatch("s1", "set_reporting_auto_off", Json{{"enabled", true}});

  // s1 leaves first: s2 still watches A.
  REQUIRE_FALSE(fx.handler.OnDisconnect("s1"));
  REQUIRE(fx.bus.Published().empty());
  REQUIRE_FALSE(fx.handler.OnDisconnect("s2"));
  REQUIRE(fx.bus.Published().empty());
}

TEST_CASE("Auto-off fires once on the last disconnect", "[cmd][autooff]") {
  Fixture fx;
  fx.Watch("s1", kA);
  fx.Watch("s2", kA);
  fx.handler.Dispatch("s1", "set_reporting_auto_off", Json{{"enabled", true}});

  REQUIRE_FALSE(fx.handler.OnDisconnect("s2"));
  REQUIRE(fx.handler.OnDisconnect("s1"));
  REQUIRE_FALSE(fx.handler.OnDisconnect("s1"));

  auto published = fx.bus.Published();
  REQUIRE(published.size() == 1);
  REQUIRE(published[0].topic == "zigbee2mqtt/A/set");
  REQUIRE(fx.PublishedBody(0) ==
          Json({{"mmWaveTargetInfoReport", "Disable (default)"}}));
  REQUIRE(fx.router.SessionCount() == 0);
}

TEST_CASE("Events after disconnect are refused", "[cmd][autooff]") {
  Fixture fx;
  fx.Watch("s1", kA);
  fx.handler.Dispatch("s1", "set_reporting_auto_off", Json{{"enabled", true}});
  fx.Watch("s2", kA);
  REQUIRE_FALSE(fx.handler.OnDisconnect("s2"));
  fx.channel.Clear();

  REQUIRE_FALSE(fx.handler.Dispatch("s2", "change_device", Json(kA)));
  REQUIRE_FALSE(fx.handler.Dispatch("s2", "set_reporting_auto_off",
                                    Json{{"enabled", true}, {"request_id", 5}}));
  REQUIRE(fx.router.SessionCount() == 1);

  auto late = fx.channel.Results("change_device");
  REQUIRE(late.size() == 1);
  REQUIRE(late[0].target.value() == "s2");
  REQUIRE(late[0].payload["status"] == "error");
  REQUIRE(late[0].payload["message"] == "Session not connected");
  REQUIRE(fx.channel.Results("set_reporting_auto_off")[0].payload["request_id"] == 5);
  REQUIRE(fx.channel.Count("device_snapshot") == 0);

  // s1 is the last real watcher of A.
  REQUIRE(fx.handler.OnDisconnect("s1"));
  REQUIRE(fx.bus.Published().size() == 1);
  REQUIRE(fx.bus.Published()[0].topic == "zigbee2mqtt/A/set");
}

TEST_CASE("Auto-off ignores other devices' watchers", "[cmd][autooff]") {
  Fixture fx;
  fx.Watch("s1", kA);
  fx.Watch("s2", kB);
  fx.handler.Dispatch("s1", "set_reporting_auto_off", Json{{"enabled", true}});
  REQUIRE(fx.handler.OnDisconnect("s1"));
  REQUIRE(fx.bus.Published().size() == 1);
  REQUIRE(fx.bus.Published()[0].topic == "zigbee2mqtt/A/set");
}
