/**
 * @file command_handler.hpp
 * @brief Session events in, device publishes and command results out.
 *
 * Every command resolves the device through the issuing session's own
 * selection in SessionRouter and answers with a command_result addressed to
 * that session only:
 *
 *   {action, status, topic, request_id, ts, message?, payload?, rc?}
 *
 * status is "sent" after a successful publish, "ok" for purely local
 * changes and "error" otherwise. rc is present whenever a publish was
 * attempted. Publishing is fire-and-forget; nothing is retried.
 */

#ifndef MWB_COMMAND_HANDLER_HPP_
#define MWB_COMMAND_HANDLER_HPP_

#include "mwb/delta_broadcaster.hpp"
#include "mwb/device_registry.hpp"
#include "mwb/frame_decoder.hpp"
#include "mwb/json_util.hpp"
#include "mwb/log.hpp"
#include "mwb/platform.hpp"
#include "mwb/schema_service.hpp"
#include "mwb/session_router.hpp"
#include "mwb/transport.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <utility>

namespace mwb {

// ============================================================================
// Control Actions
// ============================================================================

/// controlID values of mmwave_control_commands, indexed by action id.
static constexpr const char* kControlActions[] = {
    "reset_mmwave_module",  // 0
    "set_interference",     // 1
    "query_areas",          // 2
    "clear_interference",   // 3
    "reset_detection_area", // 4
    "clear_stay_areas",     // 5
};
static constexpr int64_t kControlActionCount =
    static_cast<int64_t>(sizeof(kControlActions) / sizeof(kControlActions[0]));

static constexpr const char* kControlCommandsKey = "mmwave_control_commands";

inline Json ControlPayload(const char* control_id) {
  return Json{{kControlCommandsKey, {{"controlID", control_id}}}};
}

/// Brightness ceiling of the dimmer endpoint.
static constexpr int32_t kMaxBrightness = 254;

namespace status {
static constexpr const char* kSent = "sent";
static constexpr const char* kOk = "ok";
static constexpr const char* kError = "error";
}  // namespace status

namespace detail {

/**
 * @brief Integer action id from a number or an integer string.
 *
 * Reals truncate toward zero; booleans, reals in strings and anything else
 * are rejected.
 */
inline optional<int64_t> ParseActionId(const Json& v) {
  if (v.is_number_integer()) {
    return v.is_number_unsigned()
               ? static_cast<int64_t>(std::min<uint64_t>(
                     v.get<uint64_t>(), static_cast<uint64_t>(INT64_MAX)))
               : v.get<int64_t>();
  }
  if (v.is_number_float()) {
    double d = v.get<double>();
    if (!std::isfinite(d) || std::fabs(d) > 9.0e15) return nullopt;
    return static_cast<int64_t>(std::trunc(d));
  }
  if (!v.is_string()) return nullopt;
  std::string s = TrimAscii(v.get<std::string>());
  size_t i = (!s.empty() && (s[0] == '-' || s[0] == '+')) ? 1 : 0;
  if (i >= s.size() || s.size() > 18) return nullopt;
  for (size_t k = i; k < s.size(); ++k) {
    if (s[k] < '0' || s[k] > '9') return nullopt;
  }
  return std::strtoll(s.c_str(), nullptr, 10);
}

/// Booleans, numbers (non-zero is true) and on/off style tokens.
inline optional<bool> ParseSwitch(const Json& v) {
  if (v.is_boolean()) return v.get<bool>();
  if (v.is_number()) return v.get<double>() != 0.0;
  if (!v.is_string()) return nullopt;
  std::string s = ToLowerAscii(TrimAscii(v.get<std::string>()));
  if (s == "true" || s == "1" || s == "on" || s == "yes") return true;
  if (s == "false" || s == "0" || s == "off" || s == "no") return false;
  return nullopt;
}

inline Json RequestIdOf(const Json& data) {
  if (!data.is_object()) return Json();
  auto it = data.find("request_id");
  return (it == data.end()) ? Json() : *it;
}

}  // namespace detail

// ============================================================================
// CommandHandler
// ============================================================================

class CommandHandler final {
 public:
  CommandHandler(const DeviceRegistry& registry, SessionRouter& router,
                 const SchemaService& schema, DeltaBroadcaster& broadcaster,
                 Publisher& publisher, SessionChannel& channel,
                 const Clock& clock = SystemClock::Instance())
      : registry_(registry),
        router_(router),
        schema_(schema),
        broadcaster_(broadcaster),
        publisher_(publisher),
        channel_(channel),
        clock_(clock) {}

  CommandHandler(const CommandHandler&) = delete;
  CommandHandler& operator=(const CommandHandler&) = delete;

  // --------------------------------------------------------------------------
  // Session lifecycle
  // --------------------------------------------------------------------------

  void OnConnect(const SessionId& sid) {
    router_.Connect(sid);
    MWB_LOG_INFO("Cmd", "Session connected: %s", sid.c_str());
    RequestSchema(sid);
  }

  /**
   * @brief Drop the session. When it had auto-off enabled and was the last
   *        one watching its device, target reporting is switched off there.
   * @return true when the auto-off publish was attempted.
   */
  bool OnDisconnect(const SessionId& sid) {
    DisconnectOutcome out = router_.Disconnect(sid);
    MWB_LOG_INFO("Cmd", "Session disconnected: %s", sid.c_str());
    if (!out.auto_off || !out.last_on_topic || !out.last_topic.has_value()) {
      return false;
    }
    const std::string token = schema_.ResolveEnumToken(kTargetReportField, false);
    auto r = PublishJson(*out.last_topic + "/set",
                         Json{{kTargetReportField, token}},
                         "auto_disable_target_reporting", sid);
    if (!r.has_value()) {
      MWB_LOG_WARN("Cmd", "Auto-off for %s failed rc=%d",
                   out.last_topic->c_str(), r.get_error().rc);
    }
    return true;
  }

  /**
   * @brief Route one inbound session event by name.
   * @return false for unknown events and for sessions that are not
   *         connected (an error result is still sent).
   */
  bool Dispatch(const SessionId& sid, const std::string& name,
                const Json& data) {
    if (!router_.IsConnected(sid)) {
      MWB_LOG_DEBUG("Cmd", "Event '%s' from unconnected session %s",
                    name.c_str(), sid.c_str());
      NotConnected(sid, name, data);
      return false;
    }
    if (name == "request_devices") {
      RequestDevices(sid);
    } else if (name == "request_schema") {
      RequestSchema(sid);
    } else if (name == "change_device") {
      ChangeDevice(sid, data);
    } else if (name == "update_parameter") {
      UpdateParameter(sid, data);
    } else if (name == "force_sync") {
      ForceSync(sid, data);
    } else if (name == "send_command") {
      SendCommand(sid, data);
    } else if (name == "set_target_reporting") {
      SetTargetReporting(sid, data);
    } else if (name == "set_basic_control") {
      SetBasicControl(sid, data);
    } else if (name == "set_reporting_auto_off") {
      SetReportingAutoOff(sid, data);
    } else {
      MWB_LOG_DEBUG("Cmd", "Unknown event '%s' from %s", name.c_str(),
                    sid.c_str());
      Result(sid, name, status::kError).Message("Unknown event")
          .RequestId(detail::RequestIdOf(data)).Emit(*this);
      return false;
    }
    return true;
  }

  // --------------------------------------------------------------------------
  // Queries
  // --------------------------------------------------------------------------

  void RequestDevices(const SessionId& sid) {
    broadcaster_.BroadcastDeviceList(sid);
  }

  void RequestSchema(const SessionId& sid) {
    channel_.Emit(event::kSchemaModel, schema_.ToJson(), sid);
  }

  /// Empty or null topic clears the selection.
  void ChangeDevice(const SessionId& sid, const Json& data) {
    if (data.is_null() || (data.is_string() && data.get_ref<const std::string&>().empty())) {
      if (!router_.Select(sid, std::string())) {
        NotConnected(sid, "change_device", data);
      }
      return;
    }
    if (!data.is_string() ||
        !DeviceNameFromTopic(registry_.BaseTopic(), data.get<std::string>())) {
      Result(sid, "change_device", status::kError)
          .Message("Invalid device topic").Payload(Json{{"topic", data}})
          .Emit(*this);
      return;
    }
    const std::string topic = data.get<std::string>();
    if (!router_.Select(sid, topic)) {
      NotConnected(sid, "change_device", data);
      return;
    }
    MWB_LOG_INFO("Cmd", "Session %s watching %s", sid.c_str(), topic.c_str());
    broadcaster_.EmitDeviceDelta(event::kSelectedDevice, Json(topic),
                                 Json{{"topic", topic}}, sid);
    broadcaster_.ReplayCachedState(topic, sid);
  }

  // --------------------------------------------------------------------------
  // Commands
  // --------------------------------------------------------------------------

  void UpdateParameter(const SessionId& sid, const Json& data) {
    static constexpr const char* kAction = "update_parameter";
    Json request_id = detail::RequestIdOf(data);
    optional<std::string> topic = router_.CurrentTopic(sid);
    if (!topic.has_value()) {
      Result(sid, kAction, status::kError).RequestId(request_id)
          .Message("No device selected").Emit(*this);
      return;
    }
    if (!data.is_object()) {
      Result(sid, kAction, status::kError).Topic(*topic).RequestId(request_id)
          .Message("Invalid payload").Emit(*this);
      return;
    }
    auto param_it = data.find("param");
    if (param_it == data.end() || !param_it->is_string() ||
        param_it->get_ref<const std::string&>().empty()) {
      Result(sid, kAction, status::kError).Topic(*topic).RequestId(request_id)
          .Message("Missing param").Emit(*this);
      return;
    }
    const std::string param = param_it->get<std::string>();
    const Json value = data.value("value", Json());

    ValidationResult v = schema_.Validate(param, value);
    if (!v.ok) {
      MWB_LOG_DEBUG("Cmd", "Rejected %s for %s: %s", param.c_str(),
                    topic->c_str(), v.error.c_str());
      Result(sid, kAction, status::kError).Topic(*topic).RequestId(request_id)
          .Payload(Json{{param, value}}).Message(v.error).Emit(*this);
      return;
    }

    Json control{{param, v.normalized}};
    auto r = PublishJson(*topic + "/set", control, kAction, sid);
    Result res(sid, kAction, r.has_value() ? status::kSent : status::kError);
    res.Topic(*topic).RequestId(request_id).Payload(control).Rc(RcOf(r));
    if (!r.has_value()) {
      res.Message("MQTT publish failed");
    } else if (v.unknown_field) {
      res.Message("Sent without schema validation (unknown field)");
    }
    res.Emit(*this);
  }

  void ForceSync(const SessionId& sid, const Json& data) {
    Json request_id = detail::RequestIdOf(data);
    optional<std::string> topic = router_.CurrentTopic(sid);
    if (!topic.has_value()) {
      Result(sid, "force_sync", status::kError).RequestId(request_id)
          .Message("No device selected").Emit(*this);
      return;
    }

    broadcaster_.ReplayCachedState(*topic, sid);

    PublishAndReport(sid, "force_sync_get", *topic + "/get",
                     schema_.BuildFullReadPayload(), *topic, request_id);
    // Makes the module report its interference/detection/stay areas.
    PublishAndReport(sid, "force_sync_query_areas", *topic + "/set",
                     ControlPayload("query_areas"), *topic, request_id);
    MWB_LOG_INFO("Cmd", "Force sync sent to %s (session %s)", topic->c_str(),
                 sid.c_str());
  }

  void SendCommand(const SessionId& sid, const Json& data) {
    static constexpr const char* kAction = "send_command";
    optional<std::string> topic = router_.CurrentTopic(sid);
    if (!topic.has_value()) {
      Result(sid, kAction, status::kError).Message("No device selected")
          .Emit(*this);
      return;
    }
    optional<int64_t> action_id = detail::ParseActionId(data);
    if (!action_id.has_value()) {
      Result(sid, kAction, status::kError).Topic(*topic)
          .Message("Invalid command action").Emit(*this);
      return;
    }
    if (*action_id < 0 || *action_id >= kControlActionCount) {
      Result(sid, kAction, status::kError).Topic(*topic)
          .Payload(Json{{"action_id", *action_id}})
          .Message("Unknown command action").Emit(*this);
      return;
    }

    const char* control_id = kControlActions[*action_id];
    auto r = PublishJson(*topic + "/set", ControlPayload(control_id), kAction, sid);
    Result res(sid, kAction, r.has_value() ? status::kSent : status::kError);
    res.Topic(*topic)
        .Payload(Json{{"action_id", *action_id}, {"controlID", control_id}})
        .Rc(RcOf(r));
    if (!r.has_value()) res.Message("MQTT publish failed");
    res.Emit(*this);
  }

  void SetTargetReporting(const SessionId& sid, const Json& data) {
    static constexpr const char* kAction = "set_target_reporting";
    Json request_id = detail::RequestIdOf(data);
    optional<std::string> topic = router_.CurrentTopic(sid);
    if (!topic.has_value()) {
      Result(sid, kAction, status::kError).RequestId(request_id)
          .Message("No device selected").Emit(*this);
      return;
    }
    optional<bool> enabled;
    if (data.is_object()) enabled = detail::ParseSwitch(data.value("enabled", Json()));
    if (!enabled.has_value()) {
      Result(sid, kAction, status::kError).Topic(*topic).RequestId(request_id)
          .Message("Invalid payload").Emit(*this);
      return;
    }

    const std::string token = schema_.ResolveEnumToken(kTargetReportField, *enabled);
    auto r = PublishJson(*topic + "/set", Json{{kTargetReportField, token}},
                         kAction, sid);
    Result res(sid, kAction, r.has_value() ? status::kSent : status::kError);
    res.Topic(*topic).RequestId(request_id)
        .Payload(Json{{"enabled", *enabled}, {kTargetReportField, token}})
        .Rc(RcOf(r));
    if (!r.has_value()) res.Message("MQTT publish failed");
    res.Emit(*this);
  }

  /**
   * state accepts ON / OFF / TOGGLE (any case) or a boolean; brightness is
   * truncated to an integer and clamped to [0, 254]. Invalid members are
   * dropped; when nothing valid remains the command fails.
   */
  void SetBasicControl(const SessionId& sid, const Json& data) {
    static constexpr const char* kAction = "set_basic_control";
    Json request_id = detail::RequestIdOf(data);
    optional<std::string> topic = router_.CurrentTopic(sid);
    if (!topic.has_value()) {
      Result(sid, kAction, status::kError).RequestId(request_id)
          .Message("No device selected").Emit(*this);
      return;
    }
    if (!data.is_object()) {
      Result(sid, kAction, status::kError).Topic(*topic).RequestId(request_id)
          .Message("Invalid payload").Emit(*this);
      return;
    }

    Json control = Json::object();
    auto state = data.find("state");
    if (state != data.end()) {
      if (state->is_boolean()) {
        control["state"] = state->get<bool>() ? "ON" : "OFF";
      } else if (state->is_string()) {
        std::string s = TrimAscii(state->get<std::string>());
        for (char& c : s) {
          if (c >= 'a' && c <= 'z') c = static_cast<char>(c - 32);
        }
        if (s == "ON" || s == "OFF" || s == "TOGGLE") control["state"] = s;
      }
    }
    auto brightness = data.find("brightness");
    if (brightness != data.end() && !brightness->is_boolean()) {
      optional<double> level = AsNumber(*brightness);
      if (level.has_value()) {
        double clamped = std::trunc(*level);
        if (clamped < 0.0) clamped = 0.0;
        if (clamped > kMaxBrightness) clamped = kMaxBrightness;
        control["brightness"] = static_cast<int32_t>(clamped);
      }
    }
    if (control.empty()) {
      Result(sid, kAction, status::kError).Topic(*topic).RequestId(request_id)
          .Message("No control values provided").Emit(*this);
      return;
    }

    auto r = PublishJson(*topic + "/set", control, kAction, sid);
    Result res(sid, kAction, r.has_value() ? status::kSent : status::kError);
    res.Topic(*topic).RequestId(request_id).Payload(control).Rc(RcOf(r));
    if (!r.has_value()) res.Message("MQTT publish failed");
    res.Emit(*this);
  }

  /// Accepts {"enabled": x} or a bare switch value.
  void SetReportingAutoOff(const SessionId& sid, const Json& data) {
    static constexpr const char* kAction = "set_reporting_auto_off";
    Json request_id = detail::RequestIdOf(data);
    optional<bool> enabled = data.is_object()
                                 ? detail::ParseSwitch(data.value("enabled", Json()))
                                 : detail::ParseSwitch(data);
    optional<std::string> topic = router_.CurrentTopic(sid);
    Result res(sid, kAction, status::kOk);
    res.RequestId(request_id);
    if (topic.has_value()) res.Topic(*topic);
    if (!enabled.has_value()) {
      res.Status(status::kError).Message("Invalid payload").Emit(*this);
      return;
    }
    if (!router_.SetAutoOff(sid, *enabled)) {
      NotConnected(sid, kAction, data);
      return;
    }
    res.Payload(Json{{"enabled", *enabled}}).Emit(*this);
  }

 private:
  /// Builder for one command_result.
  class Result {
   public:
    Result(const SessionId& sid, std::string action, const char* status)
        : sid_(sid), action_(std::move(action)), status_(status) {}

    Result& Status(const char* s) { status_ = s; return *this; }
    Result& Topic(const std::string& t) { topic_ = t; return *this; }
    Result& RequestId(Json id) { request_id_ = std::move(id); return *this; }
    Result& Message(std::string m) { message_ = std::move(m); return *this; }
    Result& Payload(Json p) { payload_ = std::move(p); return *this; }
    Result& Rc(int32_t rc) { rc_ = rc; return *this; }

    void Emit(CommandHandler& handler) const {
      Json j{{"action", action_},
             {"status", status_},
             {"topic", topic_},
             {"request_id", request_id_},
             {"ts", handler.clock_.WallSeconds()}};
      if (!message_.empty()) j["message"] = message_;
      if (!payload_.is_null()) j["payload"] = payload_;
      if (rc_.has_value()) j["rc"] = *rc_;
      handler.channel_.Emit(event::kCommandResult, j, sid_);
    }

   private:
    const SessionId& sid_;
    std::string action_;
    const char* status_;
    Json topic_;
    Json request_id_;
    std::string message_;
    Json payload_;
    optional<int32_t> rc_;
  };

  void NotConnected(const SessionId& sid, const std::string& action,
                    const Json& data) {
    Result(sid, action, status::kError).Message("Session not connected")
        .RequestId(detail::RequestIdOf(data)).Emit(*this);
  }

  static int32_t RcOf(const expected<void, PublishError>& r) {
    return r.has_value() ? 0 : r.get_error().rc;
  }

  expected<void, PublishError> PublishJson(const std::string& topic,
                                           const Json& payload,
                                           const char* origin,
                                           const SessionId& sid) {
    const std::string body = DumpJson(payload);
    MWB_LOG_INFO("Cmd", "publish origin=%s sid=%s topic=%s payload=%s", origin,
                 sid.empty() ? "-" : sid.c_str(), topic.c_str(), body.c_str());
    auto r = publisher_.Publish(topic, body);
    if (!r.has_value()) {
      MWB_LOG_ERROR("Cmd", "publish failed origin=%s topic=%s rc=%d", origin,
                    topic.c_str(), r.get_error().rc);
    }
    return r;
  }

  void PublishAndReport(const SessionId& sid, const char* action,
                        const std::string& publish_topic, const Json& payload,
                        const std::string& device_topic,
                        const Json& request_id) {
    auto r = PublishJson(publish_topic, payload, action, sid);
    Result res(sid, action, r.has_value() ? status::kSent : status::kError);
    res.Topic(device_topic).RequestId(request_id).Payload(payload).Rc(RcOf(r));
    if (!r.has_value()) res.Message("MQTT publish failed");
    res.Emit(*this);
  }

  const DeviceRegistry& registry_;
  SessionRouter& router_;
  const SchemaService& schema_;
  DeltaBroadcaster& broadcaster_;
  Publisher& publisher_;
  SessionChannel& channel_;
  const Clock& clock_;
};

}  // namespace mwb

#endif  // MWB_COMMAND_HANDLER_HPP_
