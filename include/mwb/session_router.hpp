/**
 * @file session_router.hpp
 * @brief Per-session device selection and preferences.
 *
 * Each live session owns exactly one entry: the topic it currently watches
 * and its auto-off preference. Only Connect() creates an entry; calls for
 * any other id leave the store untouched. Commands resolve the issuing session's own
 * entry only; there is no process-wide "current device".
 *
 * Concurrency: one mutex guards the whole store. Disconnect() removes the
 * entry and answers "was this the last session on its topic" under that
 * same lock, so the caller's auto-off decision cannot race a reconnect.
 */

#ifndef MWB_SESSION_ROUTER_HPP_
#define MWB_SESSION_ROUTER_HPP_

#include "mwb/vocabulary.hpp"

#include <cstdint>
#include <map>
#include <mutex>
#include <string>

namespace mwb {

using SessionId = std::string;

struct DisconnectOutcome {
  bool was_connected = false;
  optional<std::string> last_topic;
  bool auto_off = false;
  bool last_on_topic = false;  ///< No other session watches last_topic.
};

class SessionRouter final {
 public:
  SessionRouter() = default;
  SessionRouter(const SessionRouter&) = delete;
  SessionRouter& operator=(const SessionRouter&) = delete;

  /// @brief Create an empty entry; a reconnect under the same id resets it.
  void Connect(const SessionId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    sessions_[id] = Entry{};
  }

  DisconnectOutcome Disconnect(const SessionId& id) {
    DisconnectOutcome out;
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) return out;
    out.was_connected = true;
    out.last_topic = it->second.topic;
    out.auto_off = it->second.auto_off;
    sessions_.erase(it);
    if (out.last_topic.has_value()) {
      out.last_on_topic = !AnyOnTopicLocked(*out.last_topic, id);
    }
    return out;
  }

  /**
   * @brief Overwrite the session's topic; an empty topic clears it.
   *
   * The topic is not checked against the device registry. Selecting an
   * unknown topic is legal and yields "no device" behavior downstream.
   * @return false when @p id is not connected; nothing is created then.
   */
  bool Select(const SessionId& id, const std::string& topic) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) return false;
    if (topic.empty()) {
      it->second.topic.reset();
    } else {
      it->second.topic = topic;
    }
    return true;
  }

  bool IsConnected(const SessionId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.find(id) != sessions_.end();
  }

  optional<std::string> CurrentTopic(const SessionId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) return nullopt;
    return it->second.topic;
  }

  /// @return false when @p id is not connected.
  bool SetAutoOff(const SessionId& id, bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) return false;
    it->second.auto_off = enabled;
    return true;
  }

  bool AutoOff(const SessionId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(id);
    return it != sessions_.end() && it->second.auto_off;
  }

  bool AnyOtherSessionOnTopic(const std::string& topic,
                              const SessionId& excluding) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return AnyOnTopicLocked(topic, excluding);
  }

  uint32_t SessionCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<uint32_t>(sessions_.size());
  }

 private:
  struct Entry {
    optional<std::string> topic;
    bool auto_off = false;
  };

  bool AnyOnTopicLocked(const std::string& topic,
                        const SessionId& excluding) const {
    for (const auto& kv : sessions_) {
      if (kv.first == excluding) continue;
      if (kv.second.topic.has_value() && *kv.second.topic == topic) {
        return true;
      }
    }
    return false;
  }

  mutable std::mutex mutex_;
  std::map<SessionId, Entry> sessions_;
};

}  // namespace mwb

#endif  // MWB_SESSION_ROUTER_HPP_
