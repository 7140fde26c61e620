/**
 * @file transport.hpp
 * @brief Pub/sub and session-channel seams of the bridge, plus an in-process
 *        loopback transport.
 *
 * The bridge never talks to a broker or a websocket directly. It subscribes
 * and publishes through Subscriber / Publisher and pushes session events
 * through SessionChannel. LoopbackTransport implements the pub/sub side in
 * memory with MQTT topic-filter semantics.
 */

#ifndef MWB_TRANSPORT_HPP_
#define MWB_TRANSPORT_HPP_

#include "mwb/json_util.hpp"
#include "mwb/log.hpp"
#include "mwb/vocabulary.hpp"

#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace mwb {

// ============================================================================
// Pub/Sub Interfaces
// ============================================================================

using MessageHandler =
    std::function<void(const std::string& topic, const std::string& payload)>;

struct SubscriptionHandle {
  uint32_t id;

  bool IsValid() const noexcept { return id != 0U; }
  static SubscriptionHandle Invalid() noexcept { return {0U}; }
};

/// Publish failure. @c rc is the transport result code (never 0).
struct PublishError {
  int32_t rc;
};

class Subscriber {
 public:
  virtual ~Subscriber() = default;

  /**
   * @brief Register @p handler for topics matching @p filter.
   *
   * Filters follow MQTT rules: "+" matches one level, a trailing "#"
   * matches the parent level and everything below it.
   */
  virtual SubscriptionHandle Subscribe(const std::string& filter,
                                       MessageHandler handler) = 0;
  virtual bool Unsubscribe(SubscriptionHandle handle) = 0;
};

class Publisher {
 public:
  virtual ~Publisher() = default;

  /// Fire-and-forget; success means the transport accepted the message.
  virtual expected<void, PublishError> Publish(const std::string& topic,
                                               const std::string& payload) = 0;
};

// ============================================================================
// Session Channel
// ============================================================================

using SessionId = std::string;

/**
 * @brief Outbound half of the session protocol.
 *
 * @p target names one session; nullopt addresses every connected session.
 * Delivery is best-effort and at most once.
 */
class SessionChannel {
 public:
  virtual ~SessionChannel() = default;

  virtual void Emit(const std::string& event, const Json& payload,
                    const optional<SessionId>& target) = 0;
};

// ============================================================================
// Topic Filter Matching
// ============================================================================

/**
 * @brief MQTT topic-filter match.
 *
 * "a/+/c" matches "a/b/c"; "a/#" matches "a", "a/b" and "a/b/c".
 */
inline bool TopicMatches(const std::string& filter, const std::string& topic) {
  size_t f = 0;
  size_t t = 0;
  while (f <= filter.size()) {
    size_t f_end = filter.find('/', f);
    if (f_end == std::string::npos) f_end = filter.size();
    const std::string level = filter.substr(f, f_end - f);

    if (level == "#") return f_end == filter.size();

    if (t > topic.size()) return false;
    size_t t_end = topic.find('/', t);
    if (t_end == std::string::npos) t_end = topic.size();

    if (level != "+" && level != topic.substr(t, t_end - t)) return false;

    f = f_end + 1;
    t = t_end + 1;
    if (f > filter.size()) return t > topic.size();
    // "a/#" also matches "a".
    if (t > topic.size()) {
      return filter.compare(f, std::string::npos, "#") == 0;
    }
  }
  return false;
}

// ============================================================================
// LoopbackTransport
// ============================================================================

/**
 * @brief In-process Subscriber + Publisher.
 *
 * Every Publish() is appended to a log and then delivered synchronously to
 * matching subscribers on the calling thread. Handlers run with no internal
 * lock held. SetFailureCode() makes subsequent publishes fail with that
 * code until it is reset to 0.
 */
class LoopbackTransport final : public Subscriber, public Publisher {
 public:
  struct Message {
    std::string topic;
    std::string payload;
  };

  SubscriptionHandle Subscribe(const std::string& filter,
                               MessageHandler handler) override {
    if (filter.empty() || !handler) return SubscriptionHandle::Invalid();
    std::lock_guard<std::mutex> lock(mutex_);
    uint32_t id = next_id_++;
    subs_.push_back(Subscription{id, filter, std::move(handler)});
    return SubscriptionHandle{id};
  }

  bool Unsubscribe(SubscriptionHandle handle) override {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = subs_.begin(); it != subs_.end(); ++it) {
      if (it->id == handle.id) {
        subs_.erase(it);
        return true;
      }
    }
    return false;
  }

  expected<void, PublishError> Publish(const std::string& topic,
                                       const std::string& payload) override {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (failure_rc_ != 0) {
        return expected<void, PublishError>::error(PublishError{failure_rc_});
      }
      published_.push_back(Message{topic, payload});
    }
    Deliver(topic, payload);
    return expected<void, PublishError>::success();
  }

  /**
   * @brief Deliver an inbound message as if it came from the broker.
   * @return Number of handlers invoked.
   */
  uint32_t Deliver(const std::string& topic, const std::string& payload) {
    std::vector<MessageHandler> targets;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      for (const auto& sub : subs_) {
        if (TopicMatches(sub.filter, topic)) targets.push_back(sub.handler);
      }
    }
    for (auto& handler : targets) handler(topic, payload);
    return static_cast<uint32_t>(targets.size());
  }

  void SetFailureCode(int32_t rc) {
    std::lock_guard<std::mutex> lock(mutex_);
    failure_rc_ = rc;
  }

  std::vector<Message> Published() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return published_;
  }

  void ClearPublished() {
    std::lock_guard<std::mutex> lock(mutex_);
    published_.clear();
  }

  uint32_t SubscriptionCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<uint32_t>(subs_.size());
  }

 private:
  struct Subscription {
    uint32_t id;
    std::string filter;
    MessageHandler handler;
  };

  mutable std::mutex mutex_;
  std::vector<Subscription> subs_;
  std::vector<Message> published_;
  uint32_t next_id_ = 1;
  int32_t failure_rc_ = 0;
};

}  // namespace mwb

#endif  // MWB_TRANSPORT_HPP_
