/**
 * @file test_session_router.cpp
 * @brief Tests for session_router.hpp
 */

#include "mwb/session_router.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

TEST_CASE("Sessions keep independent selections", "[router]") {
  mwb::SessionRouter router;
  router.Connect("s1");
  router.Connect("s2");
  router.Select("s1", "zigbee2mqtt/a");
  router.Select("s2", "zigbee2mqtt/b");

  REQUIRE(router.CurrentTopic("s1").value() == "zigbee2mqtt/a");
  REQUIRE(router.CurrentTopic("s2").value() == "zigbee2mqtt/b");
  REQUIRE(router.SessionCount() == 2);
}

TEST_CASE("Empty topic clears the selection", "[router]") {
  mwb::SessionRouter router;
  router.Connect("s1");
  REQUIRE_FALSE(router.CurrentTopic("s1").has_value());
  router.Select("s1", "zigbee2mqtt/a");
  router.Select("s1", "");
  REQUIRE_FALSE(router.CurrentTopic("s1").has_value());
}

TEST_CASE("Unknown sessions have no topic", "[router]") {
  mwb::SessionRouter router;
  REQUIRE_FALSE(router.CurrentTopic("nobody").has_value());
  REQUIRE_FALSE(router.AutoOff("nobody"));
  auto out = router.Disconnect("nobody");
  REQUIRE_FALSE(out.was_connected);
}

TEST_CASE("Select and SetAutoOff never create sessions", "[router]") {
  mwb::SessionRouter router;
  REQUIRE_FALSE(router.Select("nobody", "zigbee2mqtt/a"));
  REQUIRE_FALSE(router.SetAutoOff("nobody", true));
  REQUIRE(router.SessionCount() == 0);
  REQUIRE_FALSE(router.IsConnected("nobody"));

  router.Connect("s1");
  REQUIRE(router.IsConnected("s1"));
  REQUIRE(router.Select("s1", "zigbee2mqtt/a"));
  router.Disconnect("s1");
  REQUIRE_FALSE(router.Select("s1", "zigbee2mqtt/a"));
  REQUIRE_FALSE(router.SetAutoOff("s1", true));
  REQUIRE_FALSE(router.IsConnected("s1"));
  REQUIRE(router.SessionCount() == 0);
}

TEST_CASE("A late select does not hold a topic open", "[router][auto_off]") {
  mwb::SessionRouter router;
  router.Connect("s1");
  router.Connect("s2");
  REQUIRE(router.Select("s1", "zigbee2mqtt/dev"));
  REQUIRE(router.SetAutoOff("s1", true));
  router.Disconnect("s2");
  REQUIRE_FALSE(router.Select("s2", "zigbee2mqtt/dev"));

  auto out = router.Disconnect("s1");
  REQUIRE(out.auto_off);
  REQUIRE(out.last_on_topic);
}

TEST_CASE("Reconnect resets the entry", "[router]") {
  mwb::SessionRouter router;
  router.Connect("s1");
  router.Select("s1", "zigbee2mqtt/a");
  router.SetAutoOff("s1", true);
  router.Connect("s1");
  REQUIRE_FALSE(router.CurrentTopic("s1").has_value());
  REQUIRE_FALSE(router.AutoOff("s1"));
}

TEST_CASE("Disconnect reports whether it was the last watcher", "[router][auto_off]") {
  mwb::SessionRouter router;
  router.Connect("s1");
  router.Connect("s2");
  router.Select("s1", "zigbee2mqtt/shared");
  router.Select("s2", "zigbee2mqtt/shared");
  router.SetAutoOff("s1", true);
  router.SetAutoOff("s2", true);

  auto first = router.Disconnect("s1");
  REQUIRE(first.was_connected);
  REQUIRE(first.auto_off);
  REQUIRE(first.last_topic.value() == "zigbee2mqtt/shared");
  REQUIRE_FALSE(first.last_on_topic);

  auto second = router.Disconnect("s2");
  REQUIRE(second.last_on_topic);
  REQUIRE(second.auto_off);
  REQUIRE(router.SessionCount() == 0);
}

TEST_CASE("AnyOtherSessionOnTopic excludes the asking session", "[router]") {
  mwb::SessionRouter router;
  router.Connect("s1");
  router.Select("s1", "zigbee2mqtt/a");
  REQUIRE_FALSE(router.AnyOtherSessionOnTopic("zigbee2mqtt/a", "s1"));
  router.Connect("s2");
  router.Select("s2", "zigbee2mqtt/a");
  REQUIRE(router.AnyOtherSessionOnTopic("zigbee2mqtt/a", "s1"));
  REQUIRE_FALSE(router.AnyOtherSessionOnTopic("zigbee2mqtt/b", "s1"));
}

TEST_CASE("Concurrent sessions never see each other's topic", "[router][concurrency]") {
  mwb::SessionRouter router;
  std::vector<std::thread> threads;
  std::atomic<int> mismatches{0};
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&router, &mismatches, t] {
      std::string sid = "s" + std::to_string(t);
      std::string topic = "zigbee2mqtt/dev" + std::to_string(t);
      router.Connect(sid);
      for (int i = 0; i < 500; ++i) {
        router.Select(sid, topic);
        auto cur = router.CurrentTopic(sid);
        if (!cur.has_value() || *cur != topic) ++mismatches;
      }
      router.Disconnect(sid);
    });
  }
  for (auto& th : threads) th.join();
  REQUIRE(mismatches.load() == 0);
  REQUIRE(router.SessionCount() == 0);
}
