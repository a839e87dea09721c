// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/notifications.hpp"
#include "network/udp_session.hpp"
#include <catch2/catch_test_macros.hpp>
#include <boost/asio/io_context.hpp>
#include <stdexcept>
#include <string>

using namespace netsession::network;

TEST_CASE("SessionNotifications: callbacks are posted, not run inline",
          "[network][notifications]") {
  boost::asio::io_context io;
  SessionNotifications notifications(io);

  uint64_t seen_id = 0;
  std::string seen_key;
  std::string seen_reason;
  auto sub = notifications.SubscribeSessionClosed(
      [&](uint64_t id, const std::string &key, const std::string &reason) {
        seen_id = id;
        seen_key = key;
        seen_reason = reason;
      });

  notifications.NotifySessionClosed(7, "10.0.0.2:502", "idle");
  REQUIRE(seen_id == 0); // Not delivered until the io_context runs

  io.poll();
  REQUIRE(seen_id == 7);
  REQUIRE(seen_key == "10.0.0.2:502");
  REQUIRE(seen_reason == "idle");
}

TEST_CASE("SessionNotifications: RAII subscription cleanup",
          "[network][notifications]") {
  boost::asio::io_context io;
  SessionNotifications notifications(io);
  bool called = false;

  {
    auto sub = notifications.SubscribeSessionClosed(
        [&](uint64_t, const std::string &, const std::string &) { called = true; });
    REQUIRE(notifications.subscriber_count() == 1);

    notifications.NotifySessionClosed(1, "k", "test");
    io.poll();
    REQUIRE(called);
  } // subscription goes out of scope

  REQUIRE(notifications.subscriber_count() == 0);

  called = false;
  io.restart();
  notifications.NotifySessionClosed(2, "k", "test");
  io.poll();
  REQUIRE(!called); // Callback no longer registered
}

TEST_CASE("SessionNotifications: Multiple subscribers and event kinds",
          "[network][notifications]") {
  boost::asio::io_context io;
  SessionNotifications notifications(io);
  int closed = 0;
  int created = 0;

  auto sub1 = notifications.SubscribeSessionClosed(
      [&](uint64_t, const std::string &, const std::string &) { closed++; });
  auto sub2 = notifications.SubscribeSessionClosed(
      [&](uint64_t, const std::string &, const std::string &) { closed++; });
  auto sub3 = notifications.SubscribeNewSession(
      [&](const std::shared_ptr<UdpSession> &) { created++; });

  notifications.NotifySessionClosed(1, "k", "test");
  io.poll();
  REQUIRE(closed == 2); // Both callbacks invoked
  REQUIRE(created == 0);

  io.restart();
  notifications.NotifyNewSession(nullptr);
  io.poll();
  REQUIRE(created == 1);
  REQUIRE(closed == 2);
}

TEST_CASE("SessionNotifications: Manual unsubscribe and move",
          "[network][notifications]") {
  boost::asio::io_context io;
  SessionNotifications notifications(io);
  int count = 0;

  auto sub = notifications.SubscribeSessionClosed(
      [&](uint64_t, const std::string &, const std::string &) { count++; });

  SECTION("Unsubscribe is idempotent") {
    sub.Unsubscribe();
    sub.Unsubscribe();
    notifications.NotifySessionClosed(1, "k", "test");
    io.poll();
    REQUIRE(count == 0);
  }

  SECTION("Moved-to subscription owns the registration") {
    SessionNotifications::Subscription moved = std::move(sub);
    REQUIRE(notifications.subscriber_count() == 1);

    notifications.NotifySessionClosed(1, "k", "test");
    io.poll();
    REQUIRE(count == 1);

    moved.Unsubscribe();
    REQUIRE(notifications.subscriber_count() == 0);
  }
}

TEST_CASE("SessionNotifications: throwing subscriber does not block others",
          "[network][notifications]") {
  boost::asio::io_context io;
  SessionNotifications notifications(io);
  bool second_called = false;

  auto sub1 = notifications.SubscribeSessionClosed(
      [](uint64_t, const std::string &, const std::string &) {
        throw std::runtime_error("subscriber failure");
      });
  auto sub2 = notifications.SubscribeSessionClosed(
      [&](uint64_t, const std::string &, const std::string &) {
        second_called = true;
      });

  notifications.NotifySessionClosed(3, "k", "test");
  REQUIRE_NOTHROW(io.poll());
  REQUIRE(second_called);
}

TEST_CASE("SessionNotifications: no subscribers posts nothing",
          "[network][notifications]") {
  boost::asio::io_context io;
  SessionNotifications notifications(io);

  notifications.NotifySessionClosed(1, "k", "test");
  notifications.NotifyNewSession(nullptr);
  REQUIRE(io.poll() == 0);
}
