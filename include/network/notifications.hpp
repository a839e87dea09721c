// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <boost/asio/io_context.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace netsession {
namespace network {

class UdpSession;

/**
 * Notification system for session events
 *
 * - Simple observer pattern with std::function
 * - RAII-based subscription management
 * - One instance per server (no global state)
 * - Callbacks are posted to the server's io_context, never run inline,
 *   so a slow subscriber cannot stall session creation on the receive path
 *
 * Events:
 * - NewSession: a session was created (first datagram or first send to a peer)
 * - SessionClosed: a session was disposed
 */
class SessionNotifications {
public:
  /**
   * Subscription handle - RAII wrapper
   * Automatically unsubscribes when destroyed
   */
  class Subscription {
  public:
    Subscription() = default;
    ~Subscription();

    // Movable but not copyable
    Subscription(Subscription &&other) noexcept;
    Subscription &operator=(Subscription &&other) noexcept;
    Subscription(const Subscription &) = delete;
    Subscription &operator=(const Subscription &) = delete;

    // Unsubscribe explicitly
    void Unsubscribe();

  private:
    friend class SessionNotifications;
    Subscription(SessionNotifications *owner, size_t id);

    SessionNotifications *owner_{nullptr};
    size_t id_{0};
    bool active_{false};
  };

  using NewSessionCallback =
      std::function<void(const std::shared_ptr<UdpSession> &session)>;
  using SessionClosedCallback =
      std::function<void(uint64_t session_id, const std::string &peer_key,
                         const std::string &reason)>;

  explicit SessionNotifications(boost::asio::io_context &io_context)
      : io_context_(io_context) {}

  SessionNotifications(const SessionNotifications &) = delete;
  SessionNotifications &operator=(const SessionNotifications &) = delete;

  [[nodiscard]] Subscription SubscribeNewSession(NewSessionCallback callback);

  [[nodiscard]] Subscription
  SubscribeSessionClosed(SessionClosedCallback callback);

  void NotifyNewSession(const std::shared_ptr<UdpSession> &session);

  void NotifySessionClosed(uint64_t session_id, const std::string &peer_key,
                           const std::string &reason);

  size_t subscriber_count() const;

private:
  // Unsubscribe by ID (called by Subscription destructor)
  void Unsubscribe(size_t id);

  struct CallbackEntry {
    size_t id;
    NewSessionCallback new_session;
    SessionClosedCallback session_closed;
  };

  boost::asio::io_context &io_context_;

  // Thread-safety: protect callbacks_ and next_id_ across threads
  mutable std::mutex mutex_;
  std::vector<CallbackEntry> callbacks_;
  size_t next_id_{1}; // 0 reserved for invalid
};

} // namespace network
} // namespace netsession
