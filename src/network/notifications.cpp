// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/notifications.hpp"
#include "network/udp_session.hpp"
#include "util/logging.hpp"
#include <algorithm>
#include <boost/asio/post.hpp>
#include <exception>

namespace netsession {
namespace network {

// ============================================================================
// SessionNotifications::Subscription
// ============================================================================

SessionNotifications::Subscription::Subscription(SessionNotifications *owner,
                                                 size_t id)
    : owner_(owner), id_(id), active_(true) {}

SessionNotifications::Subscription::~Subscription() { Unsubscribe(); }

SessionNotifications::Subscription::Subscription(Subscription &&other) noexcept
    : owner_(other.owner_), id_(other.id_), active_(other.active_) {
  other.owner_ = nullptr;
  other.active_ = false;
}

SessionNotifications::Subscription &
SessionNotifications::Subscription::operator=(Subscription &&other) noexcept {
  if (this != &other) {
    Unsubscribe();
    owner_ = other.owner_;
    id_ = other.id_;
    active_ = other.active_;
    other.owner_ = nullptr;
    other.active_ = false;
  }
  return *this;
}

void SessionNotifications::Subscription::Unsubscribe() {
  if (active_ && owner_) {
    owner_->Unsubscribe(id_);
    active_ = false;
  }
}

// ============================================================================
// SessionNotifications
// ============================================================================

SessionNotifications::Subscription
SessionNotifications::SubscribeNewSession(NewSessionCallback callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  size_t id = next_id_++;

  CallbackEntry entry;
  entry.id = id;
  entry.new_session = std::move(callback);
  callbacks_.push_back(std::move(entry));

  return Subscription(this, id);
}

SessionNotifications::Subscription
SessionNotifications::SubscribeSessionClosed(SessionClosedCallback callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  size_t id = next_id_++;

  CallbackEntry entry;
  entry.id = id;
  entry.session_closed = std::move(callback);
  callbacks_.push_back(std::move(entry));

  return Subscription(this, id);
}

void SessionNotifications::NotifyNewSession(
    const std::shared_ptr<UdpSession> &session) {
  std::vector<NewSessionCallback> snapshot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &entry : callbacks_) {
      if (entry.new_session) snapshot.push_back(entry.new_session);
    }
  }
  if (snapshot.empty()) {
    return;
  }

  boost::asio::post(io_context_, [snapshot = std::move(snapshot), session]() {
    for (const auto &cb : snapshot) {
      try {
        cb(session);
      } catch (const std::exception &e) {
        LOG_SESSION_WARN("new-session subscriber threw: {}", e.what());
      }
    }
  });
}

void SessionNotifications::NotifySessionClosed(uint64_t session_id,
                                               const std::string &peer_key,
                                               const std::string &reason) {
  std::vector<SessionClosedCallback> snapshot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &entry : callbacks_) {
      if (entry.session_closed) snapshot.push_back(entry.session_closed);
    }
  }
  if (snapshot.empty()) {
    return;
  }

  boost::asio::post(io_context_, [snapshot = std::move(snapshot), session_id,
                                  peer_key, reason]() {
    for (const auto &cb : snapshot) {
      try {
        cb(session_id, peer_key, reason);
      } catch (const std::exception &e) {
        LOG_SESSION_WARN("session-closed subscriber threw: {}", e.what());
      }
    }
  });
}

size_t SessionNotifications::subscriber_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return callbacks_.size();
}

void SessionNotifications::Unsubscribe(size_t id) {
  std::lock_guard<std::mutex> lock(mutex_);
  callbacks_.erase(std::remove_if(callbacks_.begin(), callbacks_.end(),
                                  [id](const CallbackEntry &entry) {
                                    return entry.id == id;
                                  }),
                   callbacks_.end());
}

} // namespace network
} // namespace netsession
