// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/udp_session.hpp"
#include "network/udp_server.hpp"
#include "util/logging.hpp"
#include "util/netaddress.hpp"
#include "util/time.hpp"
#include <exception>

namespace netsession {
namespace network {

UdpSessionPtr UdpSession::Create(UdpServer &server, uint64_t id,
                                 const boost::asio::ip::udp::endpoint &remote) {
  return std::make_shared<UdpSession>(PrivateTag{}, server, id, remote);
}

UdpSession::UdpSession(PrivateTag, UdpServer &server, uint64_t id,
                       const boost::asio::ip::udp::endpoint &remote)
    : server_(server), id_(id), remote_(remote),
      key_(util::EndpointKey(remote)),
      broadcast_(util::IsBroadcastAddress(remote.address())),
      last_activity_ms_(util::GetTickCountMs()),
      queue_(MatchQueue::Create(server.io_context(),
                                server.config().match_queue_size)) {}

UdpSession::~UdpSession() {
  // Pending requests must not outlive the session unresolved
  if (!closed_.load()) {
    queue_->Clear();
  }
}

void UdpSession::Start() {
  bool expected = false;
  if (closed_.load() || !open_.compare_exchange_strong(expected, true)) {
    return;
  }
  LOG_SESSION_DEBUG("session {} started for {}{}", id_, key_,
                    broadcast_ ? " (broadcast)" : "");
}

bool UdpSession::Close(const std::string &reason) {
  if (closed_.exchange(true)) {
    return false;
  }
  open_.store(false);

  queue_->Clear();
  server_.RemoveSession(*this);

  std::vector<DisposeCallback> callbacks;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    callbacks.swap(dispose_callbacks_);
    receive_callback_ = {};
  }
  for (auto &cb : callbacks) {
    try {
      cb(*this);
    } catch (const std::exception &e) {
      LOG_SESSION_WARN("dispose callback for session {} threw: {}", id_, e.what());
    }
  }

  server_.notifications().NotifySessionClosed(id_, key_, reason);
  LOG_SESSION_DEBUG("session {} ({}) closed: {}", id_, key_, reason);
  return true;
}

int64_t UdpSession::Send(const Packet &packet) {
  if (!open_.load()) {
    LOG_SESSION_TRACE("send on closed session {} ignored", id_);
    return -1;
  }
  return server_.SendTo(packet, remote_);
}

std::shared_future<MatchOutcome>
UdpSession::SendMessageAsync(Packet request, int64_t timeout_ms,
                             std::string trace_tag) {
  if (!open_.load()) {
    LOG_SESSION_DEBUG("request on closed session {} cancelled", id_);
    MatchCompletion completion;
    completion.TryResolve(MatchOutcome{MatchStatus::Cleared, Packet{}});
    return completion.future();
  }
  if (timeout_ms <= 0) {
    timeout_ms = server_.config().match_timeout_ms;
  }

  // Register before sending so a fast response cannot beat the slot
  auto future = queue_->Add(this, request, timeout_ms, nullptr, std::move(trace_tag));

  if (Send(request) < 0) {
    LOG_SESSION_WARN("session {}: request to {} not sent, it will expire", id_,
                     key_);
  }
  return future;
}

bool UdpSession::OnReceive(const Packet &packet) {
  if (!open_.load()) {
    return false;
  }
  last_activity_ms_.store(util::GetTickCountMs());

  if (queue_->Match(this, packet, packet, CurrentPredicate())) {
    return true;
  }

  ReceiveCallback callback;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    callback = receive_callback_;
  }
  auto self = shared_from_this();
  if (callback) {
    try {
      callback(self, packet);
    } catch (const std::exception &e) {
      LOG_SESSION_WARN("receive callback for session {} threw: {}", id_, e.what());
    }
  }
  server_.DeliverUnmatched(self, packet);
  return false;
}

void UdpSession::set_receive_callback(ReceiveCallback callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  receive_callback_ = std::move(callback);
}

void UdpSession::set_match_predicate(MatchQueue::Predicate predicate) {
  std::lock_guard<std::mutex> lock(mutex_);
  predicate_ = std::move(predicate);
}

void UdpSession::AddDisposeCallback(DisposeCallback callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  dispose_callbacks_.push_back(std::move(callback));
}

MatchQueue::Predicate UdpSession::CurrentPredicate() const {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (predicate_) {
      return *predicate_;
    }
  }
  return server_.config().match_predicate;
}

std::string UdpSession::ToString() const {
  return "udp://" + key_;
}

} // namespace network
} // namespace netsession
