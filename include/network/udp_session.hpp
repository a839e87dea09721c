// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/match_queue.hpp"
#include "network/packet.hpp"
#include <atomic>
#include <boost/asio/ip/udp.hpp>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace netsession {
namespace network {

class UdpServer;
class UdpSession;
using UdpSessionPtr = std::shared_ptr<UdpSession>;

/**
 * UdpSession - conversation with one remote peer over a shared UdpServer socket
 *
 * Created by UdpServer::CreateSession (first datagram from a peer, or first
 * send to it). A session whose remote is 255.255.255.255 is a broadcast
 * session: the server also routes datagrams from any address with the same
 * port to it.
 *
 * Lifetime: the server must outlive its open sessions. Server Close()/Stop()
 * closes every session, and a closed session never touches the server again.
 */
class UdpSession : public std::enable_shared_from_this<UdpSession> {
private:
  // Passkey idiom: allows make_shared while preventing direct construction
  struct PrivateTag {};

public:
  using ReceiveCallback =
      std::function<void(const UdpSessionPtr &session, const Packet &packet)>;
  using DisposeCallback = std::function<void(UdpSession &session)>;

  static UdpSessionPtr Create(UdpServer &server, uint64_t id,
                              const boost::asio::ip::udp::endpoint &remote);

  UdpSession(PrivateTag, UdpServer &server, uint64_t id,
             const boost::asio::ip::udp::endpoint &remote);
  ~UdpSession();

  UdpSession(const UdpSession &) = delete;
  UdpSession &operator=(const UdpSession &) = delete;

  void Start();

  /**
   * Dispose the session (idempotent)
   * Clears pending requests (resolved Cleared), removes the session from the
   * server registry, runs disposal callbacks and publishes SessionClosed.
   * Returns false if the session was already closed.
   */
  bool Close(const std::string &reason);

  // Bytes handed to the socket, or -1 (closed session or send failure)
  int64_t Send(const Packet &packet);

  /**
   * Send a request and wait for the matching response
   * @param timeout_ms 0 uses the server's match_timeout_ms
   * @throws MatchQueueFullError if too many requests are pending
   */
  std::shared_future<MatchOutcome>
  SendMessageAsync(Packet request, int64_t timeout_ms = 0,
                   std::string trace_tag = {});

  /**
   * Inbound datagram for this session
   * Returns true if it resolved a pending request; unmatched datagrams go to
   * the session receive callback and then the server receive callback.
   */
  bool OnReceive(const Packet &packet);

  void set_receive_callback(ReceiveCallback callback);

  // Overrides the server's match predicate for this session
  void set_match_predicate(MatchQueue::Predicate predicate);

  // Run once when the session is disposed
  void AddDisposeCallback(DisposeCallback callback);

  uint64_t id() const { return id_; }
  const boost::asio::ip::udp::endpoint &remote() const { return remote_; }
  const std::string &key() const { return key_; }
  bool is_open() const { return open_.load(); }
  bool is_broadcast() const { return broadcast_; }
  int64_t last_activity_ms() const { return last_activity_ms_.load(); }
  const MatchQueuePtr &match_queue() const { return queue_; }

  std::string ToString() const;

private:
  MatchQueue::Predicate CurrentPredicate() const;

  UdpServer &server_;
  const uint64_t id_;
  const boost::asio::ip::udp::endpoint remote_;
  const std::string key_;
  const bool broadcast_;

  std::atomic<bool> open_{false};
  std::atomic<bool> closed_{false};
  std::atomic<int64_t> last_activity_ms_{0};

  MatchQueuePtr queue_;

  mutable std::mutex mutex_;
  ReceiveCallback receive_callback_;
  std::optional<MatchQueue::Predicate> predicate_;
  std::vector<DisposeCallback> dispose_callbacks_;
};

} // namespace network
} // namespace netsession
