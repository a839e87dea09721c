// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/host_resolver.hpp"
#include "network/match_queue.hpp"
#include "network/net_uri.hpp"
#include "network/notifications.hpp"
#include "network/packet.hpp"
#include "network/udp_session.hpp"
#include "util/netaddress.hpp"
#include "util/threadsafe_containers.hpp"
#include <atomic>
#include <boost/asio.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace netsession {
namespace network {

/**
 * Receive error taxonomy
 *
 * MessageTooLarge: datagram did not fit the receive buffer
 * PeerReset:       ICMP unreachable reported on the socket (reset/refused)
 * PeerAborted:     connection aborted by the stack
 * Aborted:         operation cancelled (socket closing)
 * Other:           anything else
 */
enum class ReceiveErrorKind {
  MessageTooLarge,
  PeerReset,
  PeerAborted,
  Aborted,
  Other,
};

ReceiveErrorKind ClassifyReceiveError(const boost::system::error_code &ec);
const char *ReceiveErrorKindName(ReceiveErrorKind kind);

/**
 * UdpServer - datagram socket shared by per-peer sessions
 *
 * Architecture:
 * - One UDP socket, max_async concurrent async_receive_from operations on a
 *   multi-threaded io_context (each operation owns its buffer)
 * - Session registry: peer key ("addr:port") -> session, plus remote port ->
 *   broadcast session for sessions whose remote is 255.255.255.255
 * - Lookups only take the registry's internal lock; creation is serialized
 *   by create_mutex_ (double-checked), and Close() takes it to flip active_
 *   and drain the registry, so no session is registered into a closed server
 * - Sends, receive initiation and close share socket_mutex_
 *
 * Inbound flow:
 *   datagram -> loopback filter -> lookup-or-create session -> session match
 *   queue -> (unmatched) session callback -> server callback
 *
 * Receive errors never close the server: oversize datagrams grow the buffer,
 * peer reset/abort disposes that peer's session, the rest is logged.
 */
class UdpServer {
public:
  static constexpr size_t DEFAULT_BUFFER_SIZE = 64 * 1024;
  static constexpr size_t MAX_BUFFER_SIZE = 1024 * 1024;
  static constexpr std::chrono::seconds DEFAULT_SESSION_TIMEOUT{1200};
  static constexpr std::chrono::seconds MAINTENANCE_INTERVAL{10};
  static constexpr std::chrono::seconds LOCAL_ADDRESS_REFRESH{60};

  using ReceiveCallback = UdpSession::ReceiveCallback;
  using LocalAddressProvider =
      std::function<std::vector<boost::asio::ip::address>()>;

  struct Config {
    NetUri local;                 // bind address (default udp://0.0.0.0:0)
    NetUri remote;                // peer for point-to-point use (port 0 = none)
    bool reuse_address;           // SO_REUSEADDR before bind
    bool loopback;                // accept datagrams from our own socket
    bool connect_remote;          // connect() the socket to remote after bind
    std::chrono::seconds session_timeout; // idle sessions disposed (0 = never)
    int64_t match_timeout_ms;     // default request timeout
    size_t match_queue_size;      // pending requests per session
    size_t max_async;             // concurrent receives (0 = derived from cores)
    size_t io_threads;            // io_context threads (0 = hardware concurrency)
    size_t buffer_size;           // initial receive buffer per operation
    bool log_send;                // hex dump outgoing datagrams (debug level)
    bool log_receive;             // hex dump incoming datagrams (debug level)
    size_t log_data_length;       // bytes per hex dump (0 = all)
    std::shared_ptr<HostResolver> resolver;
    LocalAddressProvider local_address_provider; // default GetLocalAddresses
    MatchQueue::Predicate match_predicate;       // null matches any request

    Config()
        : local(NetType::Udp,
                boost::asio::ip::address(boost::asio::ip::address_v4::any()), 0),
          reuse_address(false), loopback(false), connect_remote(false),
          session_timeout(DEFAULT_SESSION_TIMEOUT),
          match_timeout_ms(MatchQueue::DEFAULT_TIMEOUT_MS),
          match_queue_size(MatchQueue::DEFAULT_CAPACITY), max_async(0),
          io_threads(0), buffer_size(DEFAULT_BUFFER_SIZE), log_send(false),
          log_receive(false), log_data_length(64) {}
  };

  explicit UdpServer(Config config = Config{});
  ~UdpServer();

  UdpServer(const UdpServer &) = delete;
  UdpServer &operator=(const UdpServer &) = delete;

  /**
   * Bind the socket and start receiving
   * Returns false (and logs) if the socket cannot be opened or bound.
   * Returns true if already open.
   */
  bool Open();

  /**
   * Dispose every session and close the socket
   * Returns false only if the socket shutdown failed for a reason other
   * than the socket being closed or unconnected already.
   */
  bool Close(const std::string &reason = "server closed");

  // Close and stop the io threads (not reopenable)
  void Stop();

  bool is_active() const { return active_.load(); }

  /**
   * Session for remote, created on first use
   * Opens the server first if needed. Returns null if opening fails.
   * Concurrent calls for one peer return the same session.
   */
  UdpSessionPtr CreateSession(const boost::asio::ip::udp::endpoint &remote);

  // Exact peer-key lookup
  UdpSessionPtr GetSession(const std::string &key) const;
  // Peer-key lookup, then broadcast-port lookup
  UdpSessionPtr FindSession(const boost::asio::ip::udp::endpoint &remote) const;
  std::vector<UdpSessionPtr> GetSessions() const;
  size_t SessionCount() const { return sessions_.Size(); }

  // Bytes handed to the socket, or -1
  int64_t SendTo(const Packet &packet, const boost::asio::ip::udp::endpoint &remote);

  /**
   * Request/response with the configured remote
   * @throws std::runtime_error if no remote is configured or the server
   *         cannot be opened; MatchQueueFullError if the session queue is full
   */
  std::shared_future<MatchOutcome> SendMessageAsync(Packet request,
                                                    int64_t timeout_ms = 0);

  // Unmatched datagrams of every session
  void set_receive_callback(ReceiveCallback callback);

  // True if a datagram from remote was sent by this server's own socket
  bool IsSelfReception(const boost::asio::ip::udp::endpoint &remote);

  // Close sessions idle for longer than session_timeout; returns count
  size_t DisposeIdleSessions();

  SessionNotifications &notifications() { return notifications_; }
  boost::asio::io_context &io_context() { return *io_context_; }
  const Config &config() const { return config_; }

  boost::asio::ip::udp::endpoint local_endpoint() const;
  uint64_t filtered_count() const { return filtered_count_.load(); }
  size_t receive_buffer_size() const { return buffer_size_.load(); }

  std::string ToString() const;

#ifdef NETSESSION_TESTS
  // Test-only: run the receive error policy for ec on an extra receive
  // operation of the current socket generation
  void InjectReceiveErrorForTest(const boost::system::error_code &ec);
#endif

private:
  friend class UdpSession;

  struct ReceiveOp {
    std::vector<uint8_t> buffer;
    boost::asio::ip::udp::endpoint remote;
    uint64_t generation{0};
  };
  using ReceiveOpPtr = std::shared_ptr<ReceiveOp>;

  bool OpenForFamily(std::optional<util::AddressFamily> family);
  void StartIoThreads();

  // Must not be called with socket_mutex_ held
  void StartReceive(const ReceiveOpPtr &op);
  void HandleReceive(const ReceiveOpPtr &op, const boost::system::error_code &ec,
                     size_t bytes);
  void HandleReceiveError(const ReceiveOpPtr &op,
                          const boost::system::error_code &ec);
  void ProcessDatagram(const boost::asio::ip::udp::endpoint &remote,
                       const Packet &packet);

  UdpSessionPtr LookupSession(const std::string &key, uint16_t port) const;

  // Called by UdpSession
  void RemoveSession(UdpSession &session);
  void DeliverUnmatched(const UdpSessionPtr &session, const Packet &packet);

  std::optional<boost::asio::ip::udp::endpoint> RemoteEndpoint() const;
  void RefreshLocalAddresses(bool force);

  void ScheduleMaintenance();

  Config config_;

  // Declared first: destroyed after everything that references it
  std::unique_ptr<boost::asio::io_context> io_context_;
  std::unique_ptr<
      boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
      work_guard_;
  std::vector<std::thread> io_threads_;
  std::atomic<bool> io_running_{false};

  SessionNotifications notifications_;

  // Socket state (guarded by socket_mutex_)
  mutable std::mutex socket_mutex_;
  boost::asio::ip::udp::socket socket_;
  boost::asio::ip::udp::endpoint local_endpoint_;
  bool connected_{false};
  boost::asio::ip::udp::endpoint connected_remote_;
  bool broadcast_enabled_{false};
  bool closing_{false};  // Close() in progress; Open refused
  uint64_t generation_{0};

  std::atomic<bool> active_{false};
  std::atomic<bool> stopped_{false};
  std::atomic<size_t> buffer_size_;
  std::atomic<uint64_t> filtered_count_{0};

  // Session registry
  util::ThreadSafeMap<std::string, UdpSessionPtr> sessions_;
  util::ThreadSafeMap<uint16_t, UdpSessionPtr> broadcasts_;
  std::mutex create_mutex_;  // Lock order: create_mutex_, then socket_mutex_
  std::atomic<uint64_t> next_session_id_{1};

  std::mutex callback_mutex_;
  ReceiveCallback receive_callback_;

  // Own addresses for the loopback filter when bound to "any"
  std::mutex local_addresses_mutex_;
  std::vector<boost::asio::ip::address> local_addresses_;
  std::chrono::steady_clock::time_point local_addresses_refreshed_{};

  std::mutex maintenance_mutex_;
  boost::asio::steady_timer maintenance_timer_;
};

} // namespace network
} // namespace netsession
