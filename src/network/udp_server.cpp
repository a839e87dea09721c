// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/udp_server.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"
#include <algorithm>
#include <exception>
#include <stdexcept>

namespace netsession {
namespace network {

using boost::asio::ip::udp;

ReceiveErrorKind ClassifyReceiveError(const boost::system::error_code &ec) {
  if (ec == boost::asio::error::message_size) {
    return ReceiveErrorKind::MessageTooLarge;
  }
  // Linux reports an ICMP port unreachable as ECONNREFUSED
  if (ec == boost::asio::error::connection_reset ||
      ec == boost::asio::error::connection_refused) {
    return ReceiveErrorKind::PeerReset;
  }
  if (ec == boost::asio::error::connection_aborted) {
    return ReceiveErrorKind::PeerAborted;
  }
  if (ec == boost::asio::error::operation_aborted ||
      ec == boost::asio::error::bad_descriptor) {
    return ReceiveErrorKind::Aborted;
  }
  return ReceiveErrorKind::Other;
}

const char *ReceiveErrorKindName(ReceiveErrorKind kind) {
  switch (kind) {
  case ReceiveErrorKind::MessageTooLarge: return "message too large";
  case ReceiveErrorKind::PeerReset: return "peer reset";
  case ReceiveErrorKind::PeerAborted: return "peer aborted";
  case ReceiveErrorKind::Aborted: return "aborted";
  case ReceiveErrorKind::Other: return "other";
  }
  return "unknown";
}

namespace {

size_t DefaultMaxAsync() {
  size_t cores = std::thread::hardware_concurrency();
  return std::max<size_t>(1, cores * 16 / 10);
}

size_t DefaultIoThreads() {
  return std::max<size_t>(1, std::thread::hardware_concurrency());
}

// IPv4-mapped IPv6 source addresses compare as their IPv4 form
boost::asio::ip::address Unmapped(const boost::asio::ip::address &address) {
  if (address.is_v6() && address.to_v6().is_v4_mapped()) {
    return boost::asio::ip::make_address_v4(boost::asio::ip::v4_mapped,
                                            address.to_v6());
  }
  return address;
}

} // namespace

UdpServer::UdpServer(Config config)
    : config_(std::move(config)),
      io_context_(std::make_unique<boost::asio::io_context>()),
      notifications_(*io_context_), socket_(*io_context_),
      buffer_size_(std::clamp<size_t>(config_.buffer_size, 512, MAX_BUFFER_SIZE)),
      maintenance_timer_(*io_context_) {
  if (!config_.resolver) {
    config_.resolver = std::make_shared<CachingHostResolver>(
        std::make_shared<AsioHostResolver>());
  }
  if (!config_.local.resolver()) {
    config_.local.set_resolver(config_.resolver);
  }
  if (!config_.remote.resolver()) {
    config_.remote.set_resolver(config_.resolver);
  }
  if (config_.max_async == 0) {
    config_.max_async = DefaultMaxAsync();
  }
  if (config_.io_threads == 0) {
    config_.io_threads = DefaultIoThreads();
  }
}

UdpServer::~UdpServer() { Stop(); }

// ============================================================================
// Lifecycle
// ============================================================================

bool UdpServer::Open() {
  std::optional<util::AddressFamily> family;
  if (auto remote = RemoteEndpoint()) {
    family = util::FamilyOf(remote->address());
  }
  return OpenForFamily(family);
}

bool UdpServer::OpenForFamily(std::optional<util::AddressFamily> family) {
  if (stopped_.load()) {
    return false;
  }

  // Resolve outside the socket lock; resolution may block
  auto local_address = config_.local.address();
  if (family && util::IsAnyAddress(local_address)) {
    if (auto adapted = util::GetRightAny(local_address, *family)) {
      local_address = *adapted;
    }
  }
  udp::endpoint local(local_address, config_.local.port());
  std::optional<udp::endpoint> remote;
  if (config_.connect_remote) {
    remote = RemoteEndpoint();
  }

  size_t receive_ops = 0;
  {
    std::lock_guard<std::mutex> lock(socket_mutex_);
    if (active_.load()) {
      return true;
    }
    if (closing_) {
      LOG_NET_DEBUG("udp server is closing, open on {} refused",
                    util::EndpointKey(local));
      return false;
    }

    try {
      socket_.open(local.protocol());
      if (config_.reuse_address) {
        socket_.set_option(udp::socket::reuse_address(true));
      }
      socket_.bind(local);
      if (remote) {
        socket_.connect(*remote);
        connected_ = true;
        connected_remote_ = *remote;
      }
      local_endpoint_ = socket_.local_endpoint();
    } catch (const boost::system::system_error &e) {
      LOG_NET_ERROR("failed to open udp socket on {}: {}",
                    util::EndpointKey(local), e.what());
      boost::system::error_code ec;
      socket_.close(ec);
      connected_ = false;
      return false;
    }

    broadcast_enabled_ = false;
    ++generation_;
    active_.store(true);
    receive_ops = config_.max_async;
  }

  if (remote) {
    LOG_NET_INFO("udp server listening on {} (connected to {})",
                 util::EndpointKey(local_endpoint()), util::EndpointKey(*remote));
  } else {
    LOG_NET_INFO("udp server listening on {}", util::EndpointKey(local_endpoint()));
  }

  StartIoThreads();
  RefreshLocalAddresses(true);

  uint64_t generation;
  {
    std::lock_guard<std::mutex> lock(socket_mutex_);
    generation = generation_;
  }
  for (size_t i = 0; i < receive_ops; ++i) {
    auto op = std::make_shared<ReceiveOp>();
    op->generation = generation;
    boost::asio::post(*io_context_, [this, op]() { StartReceive(op); });
  }

  ScheduleMaintenance();
  return true;
}

bool UdpServer::Close(const std::string &reason) {
  // Registrations happen under create_mutex_ while active: once the flag is
  // down no session can be added behind the drain
  std::vector<UdpSessionPtr> sessions;
  {
    std::lock_guard<std::mutex> create_lock(create_mutex_);
    if (!active_.load()) {
      return true;
    }
    {
      std::lock_guard<std::mutex> lock(socket_mutex_);
      closing_ = true;
    }
    active_.store(false);
    sessions = sessions_.TakeAll();
    broadcasts_.Clear();
  }

  for (auto &session : sessions) {
    session->Close(reason);
  }

  {
    std::lock_guard<std::mutex> lock(maintenance_mutex_);
    maintenance_timer_.cancel();
  }

  bool ok = true;
  {
    std::lock_guard<std::mutex> lock(socket_mutex_);
    ++generation_;

    boost::system::error_code ec;
    socket_.shutdown(udp::socket::shutdown_both, ec);
    if (ec && ec != boost::asio::error::bad_descriptor &&
        ec != boost::asio::error::not_connected) {
      LOG_NET_WARN("udp socket shutdown failed: {}", ec.message());
      ok = false;
    }
    // Cancels the outstanding receives (operation_aborted)
    socket_.close(ec);
    connected_ = false;
    broadcast_enabled_ = false;
    closing_ = false;
  }

  LOG_NET_INFO("udp server on {} closed: {}", util::EndpointKey(local_endpoint()),
               reason);
  return ok;
}

void UdpServer::Stop() {
  if (stopped_.exchange(true)) {
    return;
  }

  Close("server stopped");

  // Let posted completions (Cleared requests, notifications) run, then exit
  work_guard_.reset();
  for (auto &thread : io_threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  io_threads_.clear();
  io_context_->stop();

  // io_context_ itself lives until ~UdpServer(): sessions and timers that
  // still reference it are destroyed first
}

void UdpServer::StartIoThreads() {
  if (io_running_.exchange(true)) {
    return;
  }
  io_context_->restart();
  work_guard_ = std::make_unique<boost::asio::executor_work_guard<
      boost::asio::io_context::executor_type>>(
      boost::asio::make_work_guard(*io_context_));
  for (size_t i = 0; i < config_.io_threads; i++) {
    io_threads_.emplace_back([this]() { io_context_->run(); });
  }
}

// ============================================================================
// Receive path
// ============================================================================

void UdpServer::StartReceive(const ReceiveOpPtr &op) {
  std::lock_guard<std::mutex> lock(socket_mutex_);
  if (!active_.load() || op->generation != generation_ || !socket_.is_open()) {
    return;
  }

  size_t wanted = buffer_size_.load();
  if (op->buffer.size() < wanted) {
    op->buffer.resize(wanted);
  }
  op->remote = udp::endpoint(
      *util::GetRightAny(boost::asio::ip::address(boost::asio::ip::address_v4::any()),
                         util::FamilyOf(local_endpoint_.address())),
      0);

  socket_.async_receive_from(
      boost::asio::buffer(op->buffer), op->remote,
      [this, op](const boost::system::error_code &ec, size_t bytes) {
        HandleReceive(op, ec, bytes);
      });
}

void UdpServer::HandleReceive(const ReceiveOpPtr &op,
                              const boost::system::error_code &ec, size_t bytes) {
  if (ec) {
    HandleReceiveError(op, ec);
    return;
  }

  udp::endpoint remote = op->remote;
  Packet packet(op->buffer.data(), bytes);

  try {
    ProcessDatagram(remote, packet);
  } catch (const std::exception &e) {
    LOG_NET_WARN("error processing datagram from {}: {}",
                 util::EndpointKey(remote), e.what());
  }

  StartReceive(op);
}

void UdpServer::HandleReceiveError(const ReceiveOpPtr &op,
                                   const boost::system::error_code &ec) {
  auto kind = ClassifyReceiveError(ec);
  switch (kind) {
  case ReceiveErrorKind::Aborted:
    LOG_NET_TRACE("receive operation ended: {}", ec.message());
    return;

  case ReceiveErrorKind::MessageTooLarge: {
    size_t current = buffer_size_.load();
    size_t grown = std::min(current * 2, MAX_BUFFER_SIZE);
    if (grown > current && buffer_size_.compare_exchange_strong(current, grown)) {
      LOG_NET_WARN("datagram exceeded {} byte buffer, growing to {}", current,
                   grown);
    } else if (current >= MAX_BUFFER_SIZE) {
      LOG_NET_WARN("datagram from {} exceeds {} bytes, dropped",
                   util::EndpointKey(op->remote), MAX_BUFFER_SIZE);
    }
    break;
  }

  case ReceiveErrorKind::PeerReset:
  case ReceiveErrorKind::PeerAborted: {
    udp::endpoint remote = op->remote;
    {
      std::lock_guard<std::mutex> lock(socket_mutex_);
      // A connected socket reports the error without a source address
      if (connected_ && remote.port() == 0) {
        remote = connected_remote_;
      }
    }
    auto key = util::EndpointKey(remote);
    LOG_NET_DEBUG("{} from {}: {}", ReceiveErrorKindName(kind), key, ec.message());
    if (auto session = GetSession(key)) {
      session->Close(ReceiveErrorKindName(kind));
    }
    break;
  }

  case ReceiveErrorKind::Other:
    LOG_NET_WARN("udp receive error: {}", ec.message());
    break;
  }

  StartReceive(op);
}

void UdpServer::ProcessDatagram(const udp::endpoint &remote, const Packet &packet) {
  if (!config_.loopback && IsSelfReception(remote)) {
    filtered_count_.fetch_add(1);
    LOG_NET_TRACE("dropped {} byte datagram from own socket {}", packet.total(),
                  util::EndpointKey(remote));
    return;
  }

  if (config_.log_receive) {
    LOG_NET_DEBUG("recv {} bytes from {}: {}", packet.total(),
                  util::EndpointKey(remote), packet.ToHex(config_.log_data_length));
  }

  // A datagram completing after Close() must not reopen the socket
  auto session = active_.load() ? CreateSession(remote) : nullptr;
  if (!session) {
    LOG_NET_DEBUG("no session for datagram from {}, dropped",
                  util::EndpointKey(remote));
    return;
  }
  session->OnReceive(packet);
}

bool UdpServer::IsSelfReception(const udp::endpoint &remote) {
  auto local = local_endpoint();
  if (remote.port() != local.port()) {
    return false;
  }

  auto source = Unmapped(remote.address());
  auto bound = Unmapped(local.address());
  if (!util::IsAnyAddress(bound)) {
    return source == bound;
  }
  if (source.is_loopback()) {
    return true;
  }

  RefreshLocalAddresses(false);
  std::lock_guard<std::mutex> lock(local_addresses_mutex_);
  return std::find(local_addresses_.begin(), local_addresses_.end(), source) !=
         local_addresses_.end();
}

void UdpServer::RefreshLocalAddresses(bool force) {
  auto now = util::GetSteadyTime();
  {
    std::lock_guard<std::mutex> lock(local_addresses_mutex_);
    if (!force && now - local_addresses_refreshed_ < LOCAL_ADDRESS_REFRESH) {
      return;
    }
    local_addresses_refreshed_ = now;
  }

  std::vector<boost::asio::ip::address> addresses;
  try {
    addresses = config_.local_address_provider ? config_.local_address_provider()
                                               : util::GetLocalAddresses();
  } catch (const std::exception &e) {
    LOG_NET_WARN("failed to list local addresses: {}", e.what());
    return;
  }
  for (auto &address : addresses) {
    address = Unmapped(address);
  }

  std::lock_guard<std::mutex> lock(local_addresses_mutex_);
  local_addresses_ = std::move(addresses);
}

// ============================================================================
// Sessions
// ============================================================================

UdpSessionPtr UdpServer::CreateSession(const udp::endpoint &remote) {
  if (stopped_.load()) {
    return nullptr;
  }
  if (!active_.load() && !OpenForFamily(util::FamilyOf(remote.address()))) {
    return nullptr;
  }

  auto key = util::EndpointKey(remote);
  if (auto session = LookupSession(key, remote.port())) {
    return session;
  }

  std::lock_guard<std::mutex> lock(create_mutex_);
  if (auto session = LookupSession(key, remote.port())) {
    return session;
  }
  // Close() ran after the open above
  if (!active_.load()) {
    LOG_SESSION_DEBUG("server closed, no session for {}", key);
    return nullptr;
  }

  auto session = UdpSession::Create(*this, next_session_id_.fetch_add(1), remote);
  if (session->is_broadcast()) {
    uint16_t port = remote.port();
    broadcasts_.Insert(port, session);
    session->AddDisposeCallback([this, port](UdpSession &closed) {
      broadcasts_.EraseIf(port, [&closed](const UdpSessionPtr &entry) {
        return entry.get() == &closed;
      });
    });
  }
  session->Start();
  sessions_.Insert(key, session);
  notifications_.NotifyNewSession(session);

  LOG_SESSION_DEBUG("new session {} for {} ({} total)", session->id(), key,
                    sessions_.Size());
  return session;
}

UdpSessionPtr UdpServer::LookupSession(const std::string &key,
                                       uint16_t port) const {
  if (auto session = sessions_.Get(key)) {
    return *session;
  }
  if (auto session = broadcasts_.Get(port)) {
    return *session;
  }
  return nullptr;
}

UdpSessionPtr UdpServer::GetSession(const std::string &key) const {
  auto session = sessions_.Get(key);
  return session ? *session : nullptr;
}

UdpSessionPtr UdpServer::FindSession(const udp::endpoint &remote) const {
  return LookupSession(util::EndpointKey(remote), remote.port());
}

std::vector<UdpSessionPtr> UdpServer::GetSessions() const {
  std::vector<UdpSessionPtr> sessions;
  for (auto &[key, session] : sessions_.GetAll()) {
    sessions.push_back(session);
  }
  return sessions;
}

void UdpServer::RemoveSession(UdpSession &session) {
  sessions_.EraseIf(session.key(), [&session](const UdpSessionPtr &entry) {
    return entry.get() == &session;
  });
}

void UdpServer::DeliverUnmatched(const UdpSessionPtr &session,
                                 const Packet &packet) {
  ReceiveCallback callback;
  {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    callback = receive_callback_;
  }
  if (!callback) {
    return;
  }
  try {
    callback(session, packet);
  } catch (const std::exception &e) {
    LOG_NET_WARN("receive callback threw for {}: {}", session->key(), e.what());
  }
}

void UdpServer::set_receive_callback(ReceiveCallback callback) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  receive_callback_ = std::move(callback);
}

size_t UdpServer::DisposeIdleSessions() {
  if (config_.session_timeout.count() <= 0) {
    return 0;
  }
  int64_t now = util::GetTickCountMs();
  int64_t limit_ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(config_.session_timeout)
          .count();

  size_t disposed = 0;
  for (const auto &session : GetSessions()) {
    if (now - session->last_activity_ms() > limit_ms && session->Close("idle timeout")) {
      ++disposed;
    }
  }
  if (disposed > 0) {
    LOG_SESSION_DEBUG("disposed {} idle session(s)", disposed);
  }
  return disposed;
}

void UdpServer::ScheduleMaintenance() {
  if (config_.session_timeout.count() <= 0) {
    return;
  }
  std::lock_guard<std::mutex> lock(maintenance_mutex_);
  maintenance_timer_.expires_after(MAINTENANCE_INTERVAL);
  maintenance_timer_.async_wait([this](const boost::system::error_code &ec) {
    if (ec == boost::asio::error::operation_aborted || !active_.load()) {
      return;
    }
    DisposeIdleSessions();
    ScheduleMaintenance();
  });
}

// ============================================================================
// Send path
// ============================================================================

int64_t UdpServer::SendTo(const Packet &packet, const udp::endpoint &remote) {
  bool broadcast = util::IsBroadcastAddress(remote.address());
  boost::system::error_code ec;
  size_t sent = 0;
  {
    std::lock_guard<std::mutex> lock(socket_mutex_);
    if (!active_.load()) {
      LOG_NET_TRACE("send to {} on closed server ignored", util::EndpointKey(remote));
      return -1;
    }

    if (connected_ && !broadcast_enabled_ && !broadcast) {
      sent = socket_.send(packet.ToSegments(), 0, ec);
    } else {
      if (broadcast && !broadcast_enabled_) {
        socket_.set_option(boost::asio::socket_base::broadcast(true), ec);
        if (ec) {
          LOG_NET_WARN("failed to enable broadcast: {}", ec.message());
          return -1;
        }
        broadcast_enabled_ = true;
      }
      sent = socket_.send_to(packet.ToSegments(), remote, 0, ec);
    }
  }

  if (ec) {
    LOG_NET_DEBUG("send {} bytes to {} failed: {}", packet.total(),
                  util::EndpointKey(remote), ec.message());
    return -1;
  }
  if (config_.log_send) {
    LOG_NET_DEBUG("send {} bytes to {}: {}", sent, util::EndpointKey(remote),
                  packet.ToHex(config_.log_data_length));
  }
  return static_cast<int64_t>(sent);
}

std::shared_future<MatchOutcome> UdpServer::SendMessageAsync(Packet request,
                                                             int64_t timeout_ms) {
  auto remote = RemoteEndpoint();
  if (!remote) {
    throw std::runtime_error("no remote configured for request");
  }
  auto session = CreateSession(*remote);
  if (!session) {
    throw std::runtime_error("udp server could not be opened for " +
                             util::EndpointKey(*remote));
  }
  return session->SendMessageAsync(std::move(request), timeout_ms);
}

std::optional<udp::endpoint> UdpServer::RemoteEndpoint() const {
  if (config_.remote.port() == 0) {
    return std::nullopt;
  }
  return config_.remote.endpoint();
}

// ============================================================================
// Introspection
// ============================================================================

udp::endpoint UdpServer::local_endpoint() const {
  std::lock_guard<std::mutex> lock(socket_mutex_);
  return local_endpoint_;
}

std::string UdpServer::ToString() const {
  std::string text = util::EndpointKey(local_endpoint());
  size_t count = SessionCount();
  if (count > 0) {
    text += " [" + std::to_string(count) + "]";
  }
  return text;
}

#ifdef NETSESSION_TESTS
void UdpServer::InjectReceiveErrorForTest(const boost::system::error_code &ec) {
  auto op = std::make_shared<ReceiveOp>();
  {
    std::lock_guard<std::mutex> lock(socket_mutex_);
    op->generation = generation_;
  }
  HandleReceiveError(op, ec);
}
#endif

} // namespace network
} // namespace netsession
