#pragma once

#include "network/net_uri.hpp"
#include "network/notifications.hpp"
#include "network/udp_server.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <memory>
#include <string>

namespace netsession {
namespace app {

// Application configuration
struct AppConfig {
  // Socket, session and match settings
  network::UdpServer::Config server_config;

  // Client mode: send ping_payload to this peer and wait for the response
  // (empty = responder mode)
  std::string ping_uri;
  std::string ping_payload = "ping";
  int ping_count = 1;

  // Responder mode: send unmatched datagrams back to their sender
  bool echo = true;

  // Logging
  bool verbose = false;

  AppConfig() {
    server_config.local = network::NetUri("udp://0.0.0.0:7400");
  }
};

// Application - Main application coordinator
// Builds the server, manages lifecycle, handles signals, coordinates shutdown
class Application {
public:
  explicit Application(const AppConfig &config = AppConfig{});
  ~Application();

  // Lifecycle
  bool initialize();
  bool start();
  void stop();
  void wait_for_shutdown();

  /**
   * Client mode: issue ping_count requests to the configured peer
   * Returns the number of requests that got a matching response.
   */
  int run_client();

  bool is_client() const { return !config_.ping_uri.empty(); }

  // Component access
  network::UdpServer &server() { return *server_; }

  // Status
  bool is_running() const { return running_; }

  void request_shutdown() { shutdown_requested_ = true; }

  // Signal handling
  static void signal_handler(int signal);
  static Application *instance();

private:
  AppConfig config_;
  std::atomic<bool> running_{false};
  std::atomic<bool> shutdown_requested_{false};

  std::unique_ptr<network::UdpServer> server_;

  // Notification subscriptions
  // IMPORTANT: Must be declared AFTER server_ so they are destroyed BEFORE it
  network::SessionNotifications::Subscription new_session_sub_;
  network::SessionNotifications::Subscription session_closed_sub_;

  void shutdown();

  // Signal handling
  static Application *instance_;
  void setup_signal_handlers();
};

} // namespace app
} // namespace netsession
