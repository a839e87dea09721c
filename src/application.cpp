#include "application.hpp"
#include "network/udp_session.hpp"
#include "util/logging.hpp"
#include "util/netaddress.hpp"
#include "version.hpp"
#include <chrono>
#include <future>
#include <iostream>
#include <thread>
#include <unistd.h>  // For write(), STDOUT_FILENO (async-signal-safe)

namespace netsession {
namespace app {

// Static instance for signal handling
Application *Application::instance_ = nullptr;

Application::Application(const AppConfig &config) : config_(config) {
  instance_ = this;
}

Application::~Application() {
  stop();
  instance_ = nullptr;
}

Application *Application::instance() { return instance_; }

bool Application::initialize() {
  if (is_client()) {
    network::NetUri peer(config_.ping_uri);
    if (peer.port() == 0) {
      LOG_APP_ERROR("Peer address needs a port: {}", config_.ping_uri);
      return false;
    }
    config_.server_config.remote = peer;
    // Reply comes from the peer, not from an arbitrary local port
    config_.server_config.local.set_port(0);
  }

  std::cout << GetStartupBanner(is_client() ? "CLIENT" : "RESPONDER",
                                is_client() ? config_.server_config.remote.ToString()
                                            : config_.server_config.local.ToString())
            << std::flush;

  LOG_APP_INFO("Initializing netsessiond...");
  server_ = std::make_unique<network::UdpServer>(config_.server_config);

  new_session_sub_ = server_->notifications().SubscribeNewSession(
      [](const network::UdpSessionPtr &session) {
        LOG_APP_INFO("New session {} from {}", session->id(), session->key());
      });
  session_closed_sub_ = server_->notifications().SubscribeSessionClosed(
      [](uint64_t id, const std::string &key, const std::string &reason) {
        LOG_APP_INFO("Session {} ({}) closed: {}", id, key, reason);
      });

  if (!is_client() && config_.echo) {
    server_->set_receive_callback(
        [](const network::UdpSessionPtr &session, const network::Packet &packet) {
          if (session->Send(packet) < 0) {
            LOG_APP_ERROR("Failed to echo {} bytes to {}", packet.total(),
                          session->key());
          }
        });
  }

  return true;
}

bool Application::start() {
  if (running_) {
    return true;
  }

  if (!server_->Open()) {
    LOG_APP_ERROR("Failed to open udp socket");
    return false;
  }

  setup_signal_handlers();
  running_ = true;

  LOG_APP_INFO("netsessiond started on {}", util::EndpointKey(server_->local_endpoint()));
  if (!is_client()) {
    LOG_APP_INFO("Press Ctrl+C to stop");
  }
  return true;
}

int Application::run_client() {
  int matched = 0;
  for (int i = 0; i < config_.ping_count && !shutdown_requested_; ++i) {
    auto started = std::chrono::steady_clock::now();
    network::MatchOutcome outcome;
    try {
      auto future = server_->SendMessageAsync(
          network::Packet::FromString(config_.ping_payload));
      outcome = future.get();
    } catch (const std::exception &e) {
      LOG_APP_ERROR("Request {} failed: {}", i + 1, e.what());
      continue;
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    if (outcome.status == network::MatchStatus::Matched) {
      ++matched;
      std::cout << "reply from " << config_.server_config.remote.ToString()
                << ": " << outcome.result.total() << " bytes time="
                << elapsed.count() << "ms\n";
    } else {
      std::cout << "request " << i + 1 << " "
                << network::MatchStatusName(outcome.status) << " after "
                << elapsed.count() << "ms\n";
    }
  }
  std::cout << std::flush;
  return matched;
}

void Application::stop() {
  if (!running_) {
    return;
  }

  shutdown();
}

void Application::wait_for_shutdown() {
  // Wait for shutdown signal
  while (running_ && !shutdown_requested_) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  if (shutdown_requested_) {
    shutdown();
  }
}

void Application::shutdown() {
  if (!running_) {
    return;
  }

  LOG_APP_INFO("Shutting down netsessiond...");

  running_ = false;

  // Unsubscribe from notifications BEFORE stopping the server
  new_session_sub_.Unsubscribe();
  session_closed_sub_.Unsubscribe();

  if (server_) {
    server_->Stop();
  }

  LOG_APP_INFO("Shutdown complete");
}

void Application::setup_signal_handlers() {
  std::signal(SIGINT, Application::signal_handler);
  std::signal(SIGTERM, Application::signal_handler);
}

void Application::signal_handler(int signal) {
  (void)signal;
  if (instance_) {
    // Use write() for async-signal-safety (std::cout, snprintf are NOT safe)
    const char* msg = "\nReceived signal\n";
    ssize_t written = write(STDOUT_FILENO, msg, 17);  // Use literal length to avoid strlen()
    (void)written;

    instance_->shutdown_requested_ = true;
  }
}

} // namespace app
} // namespace netsession
