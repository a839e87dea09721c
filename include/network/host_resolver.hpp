// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address.hpp>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace netsession {
namespace network {

/**
 * Raised when a host name cannot be resolved. The message names the host.
 */
class ResolveError : public std::runtime_error {
public:
  ResolveError(const std::string &host, const std::string &reason)
      : std::runtime_error("failed to resolve host '" + host + "': " + reason),
        host_(host) {}

  const std::string &host() const { return host_; }

private:
  std::string host_;
};

/**
 * HostResolver - name resolution service
 *
 * Injected wherever a host name has to be turned into addresses (NetUri,
 * UdpServer). Implementations return IPv4/IPv6 addresses only, an empty list
 * when the name has no usable records, and throw ResolveError on failure.
 */
class HostResolver {
public:
  virtual ~HostResolver() = default;

  virtual std::vector<boost::asio::ip::address>
  Resolve(const std::string &host) = 0;
};

/**
 * AsioHostResolver - blocking resolution through boost::asio's resolver
 */
class AsioHostResolver : public HostResolver {
public:
  AsioHostResolver() = default;

  std::vector<boost::asio::ip::address>
  Resolve(const std::string &host) override;

private:
  // Private context; the resolver runs synchronously on the calling thread
  boost::asio::io_context io_context_;
  std::mutex mutex_;
};

/**
 * CachingHostResolver - TTL cache in front of another resolver
 *
 * Invalidate() is the hook to call when the host's network configuration
 * changes (interface up/down, address change); it drops every cached entry.
 * Failed lookups are not cached.
 */
class CachingHostResolver : public HostResolver {
public:
  static constexpr std::chrono::seconds DEFAULT_TTL{60};

  explicit CachingHostResolver(std::shared_ptr<HostResolver> inner,
                               std::chrono::seconds ttl = DEFAULT_TTL);

  std::vector<boost::asio::ip::address>
  Resolve(const std::string &host) override;

  void Invalidate();

  size_t cached_entries() const;

private:
  struct Entry {
    std::vector<boost::asio::ip::address> addresses;
    std::chrono::steady_clock::time_point expires;
  };

  std::shared_ptr<HostResolver> inner_;
  std::chrono::seconds ttl_;
  mutable std::mutex mutex_;
  std::map<std::string, Entry> cache_;
};

} // namespace network
} // namespace netsession
