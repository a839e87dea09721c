// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/udp.hpp>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace netsession {
namespace network {

class HostResolver;

// Protocol tag. Values follow IP protocol numbers where one exists.
enum class NetType : uint8_t {
  Unknown = 0,
  Tcp = 6,
  Udp = 17,
  Http = 80,
  Https = 43,
  WebSocket = 81,
};

std::string NetTypeName(NetType type);

/**
 * NetUri - protocol + host/address + port identity of a network peer
 *
 * Host and address are two views of the same identity:
 * - SetAddress() overwrites the host with the address's text form
 * - address() resolves a stored host when no concrete address is set
 *   (through the attached resolver), falling back to the "any" address.
 *   It never modifies the NetUri: concurrent readers are safe, and repeated
 *   lookups are cached by the resolver (CachingHostResolver), not here
 *
 * Canonical text form: "udp://192.168.1.5:502", "http://example.com:80",
 * "[::1]:53" style brackets for IPv6 literals followed by a port, and no
 * scheme at all for NetType::Unknown ("10.0.0.1:80").
 */
class NetUri {
public:
  NetUri() = default;
  explicit NetUri(const std::string &uri);
  NetUri(NetType type, const boost::asio::ip::udp::endpoint &endpoint);
  NetUri(NetType type, const boost::asio::ip::address &address, uint16_t port);
  NetUri(NetType type, const std::string &host, uint16_t port);

  /**
   * Parse text into a new NetUri
   *
   * - "scheme://" prefix selects the protocol; http/ws default to port 80,
   *   https/wss to 443
   * - Trailing path or query ("/...", "\...", "?...") is dropped
   * - A trailing ":port" is taken only when the character before the last
   *   colon is not another colon ("fe80::1" has no port)
   * - IP literals become the address, anything else the host name
   * - Empty or blank input yields a default NetUri
   */
  static NetUri Parse(const std::string &uri);

  NetType type() const { return type_; }
  void set_type(NetType type) { type_ = type; }
  bool is_tcp() const { return type_ == NetType::Tcp; }
  bool is_udp() const { return type_ == NetType::Udp; }

  const std::string &host() const { return host_; }
  void SetHost(const std::string &host);

  /**
   * Effective address (resolves host if no concrete address is stored)
   * Returns 0.0.0.0 when nothing is set or resolution fails.
   */
  boost::asio::ip::address address() const;
  void SetAddress(const boost::asio::ip::address &address);
  bool has_address() const { return address_.has_value(); }

  uint16_t port() const { return port_; }
  void set_port(uint16_t port) { port_ = port; }

  boost::asio::ip::udp::endpoint endpoint() const;
  void SetEndpoint(const boost::asio::ip::udp::endpoint &endpoint);

  // Resolver used for host names; unset means only IP literals resolve
  void set_resolver(std::shared_ptr<HostResolver> resolver) {
    resolver_ = std::move(resolver);
  }
  const std::shared_ptr<HostResolver> &resolver() const { return resolver_; }

  /**
   * All addresses of the host (or the stored address when host is absent)
   * @throws ResolveError if the host cannot be resolved
   */
  std::vector<boost::asio::ip::address> GetAddresses() const;

  // GetAddresses() paired with port()
  std::vector<boost::asio::ip::udp::endpoint> GetEndpoints() const;

  std::string ToString() const;

private:
  // Literal or resolved addresses for a host name; empty if none
  std::vector<boost::asio::ip::address> ResolveHost(const std::string &host) const;

  NetType type_{NetType::Unknown};
  std::string host_;
  std::optional<boost::asio::ip::address> address_;
  uint16_t port_{0};
  std::shared_ptr<HostResolver> resolver_;
};

} // namespace network
} // namespace netsession
