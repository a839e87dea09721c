// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/net_uri.hpp"
#include "network/host_resolver.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"

namespace netsession {
namespace network {

namespace {

constexpr const char *SCHEME_SEPARATOR = "://";

boost::asio::ip::address AnyV4() {
  return boost::asio::ip::address(boost::asio::ip::address_v4::any());
}

NetType ParseType(const std::string &scheme) {
  if (scheme.empty()) return NetType::Unknown;
  if (util::EqualsIgnoreCase(scheme, "http")) return NetType::Http;
  if (util::EqualsIgnoreCase(scheme, "https")) return NetType::Https;
  if (util::EqualsIgnoreCase(scheme, "ws") || util::EqualsIgnoreCase(scheme, "wss"))
    return NetType::WebSocket;
  if (util::EqualsIgnoreCase(scheme, "tcp")) return NetType::Tcp;
  if (util::EqualsIgnoreCase(scheme, "udp")) return NetType::Udp;
  return NetType::Unknown;
}

std::optional<boost::asio::ip::address> ParseLiteral(const std::string &text) {
  boost::system::error_code ec;
  auto address = boost::asio::ip::make_address(text, ec);
  if (ec) {
    return std::nullopt;
  }
  return address;
}

} // namespace

std::string NetTypeName(NetType type) {
  switch (type) {
  case NetType::Unknown: return "unknown";
  case NetType::Tcp: return "tcp";
  case NetType::Udp: return "udp";
  case NetType::Http: return "http";
  case NetType::Https: return "https";
  case NetType::WebSocket: return "websocket";
  }
  return "unknown";
}

NetUri::NetUri(const std::string &uri) { *this = Parse(uri); }

NetUri::NetUri(NetType type, const boost::asio::ip::udp::endpoint &endpoint)
    : type_(type) {
  SetEndpoint(endpoint);
}

NetUri::NetUri(NetType type, const boost::asio::ip::address &address, uint16_t port)
    : type_(type), port_(port) {
  SetAddress(address);
}

NetUri::NetUri(NetType type, const std::string &host, uint16_t port)
    : type_(type), port_(port) {
  SetHost(host);
}

NetUri NetUri::Parse(const std::string &uri) {
  NetUri result;

  std::string text = util::Trim(uri);
  if (text.empty()) {
    return result;
  }

  std::string scheme;
  auto sep = text.find(SCHEME_SEPARATOR);
  if (sep != std::string::npos) {
    scheme = util::ToLower(util::Trim(text.substr(0, sep)));
    result.type_ = ParseType(scheme);
    text = util::Trim(text.substr(sep + 3));
  }

  // Well-known ports, overridden by an explicit ":port" below
  if (scheme == "http" || scheme == "ws") {
    result.port_ = 80;
  } else if (scheme == "https" || scheme == "wss") {
    result.port_ = 443;
  }

  // Looks like a full URI: drop path and query
  auto p = text.find('/');
  if (p == std::string::npos) p = text.find('\\');
  if (p == std::string::npos) p = text.find('?');
  if (p != std::string::npos) {
    text = util::Trim(text.substr(0, p));
  }

  // Port suffix, unless the last colon belongs to an IPv6 "::"
  p = text.rfind(':');
  if (p != std::string::npos && (p < 1 || text[p - 1] != ':')) {
    auto port = util::SafeParseInt(text.substr(p + 1), 0, 65535);
    if (port) {
      result.port_ = static_cast<uint16_t>(*port);
      text = util::Trim(text.substr(0, p));
    }
  }

  if (text.size() >= 2 && text.front() == '[' && text.back() == ']') {
    text = text.substr(1, text.size() - 2);
  }

  if (auto address = ParseLiteral(text)) {
    result.SetAddress(*address);
  } else {
    result.host_ = text;
  }

  return result;
}

void NetUri::SetHost(const std::string &host) {
  host_ = host;
  address_.reset();
  if (auto address = ParseLiteral(host)) {
    address_ = *address;
  }
}

boost::asio::ip::address NetUri::address() const {
  if ((address_ && !address_->is_unspecified()) || host_.empty()) {
    return address_.value_or(AnyV4());
  }
  try {
    auto addresses = ResolveHost(host_);
    if (!addresses.empty()) {
      return addresses.front();
    }
  } catch (const ResolveError &e) {
    LOG_NET_DEBUG("{}, using any address", e.what());
  }
  return address_.value_or(AnyV4());
}

void NetUri::SetAddress(const boost::asio::ip::address &address) {
  address_ = address;
  host_ = address.to_string();
}

boost::asio::ip::udp::endpoint NetUri::endpoint() const {
  return boost::asio::ip::udp::endpoint(address(), port_);
}

void NetUri::SetEndpoint(const boost::asio::ip::udp::endpoint &endpoint) {
  SetAddress(endpoint.address());
  port_ = endpoint.port();
}

std::vector<boost::asio::ip::address>
NetUri::ResolveHost(const std::string &host) const {
  if (host.empty() || host == "*") {
    return {};
  }
  if (auto literal = ParseLiteral(host)) {
    return {*literal};
  }
  if (!resolver_) {
    LOG_NET_TRACE("no resolver attached, cannot resolve {}", host);
    return {};
  }
  return resolver_->Resolve(host);
}

std::vector<boost::asio::ip::address> NetUri::GetAddresses() const {
  auto addresses = ResolveHost(host_);
  if (addresses.empty()) {
    return {address()};
  }
  return addresses;
}

std::vector<boost::asio::ip::udp::endpoint> NetUri::GetEndpoints() const {
  std::vector<boost::asio::ip::udp::endpoint> endpoints;
  for (const auto &address : GetAddresses()) {
    endpoints.emplace_back(address, port_);
  }
  return endpoints;
}

std::string NetUri::ToString() const {
  std::string protocol;
  switch (type_) {
  case NetType::Unknown:
    break;
  case NetType::WebSocket:
    protocol = port_ == 443 ? "wss" : "ws";
    break;
  default:
    protocol = NetTypeName(type_);
    break;
  }

  std::string host = host_;
  if (host.empty()) {
    host = address().to_string();
  }
  // IPv6 literal followed by a port needs brackets
  if (port_ > 0 && host.find(':') != std::string::npos) {
    host = "[" + host + "]";
  }

  std::string out = protocol.empty() ? host : protocol + SCHEME_SEPARATOR + host;
  if (port_ > 0) {
    out += ":" + std::to_string(port_);
  }
  return out;
}

} // namespace network
} // namespace netsession
