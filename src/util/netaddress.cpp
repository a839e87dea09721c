#include "util/netaddress.hpp"
#include "util/logging.hpp"
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <cerrno>
#include <cstring>

namespace netsession {
namespace util {

std::optional<std::string> ValidateAndNormalizeIP(const std::string& address) {
  if (address.empty()) {
    return std::nullopt;
  }

  boost::system::error_code ec;
  auto ip = boost::asio::ip::make_address(address, ec);
  if (ec) {
    return std::nullopt;
  }

  // Normalize IPv4-mapped IPv6 addresses to IPv4 format
  if (ip.is_v6() && ip.to_v6().is_v4_mapped()) {
    auto v4 = boost::asio::ip::make_address_v4(boost::asio::ip::v4_mapped, ip.to_v6());
    return v4.to_string();
  }

  return ip.to_string();
}

AddressFamily FamilyOf(const boost::asio::ip::address& address) {
  return address.is_v6() ? AddressFamily::IPv6 : AddressFamily::IPv4;
}

bool IsAnyAddress(const boost::asio::ip::address& address) {
  return address.is_unspecified();
}

bool IsBroadcastAddress(const boost::asio::ip::address& address) {
  return address.is_v4() && address.to_v4() == boost::asio::ip::address_v4::broadcast();
}

std::optional<boost::asio::ip::address>
GetRightAny(const boost::asio::ip::address& address, AddressFamily family) {
  if (FamilyOf(address) == family) {
    return address;
  }

  switch (family) {
  case AddressFamily::IPv4:
    if (address == boost::asio::ip::address(boost::asio::ip::address_v6::any())) {
      return boost::asio::ip::address(boost::asio::ip::address_v4::any());
    }
    break;
  case AddressFamily::IPv6:
    if (address == boost::asio::ip::address(boost::asio::ip::address_v4::any())) {
      return boost::asio::ip::address(boost::asio::ip::address_v6::any());
    }
    break;
  }
  return std::nullopt;
}

std::string EndpointKey(const boost::asio::ip::udp::endpoint& endpoint) {
  const auto& address = endpoint.address();
  if (address.is_v6()) {
    return "[" + address.to_string() + "]:" + std::to_string(endpoint.port());
  }
  return address.to_string() + ":" + std::to_string(endpoint.port());
}

std::vector<boost::asio::ip::address> GetLocalAddresses() {
  std::vector<boost::asio::ip::address> result;

  struct ifaddrs* if_list = nullptr;
  if (getifaddrs(&if_list) != 0) {
    int err = errno;
    LOG_NET_WARN("getifaddrs failed: {}", std::strerror(err));
    return result;
  }

  for (struct ifaddrs* ifa = if_list; ifa != nullptr; ifa = ifa->ifa_next) {
    if (!ifa->ifa_addr) {
      continue;
    }
    if (!(ifa->ifa_flags & IFF_UP) || (ifa->ifa_flags & IFF_LOOPBACK)) {
      continue;
    }

    if (ifa->ifa_addr->sa_family == AF_INET) {
      const auto* sin = reinterpret_cast<const sockaddr_in*>(ifa->ifa_addr);
      boost::asio::ip::address_v4::bytes_type bytes;
      std::memcpy(bytes.data(), &sin->sin_addr, bytes.size());
      result.emplace_back(boost::asio::ip::address_v4(bytes));
    } else if (ifa->ifa_addr->sa_family == AF_INET6) {
      const auto* sin6 = reinterpret_cast<const sockaddr_in6*>(ifa->ifa_addr);
      boost::asio::ip::address_v6::bytes_type bytes;
      std::memcpy(bytes.data(), &sin6->sin6_addr, bytes.size());
      result.emplace_back(boost::asio::ip::address_v6(bytes, sin6->sin6_scope_id));
    }
  }

  freeifaddrs(if_list);
  return result;
}

} // namespace util
} // namespace netsession
