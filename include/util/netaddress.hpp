#pragma once

/*
 Network Address Utilities

 Purpose:
 - Validate and normalize IP address strings
 - Classify addresses ("any", broadcast) and adapt the "any" address between
   IPv4 and IPv6
 - Render endpoints as the canonical peer key used for session lookup
 - Enumerate this host's own interface addresses

 Key functions:
 - ValidateAndNormalizeIP: Validates address format and normalizes (IPv4-mapped -> IPv4)
 - GetRightAny: Pure family adaptation of the "any" address
 - EndpointKey: "address:port" / "[v6]:port" identity string
*/

#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/udp.hpp>
#include <optional>
#include <string>
#include <vector>

namespace netsession {
namespace util {

enum class AddressFamily { IPv4, IPv6 };

/**
 * Validate and normalize an IP address string
 *
 * Wraps boost::asio::ip::make_address() and additionally normalizes
 * IPv4-mapped IPv6 addresses to IPv4 (::ffff:1.2.3.4 -> 1.2.3.4).
 * Hostnames are rejected (only numeric IPs accepted).
 *
 * @return Normalized IP address string, or std::nullopt if invalid
 *
 * Examples:
 *   "192.168.1.1" -> "192.168.1.1"
 *   "::ffff:192.168.1.1" -> "192.168.1.1"
 *   "2001:0db8::0001" -> "2001:db8::1"
 *   "invalid" -> std::nullopt
 */
std::optional<std::string> ValidateAndNormalizeIP(const std::string& address);

AddressFamily FamilyOf(const boost::asio::ip::address& address);

// True for 0.0.0.0 and ::
bool IsAnyAddress(const boost::asio::ip::address& address);

// True for the IPv4 limited broadcast address 255.255.255.255
bool IsBroadcastAddress(const boost::asio::ip::address& address);

/**
 * Pick the "any" address matching an address family
 *
 * - Same family: the address itself (any or not)
 * - IPv6 any requested as IPv4: 0.0.0.0
 * - IPv4 any requested as IPv6: ::
 * - Otherwise std::nullopt (concrete addresses have no cross-family equivalent)
 */
std::optional<boost::asio::ip::address>
GetRightAny(const boost::asio::ip::address& address, AddressFamily family);

/**
 * Canonical peer key for an endpoint
 *
 * "10.0.0.2:5000" for IPv4, "[fe80::1]:5000" for IPv6. Two datagrams from
 * the same address and port always produce the same key.
 */
std::string EndpointKey(const boost::asio::ip::udp::endpoint& endpoint);

/**
 * Addresses assigned to this host's interfaces that are up
 *
 * Loopback interfaces are skipped. Returns an empty list if the interface
 * table cannot be read.
 */
std::vector<boost::asio::ip::address> GetLocalAddresses();

} // namespace util
} // namespace netsession
