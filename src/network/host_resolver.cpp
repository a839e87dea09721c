// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/host_resolver.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"
#include <algorithm>
#include <boost/asio/ip/udp.hpp>

namespace netsession {
namespace network {

std::vector<boost::asio::ip::address>
AsioHostResolver::Resolve(const std::string &host) {
  std::vector<boost::asio::ip::address> addresses;

  boost::system::error_code ec;
  boost::asio::ip::udp::resolver::results_type results;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    boost::asio::ip::udp::resolver resolver(io_context_);
    results = resolver.resolve(host, "", ec);
  }
  if (ec) {
    LOG_NET_DEBUG("failed to resolve {}: {}", host, ec.message());
    throw ResolveError(host, ec.message());
  }

  for (const auto &entry : results) {
    auto address = entry.endpoint().address();
    if (std::find(addresses.begin(), addresses.end(), address) == addresses.end()) {
      addresses.push_back(address);
    }
  }

  LOG_NET_TRACE("resolved {} to {} address(es)", host, addresses.size());
  return addresses;
}

CachingHostResolver::CachingHostResolver(std::shared_ptr<HostResolver> inner,
                                         std::chrono::seconds ttl)
    : inner_(std::move(inner)), ttl_(ttl) {
  if (!inner_) {
    throw std::invalid_argument("CachingHostResolver requires an inner resolver");
  }
}

std::vector<boost::asio::ip::address>
CachingHostResolver::Resolve(const std::string &host) {
  auto now = util::GetSteadyTime();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = cache_.find(host);
    if (it != cache_.end()) {
      if (it->second.expires > now) {
        return it->second.addresses;
      }
      cache_.erase(it);
    }
  }

  // Resolve outside the lock; a concurrent miss for the same host resolves
  // twice and the later result wins
  auto addresses = inner_->Resolve(host);

  std::lock_guard<std::mutex> lock(mutex_);
  cache_[host] = Entry{addresses, now + ttl_};
  return addresses;
}

void CachingHostResolver::Invalidate() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!cache_.empty()) {
    LOG_NET_DEBUG("resolver cache invalidated ({} entries)", cache_.size());
  }
  cache_.clear();
}

size_t CachingHostResolver::cached_entries() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return cache_.size();
}

} // namespace network
} // namespace netsession
