// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/packet.hpp"
#include "util/string_parsing.hpp"
#include <stdexcept>

namespace netsession {
namespace network {

Packet::Packet(std::vector<uint8_t> data) {
  if (data.empty()) {
    return;
  }
  auto buffer = std::make_shared<const std::vector<uint8_t>>(std::move(data));
  size_t size = buffer->size();
  segments_.push_back(Segment{std::move(buffer), 0, size});
  total_ = size;
}

Packet::Packet(std::shared_ptr<const std::vector<uint8_t>> buffer,
               size_t offset, size_t count) {
  if (!buffer || offset > buffer->size() || count > buffer->size() - offset) {
    throw std::out_of_range("Packet segment exceeds buffer bounds");
  }
  if (count == 0) {
    return;
  }
  segments_.push_back(Segment{std::move(buffer), offset, count});
  total_ = count;
}

Packet::Packet(const uint8_t *data, size_t size)
    : Packet(std::vector<uint8_t>(data, data + size)) {}

Packet Packet::FromString(const std::string &text) {
  return Packet(std::vector<uint8_t>(text.begin(), text.end()));
}

void Packet::Append(const Packet &next) {
  segments_.insert(segments_.end(), next.segments_.begin(), next.segments_.end());
  total_ += next.total_;
}

std::vector<boost::asio::const_buffer> Packet::ToSegments() const {
  std::vector<boost::asio::const_buffer> buffers;
  buffers.reserve(segments_.size());
  for (const auto &segment : segments_) {
    buffers.emplace_back(segment.data(), segment.count);
  }
  return buffers;
}

std::vector<uint8_t> Packet::ToVector() const {
  std::vector<uint8_t> out;
  out.reserve(total_);
  for (const auto &segment : segments_) {
    out.insert(out.end(), segment.data(), segment.data() + segment.count);
  }
  return out;
}

std::string Packet::ToStr() const {
  auto bytes = ToVector();
  return std::string(bytes.begin(), bytes.end());
}

std::string Packet::ToHex(size_t max_bytes) const {
  if (!is_chained()) {
    if (segments_.empty()) {
      return {};
    }
    return util::HexEncode(segments_.front().data(), total_, max_bytes);
  }
  auto bytes = ToVector();
  return util::HexEncode(bytes.data(), bytes.size(), max_bytes);
}

bool Packet::operator==(const Packet &other) const {
  if (total_ != other.total_) {
    return false;
  }
  return ToVector() == other.ToVector();
}

} // namespace network
} // namespace netsession
