// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <boost/asio/buffer.hpp>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace netsession {
namespace network {

/**
 * Packet - opaque datagram payload
 *
 * A packet is a chain of one or more read-only segments. Each segment is a
 * window (offset, count) into a shared immutable byte buffer, so copying a
 * Packet never copies payload bytes. The transport never interprets the
 * contents; it only needs the total length, a scatter-gather view for
 * sending, and a hex rendering for diagnostics.
 */
class Packet {
public:
  struct Segment {
    std::shared_ptr<const std::vector<uint8_t>> buffer;
    size_t offset{0};
    size_t count{0};

    const uint8_t *data() const { return buffer->data() + offset; }
  };

  Packet() = default;
  explicit Packet(std::vector<uint8_t> data);
  Packet(std::shared_ptr<const std::vector<uint8_t>> buffer, size_t offset,
         size_t count);
  Packet(const uint8_t *data, size_t size);

  static Packet FromString(const std::string &text);

  // Total bytes across all segments
  size_t total() const { return total_; }
  bool empty() const { return total_ == 0; }

  // Segment chain; the first segment is the packet head
  const std::vector<Segment> &segments() const { return segments_; }
  bool is_chained() const { return segments_.size() > 1; }

  // Append another packet's segments to the end of this chain
  void Append(const Packet &next);

  // Scatter-gather view for socket send operations
  std::vector<boost::asio::const_buffer> ToSegments() const;

  // Contiguous copy of all segments
  std::vector<uint8_t> ToVector() const;
  std::string ToStr() const;

  /**
   * Lowercase hex rendering
   * @param max_bytes Render at most this many bytes (0 = all)
   */
  std::string ToHex(size_t max_bytes = 0) const;

  bool operator==(const Packet &other) const;
  bool operator!=(const Packet &other) const { return !(*this == other); }

private:
  std::vector<Segment> segments_;
  size_t total_{0};
};

} // namespace network
} // namespace netsession
