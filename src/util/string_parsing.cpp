#include "util/string_parsing.hpp"
#include <algorithm>
#include <cctype>

namespace netsession {
namespace util {

std::optional<int> SafeParseInt(const std::string& str, int min, int max) {
  try {
    // Reject empty or whitespace-only strings
    if (str.empty() || std::isspace(static_cast<unsigned char>(str[0]))) {
      return std::nullopt;
    }

    size_t pos = 0;
    long value = std::stol(str, &pos);

    // Check entire string was consumed
    if (pos != str.size()) {
      return std::nullopt;
    }

    if (value < min || value > max) {
      return std::nullopt;
    }

    return static_cast<int>(value);
  } catch (const std::exception&) {
    // std::invalid_argument / std::out_of_range from stol
    return std::nullopt;
  }
}

std::optional<uint16_t> SafeParsePort(const std::string& str) {
  auto value = SafeParseInt(str, 1, 65535);
  if (!value) {
    return std::nullopt;
  }
  return static_cast<uint16_t>(*value);
}

std::string Trim(const std::string& str) {
  auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
  auto begin = std::find_if_not(str.begin(), str.end(), is_space);
  auto end = std::find_if_not(str.rbegin(), str.rend(), is_space).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

std::string ToLower(const std::string& str) {
  std::string out(str);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

bool EqualsIgnoreCase(const std::string& a, const std::string& b) {
  if (a.size() != b.size()) {
    return false;
  }
  return std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
    return std::tolower(x) == std::tolower(y);
  });
}

std::string HexEncode(const uint8_t* data, size_t size, size_t max_bytes) {
  static constexpr char kDigits[] = "0123456789abcdef";

  size_t count = size;
  if (max_bytes > 0 && max_bytes < size) {
    count = max_bytes;
  }

  std::string out;
  out.reserve(count * 2 + 3);
  for (size_t i = 0; i < count; ++i) {
    out.push_back(kDigits[data[i] >> 4]);
    out.push_back(kDigits[data[i] & 0x0f]);
  }
  if (count < size) {
    out += "...";
  }
  return out;
}

} // namespace util
} // namespace netsession
