#pragma once

/*
 String Parsing Utilities

 Purpose:
 - Safe parsing of strings to numeric types with validation
 - Small text helpers shared by URI parsing and the command line

 Key functions:
 - SafeParseInt: Parse integer with bounds checking
 - SafeParsePort: Parse port number (1-65535)
 - Trim / ToLower / EqualsIgnoreCase: ASCII text helpers
 - HexEncode: Render bytes as lowercase hex for diagnostics

 Security:
 - All numeric parsers validate entire input is consumed (no trailing garbage)
 - Bounds checking prevents overflow/underflow
 - Returns std::nullopt on any parsing error (no exceptions thrown)
*/

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace netsession {
namespace util {

/**
 * Parse integer string with bounds checking
 *
 * @param str String to parse
 * @param min Minimum allowed value (inclusive)
 * @param max Maximum allowed value (inclusive)
 * @return Parsed integer or std::nullopt if invalid
 *
 * Examples:
 *   SafeParseInt("42", 0, 100) -> 42
 *   SafeParseInt("999", 0, 100) -> std::nullopt (out of range)
 *   SafeParseInt("42x", 0, 100) -> std::nullopt (trailing chars)
 *   SafeParseInt("", 0, 100) -> std::nullopt (empty string)
 */
std::optional<int> SafeParseInt(const std::string& str, int min, int max);

/**
 * Parse port number string (1-65535)
 *
 * Examples:
 *   SafeParsePort("9590") -> 9590
 *   SafeParsePort("0") -> std::nullopt (port 0 invalid)
 *   SafeParsePort("99999") -> std::nullopt (out of range)
 */
std::optional<uint16_t> SafeParsePort(const std::string& str);

// Strip leading and trailing ASCII whitespace
std::string Trim(const std::string& str);

// ASCII lowercase copy
std::string ToLower(const std::string& str);

bool EqualsIgnoreCase(const std::string& a, const std::string& b);

/**
 * Lowercase hex rendering of a byte range
 *
 * @param max_bytes Render at most this many bytes (0 = all); a trailing
 *                  "..." marks truncation
 */
std::string HexEncode(const uint8_t* data, size_t size, size_t max_bytes = 0);

} // namespace util
} // namespace netsession
