// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <cstdint>

namespace netsession {
namespace util {

/**
 * Mockable monotonic time source
 *
 * Production code reads GetSteadyTime() / GetTickCountMs() instead of
 * std::chrono::steady_clock directly. Tests push the clock forward with
 * SetMockSteadyOffset() so that deadline logic (match queue expiry, idle
 * sessions) can be exercised without sleeping.
 *
 * The mock is an offset added to the real steady clock, so time keeps
 * advancing monotonically while the offset is set.
 */

/**
 * Current steady clock time plus the mock offset (if any)
 */
std::chrono::steady_clock::time_point GetSteadyTime();

/**
 * Milliseconds since the steady clock epoch (mock offset included).
 * Immune to wall-clock adjustments.
 */
int64_t GetTickCountMs();

/**
 * Set the mock offset added to the steady clock (0 disables mocking)
 */
void SetMockSteadyOffset(std::chrono::milliseconds offset);

/**
 * Current mock offset (0 when disabled)
 */
std::chrono::milliseconds GetMockSteadyOffset();

/**
 * RAII helper to set a steady clock offset and restore it when scope exits
 */
class MockSteadyTimeScope {
public:
  explicit MockSteadyTimeScope(std::chrono::milliseconds offset)
      : previous_offset_(GetMockSteadyOffset()) {
    SetMockSteadyOffset(offset);
  }

  ~MockSteadyTimeScope() { SetMockSteadyOffset(previous_offset_); }

  // Advance relative to the current offset
  void Advance(std::chrono::milliseconds delta) {
    SetMockSteadyOffset(GetMockSteadyOffset() + delta);
  }

  MockSteadyTimeScope(const MockSteadyTimeScope&) = delete;
  MockSteadyTimeScope& operator=(const MockSteadyTimeScope&) = delete;
  MockSteadyTimeScope(MockSteadyTimeScope&&) = delete;
  MockSteadyTimeScope& operator=(MockSteadyTimeScope&&) = delete;

private:
  const std::chrono::milliseconds previous_offset_;
};

} // namespace util
} // namespace netsession
