// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/time.hpp"
#include <atomic>

namespace netsession {
namespace util {

// Mock offset in milliseconds, 0 means disabled
static std::atomic<int64_t> g_mock_steady_offset_ms{0};

std::chrono::steady_clock::time_point GetSteadyTime() {
  int64_t offset = g_mock_steady_offset_ms.load(std::memory_order_relaxed);
  return std::chrono::steady_clock::now() + std::chrono::milliseconds(offset);
}

int64_t GetTickCountMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             GetSteadyTime().time_since_epoch())
      .count();
}

void SetMockSteadyOffset(std::chrono::milliseconds offset) {
  g_mock_steady_offset_ms.store(offset.count(), std::memory_order_relaxed);
}

std::chrono::milliseconds GetMockSteadyOffset() {
  return std::chrono::milliseconds(
      g_mock_steady_offset_ms.load(std::memory_order_relaxed));
}

} // namespace util
} // namespace netsession
