// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/packet.hpp"
#include <atomic>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace netsession {
namespace network {

enum class MatchStatus {
  Matched, // a response satisfied the predicate
  Expired, // deadline passed with no response
  Cleared, // queue was cleared (session disposed)
};

const char *MatchStatusName(MatchStatus status);

struct MatchOutcome {
  MatchStatus status{MatchStatus::Expired};
  Packet result; // empty unless Matched
};

/**
 * MatchCompletion - one-shot completion handle for a pending request
 *
 * Wraps a promise so that exactly one of Match/expiry/Clear can resolve it.
 * The caller keeps future() and waits on it from any thread.
 */
class MatchCompletion {
public:
  MatchCompletion();

  std::shared_future<MatchOutcome> future() const { return future_; }

  // Returns false if the completion was already resolved
  bool TryResolve(MatchOutcome outcome);

  bool done() const { return done_.load(std::memory_order_acquire); }

private:
  std::promise<MatchOutcome> promise_;
  std::shared_future<MatchOutcome> future_;
  std::atomic<bool> done_{false};
};

/**
 * Raised by MatchQueue::Add when every slot is occupied
 */
class MatchQueueFullError : public std::runtime_error {
public:
  explicit MatchQueueFullError(size_t capacity)
      : std::runtime_error("match queue full (" + std::to_string(capacity) +
                           " pending requests)"),
        capacity_(capacity) {}

  size_t capacity() const { return capacity_; }

private:
  size_t capacity_;
};

/**
 * MatchQueue - bounded table of pending requests awaiting a response
 *
 * Slot lifecycle:
 *   Free --Add (CAS null->item)--> Occupied --Match/expire/Clear (CAS item->null)--> Free
 * Each occupancy is freed by exactly one CAS winner, and only the winner
 * resolves the completion. Resolutions are posted to the io_context so the
 * caller of Match (the receive path) never runs continuation code.
 *
 * Expiry runs on a 1 s timer that starts with the first Add and stops itself
 * once no slot is occupied (Clear cancels it right away).
 *
 * Must be owned by a shared_ptr (use Create()); timer callbacks hold a weak
 * reference.
 */
class MatchQueue : public std::enable_shared_from_this<MatchQueue> {
private:
  // Passkey idiom: allows make_shared while preventing direct construction
  struct PrivateTag {};

public:
  using Predicate =
      std::function<bool(const Packet &request, const Packet &response)>;

  static constexpr size_t DEFAULT_CAPACITY = 256;
  static constexpr int64_t DEFAULT_TIMEOUT_MS = 15000;
  // Timeouts at or below this are replaced by DEFAULT_TIMEOUT_MS
  static constexpr int64_t MIN_TIMEOUT_MS = 10;
  static constexpr std::chrono::seconds SWEEP_INTERVAL{1};

  static std::shared_ptr<MatchQueue> Create(boost::asio::io_context &io_context,
                                            size_t capacity = DEFAULT_CAPACITY);

  MatchQueue(PrivateTag, boost::asio::io_context &io_context, size_t capacity);
  ~MatchQueue();

  MatchQueue(const MatchQueue &) = delete;
  MatchQueue &operator=(const MatchQueue &) = delete;

  /**
   * Register a pending request
   * @param owner Identity the response must come from (usually the session)
   * @param timeout_ms Milliseconds until expiry (<= 10 means 15000)
   * @param completion Handle to resolve; a fresh one is created if null
   * @param trace_tag Optional tag logged with the resolution
   * @throws MatchQueueFullError if no slot is free
   */
  std::shared_future<MatchOutcome>
  Add(const void *owner, Packet request, int64_t timeout_ms,
      std::shared_ptr<MatchCompletion> completion = nullptr,
      std::string trace_tag = {});

  /**
   * Resolve the lowest-index pending request of owner accepted by predicate
   * (null predicate accepts any request). Returns true if one was resolved.
   */
  bool Match(const void *owner, const Packet &response, const Packet &result,
             const Predicate &predicate);

  // Resolve every request whose deadline has passed as Expired
  size_t CheckExpired();

  // Resolve every pending request as Cleared
  size_t Clear();

  size_t count() const { return count_.load(std::memory_order_acquire); }
  size_t capacity() const { return slots_.size(); }
  bool timer_running() const { return timer_running_.load(); }

private:
  struct Item {
    const void *owner;
    Packet request;
    std::chrono::steady_clock::time_point expires;
    std::shared_ptr<MatchCompletion> completion;
    std::string trace_tag;
  };
  using ItemPtr = std::shared_ptr<Item>;

  // Free slot if it still holds item; true for the single winner
  bool Release(size_t index, const ItemPtr &item);

  void Resolve(const ItemPtr &item, MatchStatus status, Packet result);

  void StartTimer();
  void ScheduleSweep();
  void OnSweep();
  void OnTimerCancelled();

  boost::asio::io_context &io_context_;
  std::vector<std::atomic<ItemPtr>> slots_;
  std::atomic<size_t> count_{0};

  std::mutex timer_mutex_;
  boost::asio::steady_timer timer_;
  std::atomic<bool> timer_running_{false};
};

using MatchQueuePtr = std::shared_ptr<MatchQueue>;

} // namespace network
} // namespace netsession
