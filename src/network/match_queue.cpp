// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/match_queue.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"
#include <boost/asio/post.hpp>

namespace netsession {
namespace network {

const char *MatchStatusName(MatchStatus status) {
  switch (status) {
  case MatchStatus::Matched: return "matched";
  case MatchStatus::Expired: return "expired";
  case MatchStatus::Cleared: return "cleared";
  }
  return "unknown";
}

// ============================================================================
// MatchCompletion
// ============================================================================

MatchCompletion::MatchCompletion() : future_(promise_.get_future().share()) {}

bool MatchCompletion::TryResolve(MatchOutcome outcome) {
  bool expected = false;
  if (!done_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
    return false;
  }
  promise_.set_value(std::move(outcome));
  return true;
}

// ============================================================================
// MatchQueue
// ============================================================================

std::shared_ptr<MatchQueue> MatchQueue::Create(boost::asio::io_context &io_context,
                                               size_t capacity) {
  return std::make_shared<MatchQueue>(PrivateTag{}, io_context, capacity);
}

MatchQueue::MatchQueue(PrivateTag, boost::asio::io_context &io_context,
                       size_t capacity)
    : io_context_(io_context),
      slots_(capacity > 0 ? capacity : DEFAULT_CAPACITY),
      timer_(io_context) {}

MatchQueue::~MatchQueue() {
  std::lock_guard<std::mutex> lock(timer_mutex_);
  timer_.cancel();
}

std::shared_future<MatchOutcome>
MatchQueue::Add(const void *owner, Packet request, int64_t timeout_ms,
                std::shared_ptr<MatchCompletion> completion,
                std::string trace_tag) {
  if (timeout_ms <= MIN_TIMEOUT_MS) {
    timeout_ms = DEFAULT_TIMEOUT_MS;
  }
  if (!completion) {
    completion = std::make_shared<MatchCompletion>();
  }
  auto future = completion->future();

  auto item = std::make_shared<Item>();
  item->owner = owner;
  item->request = std::move(request);
  item->expires = util::GetSteadyTime() + std::chrono::milliseconds(timeout_ms);
  item->completion = std::move(completion);
  item->trace_tag = std::move(trace_tag);

  for (size_t i = 0; i < slots_.size(); ++i) {
    ItemPtr expected;
    if (slots_[i].compare_exchange_strong(expected, item)) {
      count_.fetch_add(1, std::memory_order_acq_rel);
      if (!item->trace_tag.empty()) {
        LOG_MATCH_TRACE("add slot={} timeout={}ms tag={}", i, timeout_ms,
                        item->trace_tag);
      }
      StartTimer();
      return future;
    }
  }

  LOG_MATCH_WARN("match queue full ({} slots), request rejected", slots_.size());
  throw MatchQueueFullError(slots_.size());
}

bool MatchQueue::Match(const void *owner, const Packet &response,
                       const Packet &result, const Predicate &predicate) {
  if (count() == 0) {
    return false;
  }

  for (size_t i = 0; i < slots_.size(); ++i) {
    ItemPtr item = slots_[i].load();
    if (!item || item->owner != owner) {
      continue;
    }
    if (predicate && !predicate(item->request, response)) {
      continue;
    }
    // Lost to a concurrent Match/expiry; keep scanning
    if (!Release(i, item)) {
      continue;
    }
    Resolve(item, MatchStatus::Matched, result);
    return true;
  }
  return false;
}

size_t MatchQueue::CheckExpired() {
  if (count() == 0) {
    return 0;
  }

  auto now = util::GetSteadyTime();
  size_t expired = 0;
  for (size_t i = 0; i < slots_.size(); ++i) {
    ItemPtr item = slots_[i].load();
    if (!item || item->expires > now) {
      continue;
    }
    if (Release(i, item)) {
      Resolve(item, MatchStatus::Expired, Packet{});
      ++expired;
    }
  }
  if (expired > 0) {
    LOG_MATCH_DEBUG("expired {} pending request(s), {} remaining", expired,
                    count());
  }
  return expired;
}

size_t MatchQueue::Clear() {
  size_t cleared = 0;
  for (size_t i = 0; i < slots_.size(); ++i) {
    ItemPtr item = slots_[i].load();
    if (item && Release(i, item)) {
      Resolve(item, MatchStatus::Cleared, Packet{});
      ++cleared;
    }
  }
  if (cleared > 0) {
    LOG_MATCH_DEBUG("cleared {} pending request(s)", cleared);
  }
  if (count() == 0) {
    // Release the io_context now instead of at the next sweep
    std::lock_guard<std::mutex> lock(timer_mutex_);
    timer_.cancel();
  }
  return cleared;
}

bool MatchQueue::Release(size_t index, const ItemPtr &item) {
  ItemPtr expected = item;
  if (!slots_[index].compare_exchange_strong(expected, nullptr)) {
    return false;
  }
  count_.fetch_sub(1, std::memory_order_acq_rel);
  return true;
}

void MatchQueue::Resolve(const ItemPtr &item, MatchStatus status, Packet result) {
  if (!item->trace_tag.empty()) {
    LOG_MATCH_TRACE("{} tag={} result={} bytes", MatchStatusName(status),
                    item->trace_tag, result.total());
  }
  auto completion = item->completion;
  boost::asio::post(io_context_, [completion, status,
                                  result = std::move(result)]() mutable {
    completion->TryResolve(MatchOutcome{status, std::move(result)});
  });
}

void MatchQueue::StartTimer() {
  bool expected = false;
  if (!timer_running_.compare_exchange_strong(expected, true)) {
    return;
  }
  ScheduleSweep();
}

void MatchQueue::ScheduleSweep() {
  std::lock_guard<std::mutex> lock(timer_mutex_);
  timer_.expires_after(SWEEP_INTERVAL);
  timer_.async_wait([weak = weak_from_this()](const boost::system::error_code &ec) {
    auto self = weak.lock();
    if (!self) {
      return;
    }
    if (ec == boost::asio::error::operation_aborted) {
      self->OnTimerCancelled();
      return;
    }
    self->OnSweep();
  });
}

void MatchQueue::OnTimerCancelled() {
  timer_running_.store(false);
  if (count() > 0) {
    StartTimer();
  }
}

void MatchQueue::OnSweep() {
  CheckExpired();
  if (count() > 0) {
    ScheduleSweep();
    return;
  }
  timer_running_.store(false);
  // An Add between the count check and the store above saw the timer as
  // running and did not start it
  if (count() > 0) {
    StartTimer();
  }
}

} // namespace network
} // namespace netsession
