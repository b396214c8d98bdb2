// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "service/service_state.hpp"
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>

namespace tyr {
namespace service {

constexpr size_t DEFAULT_SUBSCRIBER_CAPACITY = 16;

/**
 * StatusBroadcaster - fan-out of service status transitions
 *
 * Every subscriber owns a bounded queue. Publish() appends to each queue and
 * drops the oldest entry of a full queue, so a slow reader never blocks a
 * state transition. Events carry a sequence number; a reader can detect
 * drops through Subscription::Dropped() or gaps in the sequence.
 *
 * One broadcaster outlives ServiceManager rebuilds (restore builds a new
 * manager) so subscribers keep receiving events across the swap.
 */
class StatusBroadcaster {
  struct Queue {
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<StatusEvent> events;
    size_t capacity{DEFAULT_SUBSCRIBER_CAPACITY};
    size_t dropped{0};
    bool closed{false};
  };

  struct Shared {
    std::mutex mutex;
    std::map<size_t, std::shared_ptr<Queue>> queues;
    size_t next_id{1};
    uint64_t next_sequence{1};
  };

public:
  /**
   * Subscription handle - RAII
   * Unsubscribes when destroyed. Safe to outlive the broadcaster; Next()
   * then drains what is left and returns nullopt.
   */
  class Subscription {
  public:
    Subscription() = default;
    ~Subscription();

    Subscription(Subscription &&other) noexcept;
    Subscription &operator=(Subscription &&other) noexcept;
    Subscription(const Subscription &) = delete;
    Subscription &operator=(const Subscription &) = delete;

    // Wait up to timeout for the next event
    std::optional<StatusEvent> Next(std::chrono::milliseconds timeout);
    std::optional<StatusEvent> TryNext();

    // Events discarded because this subscriber fell behind
    size_t Dropped() const;

    bool IsActive() const { return queue_ != nullptr; }
    void Unsubscribe();

  private:
    friend class StatusBroadcaster;
    Subscription(std::weak_ptr<Shared> owner, std::shared_ptr<Queue> queue, size_t id);

    std::weak_ptr<Shared> owner_;
    std::shared_ptr<Queue> queue_;
    size_t id_{0};
  };

  StatusBroadcaster();
  ~StatusBroadcaster();

  StatusBroadcaster(const StatusBroadcaster &) = delete;
  StatusBroadcaster &operator=(const StatusBroadcaster &) = delete;

  // The current state is not replayed; call GetStatus() after subscribing
  [[nodiscard]] Subscription Subscribe(size_t capacity = DEFAULT_SUBSCRIBER_CAPACITY);

  // Assigns the sequence number; returns the published event
  StatusEvent Publish(StatusEvent event);

  size_t SubscriberCount() const;

private:
  std::shared_ptr<Shared> shared_;
};

} // namespace service
} // namespace tyr
