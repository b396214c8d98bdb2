// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "service/status_broadcaster.hpp"

namespace tyr {
namespace service {

const char *ServiceStateName(ServiceState state) {
  switch (state) {
  case ServiceState::Stopped:
    return "stopped";
  case ServiceState::Starting:
    return "starting";
  case ServiceState::Running:
    return "running";
  case ServiceState::Stopping:
    return "stopping";
  case ServiceState::Error:
    return "error";
  }
  return "unknown";
}

// ============================================================================
// StatusBroadcaster::Subscription
// ============================================================================

StatusBroadcaster::Subscription::Subscription(std::weak_ptr<Shared> owner,
                                              std::shared_ptr<Queue> queue, size_t id)
    : owner_(std::move(owner)), queue_(std::move(queue)), id_(id) {}

StatusBroadcaster::Subscription::~Subscription() { Unsubscribe(); }

StatusBroadcaster::Subscription::Subscription(Subscription &&other) noexcept
    : owner_(std::move(other.owner_)), queue_(std::move(other.queue_)), id_(other.id_) {
  other.id_ = 0;
}

StatusBroadcaster::Subscription &
StatusBroadcaster::Subscription::operator=(Subscription &&other) noexcept {
  if (this != &other) {
    Unsubscribe();
    owner_ = std::move(other.owner_);
    queue_ = std::move(other.queue_);
    id_ = other.id_;
    other.id_ = 0;
  }
  return *this;
}

void StatusBroadcaster::Subscription::Unsubscribe() {
  if (!queue_) return;
  if (auto owner = owner_.lock()) {
    std::lock_guard<std::mutex> lock(owner->mutex);
    owner->queues.erase(id_);
  }
  queue_.reset();
  owner_.reset();
  id_ = 0;
}

std::optional<StatusEvent> StatusBroadcaster::Subscription::Next(std::chrono::milliseconds timeout) {
  if (!queue_) return std::nullopt;
  std::unique_lock<std::mutex> lock(queue_->mutex);
  queue_->cv.wait_for(lock, timeout,
                      [this] { return !queue_->events.empty() || queue_->closed; });
  if (queue_->events.empty()) return std::nullopt;
  StatusEvent ev = std::move(queue_->events.front());
  queue_->events.pop_front();
  return ev;
}

std::optional<StatusEvent> StatusBroadcaster::Subscription::TryNext() {
  if (!queue_) return std::nullopt;
  std::lock_guard<std::mutex> lock(queue_->mutex);
  if (queue_->events.empty()) return std::nullopt;
  StatusEvent ev = std::move(queue_->events.front());
  queue_->events.pop_front();
  return ev;
}

size_t StatusBroadcaster::Subscription::Dropped() const {
  if (!queue_) return 0;
  std::lock_guard<std::mutex> lock(queue_->mutex);
  return queue_->dropped;
}

// ============================================================================
// StatusBroadcaster
// ============================================================================

StatusBroadcaster::StatusBroadcaster() : shared_(std::make_shared<Shared>()) {}

StatusBroadcaster::~StatusBroadcaster() {
  std::lock_guard<std::mutex> lock(shared_->mutex);
  for (auto &[id, q] : shared_->queues) {
    std::lock_guard<std::mutex> qlock(q->mutex);
    q->closed = true;
    q->cv.notify_all();
  }
}

StatusBroadcaster::Subscription StatusBroadcaster::Subscribe(size_t capacity) {
  auto queue = std::make_shared<Queue>();
  queue->capacity = capacity == 0 ? 1 : capacity;
  std::lock_guard<std::mutex> lock(shared_->mutex);
  const size_t id = shared_->next_id++;
  shared_->queues.emplace(id, queue);
  return Subscription(shared_, std::move(queue), id);
}

StatusEvent StatusBroadcaster::Publish(StatusEvent event) {
  std::lock_guard<std::mutex> lock(shared_->mutex);
  event.sequence = shared_->next_sequence++;
  for (auto &[id, q] : shared_->queues) {
    std::lock_guard<std::mutex> qlock(q->mutex);
    if (q->events.size() >= q->capacity) {
      q->events.pop_front();
      ++q->dropped;
    }
    q->events.push_back(event);
    q->cv.notify_one();
  }
  return event;
}

size_t StatusBroadcaster::SubscriberCount() const {
  std::lock_guard<std::mutex> lock(shared_->mutex);
  return shared_->queues.size();
}

} // namespace service
} // namespace tyr
