#pragma once

#include "tradeloop/events/event.hpp"

#include <cstddef>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace tradeloop {

// -----------------------------------------------------------------------------
// EventBus
// -----------------------------------------------------------------------------
// Responsibility: Publish-subscribe channel for lifecycle events. The agent
// publishes; loggers, the IPC telemetry bridge and tests subscribe.
//
// The agent never calls its observers directly. Anything that wants to know
// about recoveries, rejections or fills subscribes here, so adding a new
// observer does not touch the decision loop.
//
// Thread model: subscribe, unsubscribe and publish are safe from any thread.
// Callbacks run synchronously on the publishing thread (the agent loop
// thread in production) and must not block for long: a slow subscriber
// delays the next stage. Forward to a ThreadSafeQueue for slow work, as the
// IPC bridge does.
// -----------------------------------------------------------------------------
class EventBus {
 public:
  using GenericCallback = std::function<void(const Event&)>;
  using SubscriptionId = std::size_t;

  EventBus() = default;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  // -------------------------------------------------------------------------
  // subscribe(GenericCallback)
  // -------------------------------------------------------------------------
  // What: Registers a callback invoked for every published event.
  // Output: SubscriptionId for unsubscribe().
  // -------------------------------------------------------------------------
  SubscriptionId subscribe(GenericCallback callback);

  // -------------------------------------------------------------------------
  // subscribe<EventType>(callback)
  // -------------------------------------------------------------------------
  // What: Registers a callback invoked only when the published variant holds
  // EventType (e.g. RiskRejectedEvent).
  // Thread-safety: Same as subscribe(GenericCallback).
  // -------------------------------------------------------------------------
  template <typename EventType>
  SubscriptionId subscribe(std::function<void(const EventType&)> callback);

  // -------------------------------------------------------------------------
  // unsubscribe(id)
  // -------------------------------------------------------------------------
  // What: Removes the subscription. A publish() already in progress on
  // another thread may still deliver its current event to the callback.
  // Unknown ids are ignored.
  // -------------------------------------------------------------------------
  void unsubscribe(SubscriptionId id);

  // -------------------------------------------------------------------------
  // publish(event)
  // -------------------------------------------------------------------------
  // What: Delivers the event to every subscriber registered at the time of
  // the call, in subscription order, before returning.
  // Thread-safety: The subscriber list is copied under the lock and the
  // callbacks run without it, so a callback may publish or unsubscribe.
  // -------------------------------------------------------------------------
  void publish(const Event& event);

  std::size_t subscriberCount() const;

 private:
  using SubscriberEntry = std::pair<SubscriptionId, GenericCallback>;

  mutable std::mutex mutex_;      // Protects subscribers_ and next_id_
  SubscriptionId next_id_{0};
  std::vector<SubscriberEntry> subscribers_;
};

// -----------------------------------------------------------------------------
// ScopedSubscription — RAII handle that unsubscribes on destruction
// -----------------------------------------------------------------------------
// Used by components that subscribe for their own lifetime (AgentRuntime's
// telemetry bridge, the log subscriber in main). The bus must outlive the
// handle.
// -----------------------------------------------------------------------------
class ScopedSubscription {
 public:
  ScopedSubscription() = default;
  ScopedSubscription(EventBus& bus, EventBus::SubscriptionId id)
      : bus_(&bus), id_(id) {}

  ~ScopedSubscription() { reset(); }

  ScopedSubscription(const ScopedSubscription&) = delete;
  ScopedSubscription& operator=(const ScopedSubscription&) = delete;

  ScopedSubscription(ScopedSubscription&& other) noexcept
      : bus_(std::exchange(other.bus_, nullptr)), id_(other.id_) {}

  ScopedSubscription& operator=(ScopedSubscription&& other) noexcept {
    if (this != &other) {
      reset();
      bus_ = std::exchange(other.bus_, nullptr);
      id_ = other.id_;
    }
    return *this;
  }

  void reset() {
    if (bus_ != nullptr) {
      bus_->unsubscribe(id_);
      bus_ = nullptr;
    }
  }

 private:
  EventBus* bus_{nullptr};
  EventBus::SubscriptionId id_{0};
};

// -----------------------------------------------------------------------------
// Template implementation: typed subscribe
// -----------------------------------------------------------------------------
template <typename EventType>
EventBus::SubscriptionId EventBus::subscribe(
    std::function<void(const EventType&)> callback) {
  GenericCallback wrapped = [cb = std::move(callback)](const Event& event) {
    if (const auto* ptr = std::get_if<EventType>(&event)) {
      cb(*ptr);
    }
  };
  return subscribe(std::move(wrapped));
}

}  // namespace tradeloop
