// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "observer/broadcast_notifier.hpp"

#include "util/logging.hpp"

namespace conduit {
namespace observer {

BroadcastNotifier::BroadcastNotifier(core::DuplicatePolicy policy) : observers_(policy) {}

core::RegisterResult BroadcastNotifier::Register(const std::string& name, StateCallback callback) {
  if (!callback) {
    LOG_OBS_WARN("Rejecting observer '{}': empty callback", name);
    return core::RegisterResult::InvalidParticipant;
  }

  auto result = observers_.Add(name, std::move(callback));
  if (core::IsRegistered(result)) {
    LOG_OBS_DEBUG("Observer '{}' {} ({} registered)", name, core::RegisterResultAsString(result),
                  observers_.Size());
  } else {
    LOG_OBS_WARN("Observer '{}' not registered: {}", name, core::RegisterResultAsString(result));
  }
  return result;
}

bool BroadcastNotifier::Unregister(const std::string& name) {
  bool removed = observers_.Remove(name);
  LOG_OBS_DEBUG("Unregister observer '{}': {}", name, removed ? "removed" : "not registered");
  return removed;
}

void BroadcastNotifier::Advance() {
  std::lock_guard<std::mutex> dispatch_lock(dispatch_mutex_);

  int hour;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    hour_ = (hour_ + 1) % HOURS_PER_DAY;
    hour = hour_;
  }

  LOG_OBS_TRACE("Hour advanced to {}, notifying {} observers", hour, observers_.Size());

  // Snapshot dispatch: observers may unregister themselves from the callback
  observers_.ForEach([hour](const std::string& name, const StateCallback& callback) { callback(name, hour); });
}

int BroadcastNotifier::Hour() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return hour_;
}

size_t BroadcastNotifier::ParticipantCount() const {
  return observers_.Size();
}

}  // namespace observer
}  // namespace conduit
