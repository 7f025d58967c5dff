// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "core/participant_registry.hpp"

#include <functional>
#include <mutex>
#include <string>

namespace conduit {
namespace observer {

// Number of distinct hours the clock cycles through
static constexpr int HOURS_PER_DAY = 24;

// Broadcast notifier for hour-of-day changes
//
// Design:
// - Simple observer pattern with std::function
// - Subject state (the hour) changes only through Advance()
// - Synchronous callbacks, registration order, nobody excluded
// - Thread-safe: Advance() calls are serialized by dispatch_mutex_, so every
//   observer sees hours in increasing order. Callbacks run on a registry
//   snapshot and may Register()/Unregister(), but must not call Advance()
//   (the dispatch mutex is not recursive)
class BroadcastNotifier {
public:
  // Observer capability: receives the participant's own name and the new hour
  using StateCallback = std::function<void(const std::string& name, int hour)>;

  explicit BroadcastNotifier(core::DuplicatePolicy policy = core::DuplicatePolicy::REJECT);

  // Non-copyable
  BroadcastNotifier(const BroadcastNotifier&) = delete;
  BroadcastNotifier& operator=(const BroadcastNotifier&) = delete;

  // Register an observer. An empty name is rejected with InvalidName, an
  // empty callback with InvalidParticipant.
  [[nodiscard]] core::RegisterResult Register(const std::string& name, StateCallback callback);

  // Returns false if no observer with that name was registered.
  bool Unregister(const std::string& name);

  // Step the clock by one hour (mod 24) and notify every observer of the
  // new hour, in registration order. Always succeeds.
  void Advance();

  int Hour() const;
  size_t ParticipantCount() const;

private:
  // Held for the whole of Advance(): one update and its dispatch at a time
  std::mutex dispatch_mutex_;

  mutable std::mutex state_mutex_;
  int hour_{0};  // [0, HOURS_PER_DAY)

  core::ParticipantRegistry<StateCallback> observers_;
};

}  // namespace observer
}  // namespace conduit
