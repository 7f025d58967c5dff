// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 ParticipantRegistry: ordered, name-keyed collection of participants

 Purpose
 - Shared membership store for every dispatch discipline
 - Iteration order is registration order (broadcast and mediator output
   ordering depends on it)

 Key responsibilities
 1. Add participants under unique, non-empty names
 2. Remove participants by name (absent names are a no-op)
 3. Lookup by name
 4. Visit participants in registration order

 Participants are stored by value. Disciplines that need mutable,
 shared participants store a std::shared_ptr.
*/

#include <algorithm>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace conduit {
namespace core {

// What Add() does when the name is already registered
enum class DuplicatePolicy {
  REJECT,   // Keep the existing participant, report DuplicateName
  REPLACE,  // Overwrite the existing participant in its original slot
};

// Registration result codes
enum class RegisterResult {
  Added,
  Replaced,
  DuplicateName,
  InvalidName,
  InvalidParticipant,  // Participant value unusable (e.g. empty callback)
};

std::string RegisterResultAsString(RegisterResult result);
std::string DuplicatePolicyAsString(DuplicatePolicy policy);

// Parse "reject" / "replace". Returns nullopt for anything else.
std::optional<DuplicatePolicy> ParseDuplicatePolicy(const std::string& value);

// True for Added and Replaced
inline bool IsRegistered(RegisterResult result) {
  return result == RegisterResult::Added || result == RegisterResult::Replaced;
}

template <typename T>
class ParticipantRegistry {
public:
  explicit ParticipantRegistry(DuplicatePolicy policy = DuplicatePolicy::REJECT) : policy_(policy) {}

  // Non-copyable
  ParticipantRegistry(const ParticipantRegistry&) = delete;
  ParticipantRegistry& operator=(const ParticipantRegistry&) = delete;

  [[nodiscard]] RegisterResult Add(const std::string& name, T participant) {
    if (name.empty()) {
      return RegisterResult::InvalidName;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = FindLocked(name);
    if (it != entries_.end()) {
      if (policy_ == DuplicatePolicy::REJECT) {
        return RegisterResult::DuplicateName;
      }
      it->participant = std::move(participant);
      return RegisterResult::Replaced;
    }

    entries_.push_back(Entry{name, std::move(participant)});
    return RegisterResult::Added;
  }

  // Returns true if an entry was removed. Removing an unknown name is not an error.
  bool Remove(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = FindLocked(name);
    if (it == entries_.end()) {
      return false;
    }
    entries_.erase(it);
    return true;
  }

  std::optional<T> Lookup(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = FindLocked(name);
    if (it == entries_.end()) {
      return std::nullopt;
    }
    return it->participant;
  }

  bool Contains(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return FindLocked(name) != entries_.end();
  }

  // Apply fn(name, participant) to every entry in registration order.
  // fn runs on a snapshot without holding the lock, so it may call back
  // into the registry (e.g. a participant unregistering itself).
  template <typename Fn>
  void ForEach(Fn&& fn) const {
    std::vector<Entry> snapshot;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      snapshot = entries_;
    }

    for (const auto& entry : snapshot) {
      fn(entry.name, entry.participant);
    }
  }

  // Registered names in registration order
  std::vector<std::string> Names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(entries_.size());
    for (const auto& entry : entries_) {
      names.push_back(entry.name);
    }
    return names;
  }

  size_t Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
  }

  bool Empty() const { return Size() == 0; }

  void Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
  }

  DuplicatePolicy policy() const { return policy_; }

private:
  struct Entry {
    std::string name;
    T participant;
  };

  // Linear scan: registries hold a handful of participants and the vector
  // keeps registration order without a second index.
  typename std::vector<Entry>::iterator FindLocked(const std::string& name) {
    return std::find_if(entries_.begin(), entries_.end(), [&name](const Entry& e) { return e.name == name; });
  }

  typename std::vector<Entry>::const_iterator FindLocked(const std::string& name) const {
    return std::find_if(entries_.begin(), entries_.end(), [&name](const Entry& e) { return e.name == name; });
  }

  const DuplicatePolicy policy_;
  mutable std::mutex mutex_;
  std::vector<Entry> entries_;
};

}  // namespace core
}  // namespace conduit
