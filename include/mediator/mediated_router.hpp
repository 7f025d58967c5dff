// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "core/participant_registry.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace conduit {

namespace io {
class LineSink;
}  // namespace io

namespace mediator {

struct Message {
  std::string sender;
  std::string body;
};

// A chat room member. Accumulates every message delivered to it.
// Thread-safe: the log is guarded by its own mutex.
class ChatParticipant {
public:
  explicit ChatParticipant(std::string name) : name_(std::move(name)) {}

  const std::string& name() const { return name_; }

  // Mediator capability: accept (sender, body)
  void Receive(const std::string& sender, const std::string& body);

  // Snapshot of received messages, oldest first
  std::vector<Message> ReceivedMessages() const;
  size_t ReceivedCount() const;

private:
  const std::string name_;
  mutable std::mutex mutex_;
  std::vector<Message> received_;
};

using ChatParticipantPtr = std::shared_ptr<ChatParticipant>;

/**
 * MediatedRouter - Chat room that relays messages between its members
 *
 * Design:
 * - Members never talk to each other directly; every message goes
 *   through Send()/SendFrom()
 * - Delivery goes to every member except the sender, in registration order
 * - Each delivery is appended to the receiver's log and, when a sink is
 *   attached, emitted as "<receiver> received: <body>"
 *
 * The sink is borrowed and must outlive the router. Sends are serialized,
 * so the sink sees one message's delivery lines at a time and is never
 * written from two threads at once.
 */
class MediatedRouter {
public:
  explicit MediatedRouter(io::LineSink* sink = nullptr,
                          core::DuplicatePolicy policy = core::DuplicatePolicy::REJECT);

  // Non-copyable
  MediatedRouter(const MediatedRouter&) = delete;
  MediatedRouter& operator=(const MediatedRouter&) = delete;

  // Create and register a member. Duplicates follow the registry policy;
  // with REPLACE the member's log starts over.
  [[nodiscard]] core::RegisterResult AddUser(const std::string& name);

  bool RemoveUser(const std::string& name);

  // Deliver to every member whose name differs from sender. The sender does
  // not need to be a member. Returns the number of deliveries.
  size_t Send(const std::string& sender, const std::string& body);

  // User-initiated send: messages from names that are not members are
  // dropped without error. Returns true if the message was routed.
  bool SendFrom(const std::string& sender, const std::string& body);

  // Member by name, or nullptr if not registered
  ChatParticipantPtr Lookup(const std::string& name) const;

  std::vector<std::string> UserNames() const;
  size_t UserCount() const;

  // Format used for every emitted delivery line
  static std::string FormatDelivery(const std::string& receiver, const std::string& body);

private:
  // Held for the whole of Send()
  std::mutex send_mutex_;

  io::LineSink* sink_;
  core::ParticipantRegistry<ChatParticipantPtr> users_;
};

}  // namespace mediator
}  // namespace conduit
