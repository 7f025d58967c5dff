// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "mediator/mediated_router.hpp"

#include "io/line_io.hpp"
#include "util/logging.hpp"

namespace conduit {
namespace mediator {

// ============================================================================
// ChatParticipant
// ============================================================================

void ChatParticipant::Receive(const std::string& sender, const std::string& body) {
  std::lock_guard<std::mutex> lock(mutex_);
  received_.push_back(Message{sender, body});
}

std::vector<Message> ChatParticipant::ReceivedMessages() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return received_;
}

size_t ChatParticipant::ReceivedCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return received_.size();
}

// ============================================================================
// MediatedRouter
// ============================================================================

MediatedRouter::MediatedRouter(io::LineSink* sink, core::DuplicatePolicy policy) : sink_(sink), users_(policy) {}

core::RegisterResult MediatedRouter::AddUser(const std::string& name) {
  auto result = users_.Add(name, std::make_shared<ChatParticipant>(name));
  if (core::IsRegistered(result)) {
    LOG_MED_DEBUG("User '{}' {}", name, core::RegisterResultAsString(result));
  } else {
    LOG_MED_WARN("User '{}' not added: {}", name, core::RegisterResultAsString(result));
  }
  return result;
}

bool MediatedRouter::RemoveUser(const std::string& name) {
  return users_.Remove(name);
}

size_t MediatedRouter::Send(const std::string& sender, const std::string& body) {
  std::lock_guard<std::mutex> lock(send_mutex_);

  size_t delivered = 0;
  users_.ForEach([&](const std::string& name, const ChatParticipantPtr& user) {
    if (name == sender) {
      return;
    }
    user->Receive(sender, body);
    if (sink_) {
      sink_->WriteLine(FormatDelivery(name, body));
    }
    ++delivered;
  });

  LOG_MED_TRACE("Message from '{}' delivered to {} users", sender, delivered);
  return delivered;
}

bool MediatedRouter::SendFrom(const std::string& sender, const std::string& body) {
  if (!users_.Contains(sender)) {
    LOG_MED_DEBUG("Dropping message from unknown sender '{}'", sender);
    return false;
  }
  Send(sender, body);
  return true;
}

ChatParticipantPtr MediatedRouter::Lookup(const std::string& name) const {
  auto user = users_.Lookup(name);
  return user ? *user : nullptr;
}

std::vector<std::string> MediatedRouter::UserNames() const {
  return users_.Names();
}

size_t MediatedRouter::UserCount() const {
  return users_.Size();
}

std::string MediatedRouter::FormatDelivery(const std::string& receiver, const std::string& body) {
  return receiver + " received: " + body;
}

}  // namespace mediator
}  // namespace conduit
