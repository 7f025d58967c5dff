// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace conduit {
namespace escalation {

// One handler in an escalation chain
struct ChainLink {
  int capacity{0};  // Largest magnitude this link may approve
  std::string label;

  bool CanApprove(int magnitude) const { return magnitude <= capacity; }
};

struct Request {
  std::string subject;
  int magnitude{0};
};

enum class Outcome {
  APPROVED,  // A link with enough capacity accepted the request
  DENIED,    // No link accepted; the terminal link denies
};

struct Decision {
  Outcome outcome;
  std::string label;  // Label of the deciding link
  size_t link_index;  // Position of the deciding link in the chain
};

std::string OutcomeAsString(Outcome outcome);

// EscalationChain - ordered handlers with capacity predicates
//
// A request walks the chain front to back exactly once and stops at the
// first link that can approve it. If none can, the last link denies it, so
// every request on a non-empty chain gets exactly one decision.
//
// The chain is a flat sequence fixed at construction; links hold no
// successor pointers.
//
// THREAD SAFETY: immutable after construction, all methods are const.
class EscalationChain {
public:
  // Throws std::invalid_argument if links is empty or any label is empty.
  explicit EscalationChain(std::vector<ChainLink> links);

  Decision Handle(const Request& request) const;

  const std::vector<ChainLink>& Links() const { return links_; }
  size_t Size() const { return links_.size(); }

private:
  const std::vector<ChainLink> links_;
};

// Supervisor (3), Manager (7), Director (10)
std::vector<ChainLink> DefaultLeaveApprovalLinks();
EscalationChain DefaultLeaveApprovalChain();

// "<subject> Approved by <label>." / "<subject> Denied by <label>."
std::string FormatDecision(const Request& request, const Decision& decision);

}  // namespace escalation
}  // namespace conduit
