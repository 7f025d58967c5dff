// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "escalation/escalation_chain.hpp"

#include "util/logging.hpp"

#include <stdexcept>

namespace conduit {
namespace escalation {

namespace {

std::vector<ChainLink> ValidateLinks(std::vector<ChainLink> links) {
  if (links.empty()) {
    throw std::invalid_argument("EscalationChain requires at least one link");
  }
  for (size_t i = 0; i < links.size(); ++i) {
    if (links[i].label.empty()) {
      throw std::invalid_argument("EscalationChain link " + std::to_string(i) + " has an empty label");
    }
  }
  return links;
}

}  // namespace

std::string OutcomeAsString(Outcome outcome) {
  switch (outcome) {
  case Outcome::APPROVED:
    return "Approved";
  case Outcome::DENIED:
    return "Denied";
  default:
    return "Unknown";
  }
}

EscalationChain::EscalationChain(std::vector<ChainLink> links) : links_(ValidateLinks(std::move(links))) {
  LOG_CHAIN_DEBUG("EscalationChain built with {} links, terminal '{}'", links_.size(), links_.back().label);
}

Decision EscalationChain::Handle(const Request& request) const {
  for (size_t i = 0; i < links_.size(); ++i) {
    if (links_[i].CanApprove(request.magnitude)) {
      LOG_CHAIN_TRACE("'{}' ({}) approved by link {} '{}'", request.subject, request.magnitude, i,
                      links_[i].label);
      return Decision{Outcome::APPROVED, links_[i].label, i};
    }
  }

  const size_t terminal = links_.size() - 1;
  LOG_CHAIN_TRACE("'{}' ({}) exceeds every capacity, denied by '{}'", request.subject, request.magnitude,
                  links_[terminal].label);
  return Decision{Outcome::DENIED, links_[terminal].label, terminal};
}

std::vector<ChainLink> DefaultLeaveApprovalLinks() {
  return {
      {3, "Supervisor"},
      {7, "Manager"},
      {10, "Director"},
  };
}

EscalationChain DefaultLeaveApprovalChain() {
  return EscalationChain(DefaultLeaveApprovalLinks());
}

std::string FormatDecision(const Request& request, const Decision& decision) {
  return request.subject + " " + OutcomeAsString(decision.outcome) + " by " + decision.label + ".";
}

}  // namespace escalation
}  // namespace conduit
