// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "core/participant_registry.hpp"

namespace conduit {
namespace core {

std::string RegisterResultAsString(RegisterResult result) {
  switch (result) {
  case RegisterResult::Added:
    return "added";
  case RegisterResult::Replaced:
    return "replaced";
  case RegisterResult::DuplicateName:
    return "duplicate-name";
  case RegisterResult::InvalidName:
    return "invalid-name";
  case RegisterResult::InvalidParticipant:
    return "invalid-participant";
  default:
    return "unknown";
  }
}

std::string DuplicatePolicyAsString(DuplicatePolicy policy) {
  switch (policy) {
  case DuplicatePolicy::REJECT:
    return "reject";
  case DuplicatePolicy::REPLACE:
    return "replace";
  default:
    return "unknown";
  }
}

std::optional<DuplicatePolicy> ParseDuplicatePolicy(const std::string& value) {
  if (value == "reject") {
    return DuplicatePolicy::REJECT;
  }
  if (value == "replace") {
    return DuplicatePolicy::REPLACE;
  }
  return std::nullopt;
}

}  // namespace core
}  // namespace conduit
