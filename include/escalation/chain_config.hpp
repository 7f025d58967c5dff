// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "escalation/escalation_chain.hpp"

#include <string>
#include <vector>

namespace conduit {
namespace escalation {

// Result of loading a chain definition
enum class ChainConfigResult {
  SUCCESS,         // Links parsed and validated
  FILE_NOT_FOUND,  // File missing or unreadable
  PARSE_ERROR,     // Not valid JSON
  INVALID          // Valid JSON, wrong shape or values
};

std::string ChainConfigResultAsString(ChainConfigResult result);

// Chain definition format, either form:
//
//   [{"label": "Supervisor", "capacity": 3}, {"label": "Manager", "capacity": 7}]
//   {"links": [{"label": "Supervisor", "capacity": 3}, ...]}
//
// Order in the file is escalation order. At least one link is required;
// labels must be non-empty strings and capacities non-negative integers.
// On anything other than SUCCESS, out is left untouched.
ChainConfigResult ParseChainLinks(const std::string& json_text, std::vector<ChainLink>& out);
ChainConfigResult LoadChainLinks(const std::string& path, std::vector<ChainLink>& out);

}  // namespace escalation
}  // namespace conduit
