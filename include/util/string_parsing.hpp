// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <climits>
#include <optional>
#include <string>
#include <vector>

namespace conduit {
namespace util {

// Strict decimal integer parse. Accepts an optional leading '-' or '+' and
// digits only: no whitespace, no trailing characters, no overflow.
// Returns nullopt if the string is not an integer within [min, max].
std::optional<int> SafeParseInt(const std::string& str, int min = INT_MIN, int max = INT_MAX);

// Split on runs of ASCII whitespace. Leading/trailing whitespace yields no
// empty tokens.
std::vector<std::string> SplitWhitespace(const std::string& line);

}  // namespace util
}  // namespace conduit
