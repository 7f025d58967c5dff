// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/string_parsing.hpp"

#include <cctype>
#include <charconv>

namespace conduit {
namespace util {

std::optional<int> SafeParseInt(const std::string& str, int min, int max) {
  if (str.empty()) {
    return std::nullopt;
  }

  const char* begin = str.data();
  const char* end = str.data() + str.size();

  // from_chars rejects '+', accept it explicitly
  if (*begin == '+') {
    ++begin;
    if (begin == end || *begin == '-') {
      return std::nullopt;
    }
  }

  int value = 0;
  auto [ptr, ec] = std::from_chars(begin, end, value);
  if (ec != std::errc() || ptr != end) {
    return std::nullopt;
  }
  if (value < min || value > max) {
    return std::nullopt;
  }
  return value;
}

std::vector<std::string> SplitWhitespace(const std::string& line) {
  std::vector<std::string> tokens;
  std::string current;
  for (char c : line) {
    if (std::isspace(static_cast<unsigned char>(c))) {
      if (!current.empty()) {
        tokens.push_back(std::move(current));
        current.clear();
      }
    } else {
      current.push_back(c);
    }
  }
  if (!current.empty()) {
    tokens.push_back(std::move(current));
  }
  return tokens;
}

}  // namespace util
}  // namespace conduit
