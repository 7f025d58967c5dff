// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "io/line_io.hpp"

#include "util/string_parsing.hpp"

namespace conduit {
namespace io {

std::optional<std::string> StreamLineSource::NextLine() {
  std::string line;
  if (!std::getline(in_, line)) {
    return std::nullopt;
  }
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }
  return line;
}

void StreamLineSink::WriteLine(const std::string& line) {
  out_ << line << '\n';
}

VectorLineSource::VectorLineSource(std::vector<std::string> lines)
    : lines_(std::make_move_iterator(lines.begin()), std::make_move_iterator(lines.end())) {}

std::optional<std::string> VectorLineSource::NextLine() {
  if (lines_.empty()) {
    return std::nullopt;
  }
  std::string line = std::move(lines_.front());
  lines_.pop_front();
  return line;
}

std::optional<std::string> InputCursor::NextToken() {
  while (pending_.empty()) {
    auto line = source_.NextLine();
    if (!line) {
      return std::nullopt;
    }
    for (auto& token : util::SplitWhitespace(*line)) {
      pending_.push_back(std::move(token));
    }
  }

  std::string token = std::move(pending_.front());
  pending_.pop_front();
  return token;
}

std::optional<std::string> InputCursor::NextLine() {
  pending_.clear();
  return source_.NextLine();
}

std::optional<int> InputCursor::NextInt(int min, int max) {
  auto token = NextToken();
  if (!token) {
    return std::nullopt;
  }
  return util::SafeParseInt(*token, min, max);
}

}  // namespace io
}  // namespace conduit
