// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 Line I/O: the two narrow interfaces between the dispatch core and its driver

 - LineSource produces input one line at a time
 - LineSink accepts output one line at a time
 - InputCursor layers token reads over a LineSource, for protocols that
   mix whitespace-separated tokens with whole lines

 Stream-backed implementations serve the command line; in-memory ones
 serve tests and embedding.
*/

#include <deque>
#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace conduit {
namespace io {

class LineSource {
public:
  virtual ~LineSource() = default;

  // Next line without its terminator, or nullopt at end of input
  virtual std::optional<std::string> NextLine() = 0;
};

class LineSink {
public:
  virtual ~LineSink() = default;

  virtual void WriteLine(const std::string& line) = 0;
};

// Reads lines from a borrowed std::istream. A trailing '\r' is stripped.
class StreamLineSource : public LineSource {
public:
  explicit StreamLineSource(std::istream& in) : in_(in) {}

  std::optional<std::string> NextLine() override;

private:
  std::istream& in_;
};

// Writes '\n'-terminated lines to a borrowed std::ostream
class StreamLineSink : public LineSink {
public:
  explicit StreamLineSink(std::ostream& out) : out_(out) {}

  void WriteLine(const std::string& line) override;

private:
  std::ostream& out_;
};

// Serves a fixed list of lines
class VectorLineSource : public LineSource {
public:
  explicit VectorLineSource(std::vector<std::string> lines);

  std::optional<std::string> NextLine() override;

private:
  std::deque<std::string> lines_;
};

// Collects every written line
class CollectingLineSink : public LineSink {
public:
  void WriteLine(const std::string& line) override { lines_.push_back(line); }

  const std::vector<std::string>& lines() const { return lines_; }
  void Clear() { lines_.clear(); }

private:
  std::vector<std::string> lines_;
};

// Token and line reads over a LineSource.
//
// NextToken() crosses line boundaries and skips blank lines.
// NextLine() returns the next line that has not been started: tokens left
// over on a partially consumed line are discarded, so reading a count with
// NextToken() and then records with NextLine() behaves as expected.
class InputCursor {
public:
  explicit InputCursor(LineSource& source) : source_(source) {}

  std::optional<std::string> NextToken();
  std::optional<std::string> NextLine();

  // Next token parsed as an integer in [min, max]. nullopt on end of input
  // or when the token is not such an integer (the token is consumed).
  std::optional<int> NextInt(int min, int max);

private:
  LineSource& source_;
  std::deque<std::string> pending_;
};

}  // namespace io
}  // namespace conduit
