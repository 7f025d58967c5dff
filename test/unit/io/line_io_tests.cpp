// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Unit tests for line sources, sinks and the input cursor

#include <catch2/catch_test_macros.hpp>
#include "io/line_io.hpp"
#include <sstream>

using namespace conduit::io;

TEST_CASE("StreamLineSource: Reads lines until EOF", "[io]") {
    std::istringstream in("first\r\nsecond\n\nlast");
    StreamLineSource source(in);

    CHECK(source.NextLine() == "first");
    CHECK(source.NextLine() == "second");
    CHECK(source.NextLine() == "");
    CHECK(source.NextLine() == "last");
    CHECK_FALSE(source.NextLine().has_value());
}

TEST_CASE("StreamLineSink: Writes newline-terminated lines", "[io]") {
    std::ostringstream out;
    StreamLineSink sink(out);
    sink.WriteLine("Amy 1");
    sink.WriteLine("");
    CHECK(out.str() == "Amy 1\n\n");
}

TEST_CASE("VectorLineSource and CollectingLineSink", "[io]") {
    VectorLineSource source({"a", "b"});
    CHECK(source.NextLine() == "a");
    CHECK(source.NextLine() == "b");
    CHECK_FALSE(source.NextLine().has_value());

    CollectingLineSink sink;
    sink.WriteLine("x");
    sink.WriteLine("y");
    REQUIRE(sink.lines() == std::vector<std::string>{"x", "y"});
    sink.Clear();
    CHECK(sink.lines().empty());
}

TEST_CASE("InputCursor: Tokens", "[io][cursor]") {
    SECTION("Tokens cross lines and skip blank lines") {
        VectorLineSource source({"  2  Amy", "", "\tBob  ", "3"});
        InputCursor cursor(source);
        CHECK(cursor.NextToken() == "2");
        CHECK(cursor.NextToken() == "Amy");
        CHECK(cursor.NextToken() == "Bob");
        CHECK(cursor.NextToken() == "3");
        CHECK_FALSE(cursor.NextToken().has_value());
    }

    SECTION("NextInt parses and range-checks") {
        VectorLineSource source({"5 -1 x 7"});
        InputCursor cursor(source);
        CHECK(cursor.NextInt(0, 10) == 5);
        CHECK_FALSE(cursor.NextInt(0, 10).has_value());  // -1 out of range
        CHECK_FALSE(cursor.NextInt(0, 10).has_value());  // x not a number
        CHECK(cursor.NextInt(0, 10) == 7);
        CHECK_FALSE(cursor.NextInt(0, 10).has_value());  // end of input
    }
}

TEST_CASE("InputCursor: Mixing tokens and lines", "[io][cursor]") {
    SECTION("NextLine after a count returns the following line") {
        VectorLineSource source({"2", "Ann 3", "Bob 9"});
        InputCursor cursor(source);
        CHECK(cursor.NextInt(0, 100) == 2);
        CHECK(cursor.NextLine() == "Ann 3");
        CHECK(cursor.NextLine() == "Bob 9");
        CHECK_FALSE(cursor.NextLine().has_value());
    }

    SECTION("Leftover tokens on a started line are discarded") {
        VectorLineSource source({"2 extra tokens", "next"});
        InputCursor cursor(source);
        CHECK(cursor.NextToken() == "2");
        CHECK(cursor.NextLine() == "next");
    }

    SECTION("Blank lines are returned by NextLine") {
        VectorLineSource source({"1", ""});
        InputCursor cursor(source);
        CHECK(cursor.NextToken() == "1");
        CHECK(cursor.NextLine() == "");
    }
}
