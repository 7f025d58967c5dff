// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Unit tests for command-line parsing

#include <catch2/catch_test_macros.hpp>
#include "app/config.hpp"

using namespace conduit;
using namespace conduit::app;

TEST_CASE("ParseCommandLine: Scenario selection", "[app][cli]") {
    AppConfig config;

    SECTION("Each scenario name is accepted") {
        REQUIRE_FALSE(ParseCommandLine({"observer"}, config).has_value());
        CHECK(config.discipline == Discipline::BROADCAST);
        REQUIRE_FALSE(ParseCommandLine({"strategy"}, config).has_value());
        CHECK(config.discipline == Discipline::STRATEGY);
        REQUIRE_FALSE(ParseCommandLine({"mediator"}, config).has_value());
        CHECK(config.discipline == Discipline::MEDIATOR);
        REQUIRE_FALSE(ParseCommandLine({"chain"}, config).has_value());
        CHECK(config.discipline == Discipline::ESCALATION);
    }

    SECTION("Missing scenario") {
        auto error = ParseCommandLine({}, config);
        REQUIRE(error.has_value());
        CHECK(*error == "No scenario specified");
    }

    SECTION("Unknown scenario") {
        auto error = ParseCommandLine({"visitor"}, config);
        REQUIRE(error.has_value());
        CHECK(error->find("visitor") != std::string::npos);
    }

    SECTION("Two scenarios") {
        auto error = ParseCommandLine({"observer", "chain"}, config);
        REQUIRE(error.has_value());
        CHECK(error->find("chain") != std::string::npos);
    }
}

TEST_CASE("ParseCommandLine: Defaults", "[app][cli]") {
    AppConfig config;
    REQUIRE_FALSE(ParseCommandLine({"mediator"}, config).has_value());
    CHECK(config.log_level == "off");
    CHECK_FALSE(config.log_to_file);
    CHECK(config.duplicate_policy == core::DuplicatePolicy::REJECT);
    CHECK(config.chain_config_path.empty());
    CHECK_FALSE(config.show_help);
    CHECK_FALSE(config.show_version);
}

TEST_CASE("ParseCommandLine: Options", "[app][cli]") {
    AppConfig config;

    SECTION("Log level") {
        REQUIRE_FALSE(ParseCommandLine({"--loglevel=debug", "chain"}, config).has_value());
        CHECK(config.log_level == "debug");
    }

    SECTION("Invalid log level") {
        auto error = ParseCommandLine({"--loglevel=loud", "chain"}, config);
        REQUIRE(error.has_value());
        CHECK(error->find("loud") != std::string::npos);
    }

    SECTION("Log file") {
        REQUIRE_FALSE(ParseCommandLine({"chain", "--logfile=/tmp/conduit-test.log"}, config).has_value());
        CHECK(config.log_to_file);
        CHECK(config.log_file_path == "/tmp/conduit-test.log");
    }

    SECTION("Empty log file path") {
        CHECK(ParseCommandLine({"--logfile=", "chain"}, config).has_value());
    }

    SECTION("Duplicate policy") {
        REQUIRE_FALSE(ParseCommandLine({"--duplicates=replace", "observer"}, config).has_value());
        CHECK(config.duplicate_policy == core::DuplicatePolicy::REPLACE);
        REQUIRE_FALSE(ParseCommandLine({"--duplicates=reject", "observer"}, config).has_value());
        CHECK(config.duplicate_policy == core::DuplicatePolicy::REJECT);
    }

    SECTION("Invalid duplicate policy") {
        CHECK(ParseCommandLine({"--duplicates=merge", "observer"}, config).has_value());
    }

    SECTION("Chain config") {
        REQUIRE_FALSE(ParseCommandLine({"--chain-config=chain.json", "chain"}, config).has_value());
        CHECK(config.chain_config_path == "chain.json");
    }

    SECTION("Empty chain config path") {
        CHECK(ParseCommandLine({"--chain-config=", "chain"}, config).has_value());
    }

    SECTION("Unknown option") {
        auto error = ParseCommandLine({"--fast", "chain"}, config);
        REQUIRE(error.has_value());
        CHECK(error->find("--fast") != std::string::npos);
    }
}

TEST_CASE("ParseCommandLine: Help and version short-circuit", "[app][cli]") {
    AppConfig config;

    SECTION("--help without a scenario") {
        REQUIRE_FALSE(ParseCommandLine({"--help"}, config).has_value());
        CHECK(config.show_help);
    }

    SECTION("-h after bad arguments is not reached") {
        CHECK(ParseCommandLine({"--bogus", "-h"}, config).has_value());
    }

    SECTION("--version") {
        REQUIRE_FALSE(ParseCommandLine({"-v"}, config).has_value());
        CHECK(config.show_version);
    }
}

TEST_CASE("Discipline: Names round-trip", "[app][cli]") {
    CHECK(DisciplineAsString(Discipline::BROADCAST) == "observer");
    CHECK(DisciplineAsString(Discipline::STRATEGY) == "strategy");
    CHECK(DisciplineAsString(Discipline::MEDIATOR) == "mediator");
    CHECK(DisciplineAsString(Discipline::ESCALATION) == "chain");
    CHECK(ParseDiscipline("chain") == Discipline::ESCALATION);
    CHECK_FALSE(ParseDiscipline("Chain").has_value());
}

TEST_CASE("Usage and version text", "[app][cli]") {
    auto usage = UsageText("conduit");
    CHECK(usage.find("Usage: conduit") != std::string::npos);
    CHECK(usage.find("--chain-config") != std::string::npos);
    CHECK(VersionString() == "Conduit version v0.3.0");
}
