// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Unit tests for the pricing strategy catalog

#include <catch2/catch_test_macros.hpp>
#include "strategy/strategy_resolver.hpp"

using namespace conduit::strategy;

TEST_CASE("StrategyResolver: Resolves catalog ids", "[strategy]") {
    SECTION("Id 1 is flat-percentage") {
        auto s = StrategyResolver::Resolve(1);
        REQUIRE(s.has_value());
        CHECK(s->Id() == StrategyId::FLAT_PERCENTAGE);
        CHECK(s->Name() == "flat-percentage");
    }

    SECTION("Id 2 is tiered-threshold") {
        auto s = StrategyResolver::Resolve(2);
        REQUIRE(s.has_value());
        CHECK(s->Id() == StrategyId::TIERED_THRESHOLD);
        CHECK(s->Name() == "tiered-threshold");
    }

    SECTION("Textual ids and names resolve") {
        CHECK(StrategyResolver::Resolve(std::string("1"))->Id() == StrategyId::FLAT_PERCENTAGE);
        CHECK(StrategyResolver::Resolve(std::string("tiered-threshold"))->Id() == StrategyId::TIERED_THRESHOLD);
    }
}

TEST_CASE("StrategyResolver: Unknown ids never fall back", "[strategy]") {
    CHECK_FALSE(StrategyResolver::Resolve(0).has_value());
    CHECK_FALSE(StrategyResolver::Resolve(3).has_value());
    CHECK_FALSE(StrategyResolver::Resolve(-1).has_value());
    CHECK_FALSE(StrategyResolver::Resolve(std::string("3")).has_value());
    CHECK_FALSE(StrategyResolver::Resolve(std::string("")).has_value());
    CHECK_FALSE(StrategyResolver::Resolve(std::string("Flat-Percentage")).has_value());
    CHECK_FALSE(StrategyResolver::Resolve(std::string("1.0")).has_value());
}

TEST_CASE("StrategyResolver: Catalog lists every strategy", "[strategy]") {
    auto catalog = StrategyResolver::Catalog();
    REQUIRE(catalog.size() == 2);
    for (StrategyId id : catalog) {
        auto s = StrategyResolver::Resolve(static_cast<int>(id));
        REQUIRE(s.has_value());
        CHECK(s->Id() == id);
    }
}

TEST_CASE("Strategy: flat-percentage", "[strategy][flat]") {
    auto flat = StrategyResolver::Resolve(1).value();

    SECTION("Exact products") {
        CHECK(flat.Apply(120) == 108);
        CHECK(flat.Apply(100) == 90);
        CHECK(flat.Apply(0) == 0);
    }

    SECTION("Rounds half up") {
        CHECK(flat.Apply(5) == 5);    // 4.5 -> 5
        CHECK(flat.Apply(15) == 14);  // 13.5 -> 14
        CHECK(flat.Apply(1) == 1);    // 0.9 -> 1
        CHECK(flat.Apply(3) == 3);    // 2.7 -> 3
        CHECK(flat.Apply(4) == 4);    // 3.6 -> 4
        CHECK(flat.Apply(11) == 10);  // 9.9 -> 10
        CHECK(flat.Apply(12) == 11);  // 10.8 -> 11
    }

    SECTION("Negative prices round toward +infinity at .5") {
        CHECK(flat.Apply(-5) == -4);  // -4.5 -> -4
        CHECK(flat.Apply(-10) == -9);
    }

    SECTION("Large prices do not overflow") {
        CHECK(flat.Apply(2000000000) == 1800000000);
    }
}

TEST_CASE("Strategy: tiered-threshold", "[strategy][tiered]") {
    auto tiered = StrategyResolver::Resolve(2).value();

    SECTION("Below the lowest threshold is unchanged") {
        for (int price = 0; price < 100; ++price) {
            REQUIRE(tiered.Apply(price) == price);
        }
    }

    SECTION("Highest reached threshold wins") {
        CHECK(tiered.Apply(100) == 95);
        CHECK(tiered.Apply(120) == 115);
        CHECK(tiered.Apply(149) == 144);
        CHECK(tiered.Apply(150) == 135);
        CHECK(tiered.Apply(199) == 184);
        CHECK(tiered.Apply(200) == 175);
        CHECK(tiered.Apply(299) == 274);
        CHECK(tiered.Apply(300) == 260);
        CHECK(tiered.Apply(1000) == 960);
    }

    SECTION("Matches the tier table") {
        for (const auto& tier : DISCOUNT_TIERS) {
            CHECK(tiered.Apply(tier.threshold) == tier.threshold - tier.discount);
        }
    }
}

TEST_CASE("Strategy: Apply is deterministic", "[strategy]") {
    for (StrategyId id : StrategyResolver::Catalog()) {
        auto s = StrategyResolver::Resolve(static_cast<int>(id)).value();
        for (int price : {0, 1, 99, 100, 150, 201, 333, 12345}) {
            CHECK(s.Apply(price) == s.Apply(price));
        }
    }
}

TEST_CASE("StrategyId: String conversion", "[strategy]") {
    CHECK(StrategyIdAsString(StrategyId::FLAT_PERCENTAGE) == "flat-percentage");
    CHECK(StrategyIdAsString(StrategyId::TIERED_THRESHOLD) == "tiered-threshold");
    CHECK(StrategyIdAsString(static_cast<StrategyId>(999)) == "unknown");
}
