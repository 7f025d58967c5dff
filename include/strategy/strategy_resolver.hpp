// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <array>
#include <optional>
#include <string>
#include <vector>

namespace conduit {
namespace strategy {

/**
 * Closed catalog of pricing strategies.
 * Numeric values are the identifiers used on the wire (scenario input).
 */
enum class StrategyId {
  /**
   * 10% off, rounded half up to the nearest integer.
   */
  FLAT_PERCENTAGE = 1,

  /**
   * Fixed discount taken from the highest tier whose threshold the price
   * reaches. Prices below the lowest threshold are unchanged.
   */
  TIERED_THRESHOLD = 2,
};

struct DiscountTier {
  int threshold;
  int discount;
};

// Ascending by threshold
static constexpr std::array<DiscountTier, 4> DISCOUNT_TIERS = {{
    {100, 5},
    {150, 15},
    {200, 25},
    {300, 40},
}};

// Flat percentage kept as a fraction so rounding is exact
static constexpr int FLAT_PERCENT_NUMERATOR = 9;
static constexpr int FLAT_PERCENT_DENOMINATOR = 10;

// Convert StrategyId to its catalog name ("flat-percentage", "tiered-threshold")
std::string StrategyIdAsString(StrategyId id);

// Pure price transforms
int ApplyFlatPercentage(int price);
int ApplyTieredThreshold(int price);

// A resolved catalog entry. Cheap to copy; Apply() is pure.
class Strategy {
public:
  StrategyId Id() const { return id_; }
  std::string Name() const { return StrategyIdAsString(id_); }

  int Apply(int price) const { return transform_(price); }

private:
  friend class StrategyResolver;
  using Transform = int (*)(int);

  Strategy(StrategyId id, Transform transform) : id_(id), transform_(transform) {}

  StrategyId id_;
  Transform transform_;
};

// Resolves identifiers against the closed catalog. Unknown identifiers
// never fall back to a default: they resolve to nullopt.
class StrategyResolver {
public:
  // Resolve a numeric identifier (1, 2).
  static std::optional<Strategy> Resolve(int id);

  // Resolve a textual identifier: either the decimal id ("1") or the
  // catalog name ("flat-percentage").
  static std::optional<Strategy> Resolve(const std::string& id);

  // All catalog entries in identifier order
  static std::vector<StrategyId> Catalog();
};

}  // namespace strategy
}  // namespace conduit
