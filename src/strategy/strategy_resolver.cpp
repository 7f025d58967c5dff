// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "strategy/strategy_resolver.hpp"

#include "util/logging.hpp"
#include "util/string_parsing.hpp"

#include <cstdint>

namespace conduit {
namespace strategy {

namespace {

// Floor division for a positive divisor
int64_t FloorDiv(int64_t numerator, int64_t divisor) {
  int64_t q = numerator / divisor;
  if (numerator % divisor != 0 && numerator < 0) {
    --q;
  }
  return q;
}

}  // namespace

std::string StrategyIdAsString(StrategyId id) {
  switch (id) {
  case StrategyId::FLAT_PERCENTAGE:
    return "flat-percentage";
  case StrategyId::TIERED_THRESHOLD:
    return "tiered-threshold";
  default:
    return "unknown";
  }
}

int ApplyFlatPercentage(int price) {
  // round_half_up(price * 9 / 10) == floor((9 * price + 5) / 10)
  int64_t scaled = static_cast<int64_t>(price) * FLAT_PERCENT_NUMERATOR;
  int64_t half = FLAT_PERCENT_DENOMINATOR / 2;
  return static_cast<int>(FloorDiv(scaled + half, FLAT_PERCENT_DENOMINATOR));
}

int ApplyTieredThreshold(int price) {
  for (auto it = DISCOUNT_TIERS.rbegin(); it != DISCOUNT_TIERS.rend(); ++it) {
    if (price >= it->threshold) {
      return price - it->discount;
    }
  }
  return price;
}

std::optional<Strategy> StrategyResolver::Resolve(int id) {
  switch (id) {
  case static_cast<int>(StrategyId::FLAT_PERCENTAGE):
    return Strategy(StrategyId::FLAT_PERCENTAGE, &ApplyFlatPercentage);
  case static_cast<int>(StrategyId::TIERED_THRESHOLD):
    return Strategy(StrategyId::TIERED_THRESHOLD, &ApplyTieredThreshold);
  default:
    LOG_STRAT_WARN("Unknown strategy id {}", id);
    return std::nullopt;
  }
}

std::optional<Strategy> StrategyResolver::Resolve(const std::string& id) {
  if (auto numeric = util::SafeParseInt(id)) {
    return Resolve(*numeric);
  }

  for (StrategyId candidate : Catalog()) {
    if (id == StrategyIdAsString(candidate)) {
      return Resolve(static_cast<int>(candidate));
    }
  }

  LOG_STRAT_WARN("Unknown strategy '{}'", id);
  return std::nullopt;
}

std::vector<StrategyId> StrategyResolver::Catalog() {
  return {StrategyId::FLAT_PERCENTAGE, StrategyId::TIERED_THRESHOLD};
}

}  // namespace strategy
}  // namespace conduit
