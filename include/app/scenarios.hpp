// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 Scenario drivers: line-oriented textual protocols over the dispatch core

 Each driver reads its whole protocol from a LineSource, feeds one event at
 a time to a freshly built discipline instance, and writes results to a
 LineSink. Processing stops at the first malformed record (or, for the
 strategy scenario, the first unknown strategy) after reporting it.

 Protocols (integers are strict decimal):
 - observer: N, N names, U; then U clock advances, each printing
             "<name> <hour>" per participant in registration order
 - strategy: N, then N lines "<price> <strategyId>"
 - mediator: N, N names, then (sender, message) token pairs until EOF
 - chain:    n, then n lines "<name> <days>"
*/

#include "app/config.hpp"
#include "escalation/escalation_chain.hpp"

#include <optional>
#include <string>
#include <vector>

namespace conduit {

namespace io {
class LineSource;
class LineSink;
}  // namespace io

namespace app {

enum class ScenarioStatus {
  SUCCESS,
  UNKNOWN_STRATEGY,  // Reported with "Unknown strategy type", batch halted
  MALFORMED_INPUT,   // Reported with "Invalid input", batch halted
  CONFIG_ERROR,      // Scenario could not be set up
};

// Literal lines emitted on errors
static constexpr const char* MSG_INVALID_INPUT = "Invalid input";
static constexpr const char* MSG_UNKNOWN_STRATEGY = "Unknown strategy type";

std::string ScenarioStatusAsString(ScenarioStatus status);

// Process exit code for a finished scenario: 0 for SUCCESS and
// UNKNOWN_STRATEGY (a reported, expected outcome), 1 otherwise.
int ExitCodeFor(ScenarioStatus status);

ScenarioStatus RunObserverScenario(io::LineSource& source, io::LineSink& sink,
                                   core::DuplicatePolicy policy = core::DuplicatePolicy::REJECT);

ScenarioStatus RunStrategyScenario(io::LineSource& source, io::LineSink& sink);

ScenarioStatus RunMediatorScenario(io::LineSource& source, io::LineSink& sink,
                                   core::DuplicatePolicy policy = core::DuplicatePolicy::REJECT);

ScenarioStatus RunChainScenario(io::LineSource& source, io::LineSink& sink, const escalation::EscalationChain& chain);

// Links for the chain scenario: loaded from config.chain_config_path when
// set, the default leave-approval chain otherwise. Returns an error message
// if the definition cannot be loaded.
std::optional<std::string> BuildEscalationLinks(const AppConfig& config, std::vector<escalation::ChainLink>& links);

// Run the scenario selected by config. chain is only used by the chain scenario.
ScenarioStatus RunScenario(const AppConfig& config, const escalation::EscalationChain& chain, io::LineSource& source,
                           io::LineSink& sink);

}  // namespace app
}  // namespace conduit
