// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "app/scenarios.hpp"

#include "escalation/chain_config.hpp"
#include "io/line_io.hpp"
#include "mediator/mediated_router.hpp"
#include "observer/broadcast_notifier.hpp"
#include "strategy/strategy_resolver.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"

#include <climits>

namespace conduit {
namespace app {

namespace {

ScenarioStatus ReportMalformed(io::LineSink& sink, const std::string& what) {
  LOG_APP_WARN("Malformed input: {}", what);
  sink.WriteLine(MSG_INVALID_INPUT);
  return ScenarioStatus::MALFORMED_INPUT;
}

// Reads `count` name tokens. Returns false if input ends early.
bool ReadNames(io::InputCursor& cursor, int count, std::vector<std::string>& names) {
  for (int i = 0; i < count; ++i) {
    auto name = cursor.NextToken();
    if (!name) {
      return false;
    }
    names.push_back(std::move(*name));
  }
  return true;
}

}  // namespace

std::string ScenarioStatusAsString(ScenarioStatus status) {
  switch (status) {
  case ScenarioStatus::SUCCESS:
    return "success";
  case ScenarioStatus::UNKNOWN_STRATEGY:
    return "unknown-strategy";
  case ScenarioStatus::MALFORMED_INPUT:
    return "malformed-input";
  case ScenarioStatus::CONFIG_ERROR:
    return "config-error";
  default:
    return "unknown";
  }
}

int ExitCodeFor(ScenarioStatus status) {
  switch (status) {
  case ScenarioStatus::SUCCESS:
  case ScenarioStatus::UNKNOWN_STRATEGY:
    return 0;
  case ScenarioStatus::MALFORMED_INPUT:
  case ScenarioStatus::CONFIG_ERROR:
  default:
    return 1;
  }
}

ScenarioStatus RunObserverScenario(io::LineSource& source, io::LineSink& sink, core::DuplicatePolicy policy) {
  io::InputCursor cursor(source);

  auto participant_count = cursor.NextInt(0, INT_MAX);
  if (!participant_count) {
    return ReportMalformed(sink, "observer: missing or invalid participant count");
  }

  std::vector<std::string> names;
  if (!ReadNames(cursor, *participant_count, names)) {
    return ReportMalformed(sink, "observer: fewer names than participant count");
  }

  auto update_count = cursor.NextInt(0, INT_MAX);
  if (!update_count) {
    return ReportMalformed(sink, "observer: missing or invalid update count");
  }

  observer::BroadcastNotifier clock(policy);
  for (const auto& name : names) {
    auto result = clock.Register(name, [&sink](const std::string& who, int hour) {
      sink.WriteLine(who + " " + std::to_string(hour));
    });
    if (!core::IsRegistered(result)) {
      LOG_APP_WARN("observer: participant '{}' skipped ({})", name, core::RegisterResultAsString(result));
    }
  }

  for (int i = 0; i < *update_count; ++i) {
    clock.Advance();
  }

  LOG_APP_DEBUG("observer: {} participants, {} advances, final hour {}", clock.ParticipantCount(), *update_count,
                clock.Hour());
  return ScenarioStatus::SUCCESS;
}

ScenarioStatus RunStrategyScenario(io::LineSource& source, io::LineSink& sink) {
  io::InputCursor cursor(source);

  auto case_count = cursor.NextInt(0, INT_MAX);
  if (!case_count) {
    return ReportMalformed(sink, "strategy: missing or invalid case count");
  }

  // One whole line per case: blank lines and split cases are malformed
  for (int i = 0; i < *case_count; ++i) {
    auto line = cursor.NextLine();
    if (!line) {
      return ReportMalformed(sink, "strategy: fewer cases than case count");
    }

    auto tokens = util::SplitWhitespace(*line);
    if (tokens.size() != 2) {
      return ReportMalformed(sink, "strategy: expected '<price> <strategyId>', got '" + *line + "'");
    }

    auto price = util::SafeParseInt(tokens[0]);
    if (!price) {
      return ReportMalformed(sink, "strategy: invalid price '" + tokens[0] + "'");
    }

    auto resolved = strategy::StrategyResolver::Resolve(tokens[1]);
    if (!resolved) {
      // Stop on the first unknown strategy; remaining cases are not processed
      sink.WriteLine(MSG_UNKNOWN_STRATEGY);
      return ScenarioStatus::UNKNOWN_STRATEGY;
    }

    sink.WriteLine(std::to_string(resolved->Apply(*price)));
  }

  return ScenarioStatus::SUCCESS;
}

ScenarioStatus RunMediatorScenario(io::LineSource& source, io::LineSink& sink, core::DuplicatePolicy policy) {
  io::InputCursor cursor(source);

  auto user_count = cursor.NextInt(0, INT_MAX);
  if (!user_count) {
    return ReportMalformed(sink, "mediator: missing or invalid user count");
  }

  std::vector<std::string> names;
  if (!ReadNames(cursor, *user_count, names)) {
    return ReportMalformed(sink, "mediator: fewer names than user count");
  }

  mediator::MediatedRouter room(&sink, policy);
  for (const auto& name : names) {
    auto result = room.AddUser(name);
    if (!core::IsRegistered(result)) {
      LOG_APP_WARN("mediator: user '{}' skipped ({})", name, core::RegisterResultAsString(result));
    }
  }

  size_t routed = 0;
  while (auto sender = cursor.NextToken()) {
    auto body = cursor.NextToken();
    if (!body) {
      LOG_APP_DEBUG("mediator: trailing sender '{}' without a message ignored", *sender);
      break;
    }
    if (room.SendFrom(*sender, *body)) {
      ++routed;
    }
  }

  LOG_APP_DEBUG("mediator: {} messages routed among {} users", routed, room.UserCount());
  return ScenarioStatus::SUCCESS;
}

ScenarioStatus RunChainScenario(io::LineSource& source, io::LineSink& sink, const escalation::EscalationChain& chain) {
  io::InputCursor cursor(source);

  auto request_count = cursor.NextInt(0, INT_MAX);
  if (!request_count) {
    return ReportMalformed(sink, "chain: missing or invalid request count");
  }

  for (int i = 0; i < *request_count; ++i) {
    auto line = cursor.NextLine();
    if (!line) {
      return ReportMalformed(sink, "chain: fewer requests than request count");
    }

    auto tokens = util::SplitWhitespace(*line);
    if (tokens.size() != 2) {
      return ReportMalformed(sink, "chain: expected '<name> <days>', got '" + *line + "'");
    }

    auto days = util::SafeParseInt(tokens[1], 0, INT_MAX);
    if (!days) {
      return ReportMalformed(sink, "chain: invalid day count '" + tokens[1] + "'");
    }

    escalation::Request request{tokens[0], *days};
    sink.WriteLine(escalation::FormatDecision(request, chain.Handle(request)));
  }

  return ScenarioStatus::SUCCESS;
}

std::optional<std::string> BuildEscalationLinks(const AppConfig& config, std::vector<escalation::ChainLink>& links) {
  if (config.chain_config_path.empty()) {
    links = escalation::DefaultLeaveApprovalLinks();
    return std::nullopt;
  }

  auto result = escalation::LoadChainLinks(config.chain_config_path, links);
  if (result != escalation::ChainConfigResult::SUCCESS) {
    return "Cannot load chain definition " + config.chain_config_path + ": " +
           escalation::ChainConfigResultAsString(result);
  }
  return std::nullopt;
}

ScenarioStatus RunScenario(const AppConfig& config, const escalation::EscalationChain& chain, io::LineSource& source,
                           io::LineSink& sink) {
  LOG_APP_INFO("Running {} scenario", DisciplineAsString(config.discipline));

  switch (config.discipline) {
  case Discipline::BROADCAST:
    return RunObserverScenario(source, sink, config.duplicate_policy);
  case Discipline::STRATEGY:
    return RunStrategyScenario(source, sink);
  case Discipline::MEDIATOR:
    return RunMediatorScenario(source, sink, config.duplicate_policy);
  case Discipline::ESCALATION:
    return RunChainScenario(source, sink, chain);
  default:
    LOG_APP_ERROR("Unhandled discipline {}", static_cast<int>(config.discipline));
    return ScenarioStatus::CONFIG_ERROR;
  }
}

}  // namespace app
}  // namespace conduit
