// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "core/participant_registry.hpp"

#include <optional>
#include <string>
#include <vector>

namespace conduit {
namespace app {

// Which scenario the front end runs
enum class Discipline {
  BROADCAST,   // "observer"
  STRATEGY,    // "strategy"
  MEDIATOR,    // "mediator"
  ESCALATION,  // "chain"
};

// Scenario name used on the command line
std::string DisciplineAsString(Discipline discipline);
std::optional<Discipline> ParseDiscipline(const std::string& name);

struct AppConfig {
  Discipline discipline{Discipline::BROADCAST};

  // Logging
  std::string log_level{"off"};
  bool log_to_file{false};
  std::string log_file_path;

  core::DuplicatePolicy duplicate_policy{core::DuplicatePolicy::REJECT};

  // JSON chain definition; empty means the default leave-approval chain
  std::string chain_config_path;

  bool show_help{false};
  bool show_version{false};
};

// Parse command-line arguments (without the program name) into config.
// Returns an error message on failure. --help and --version short-circuit
// and do not require a scenario.
std::optional<std::string> ParseCommandLine(const std::vector<std::string>& args, AppConfig& config);

std::string UsageText(const std::string& program_name);
std::string VersionString();

}  // namespace app
}  // namespace conduit
