// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "app/config.hpp"

#include "util/logging.hpp"

#include <sstream>

namespace conduit {
namespace app {

namespace {

constexpr const char* kVersion = "0.3.0";

}  // namespace

std::string DisciplineAsString(Discipline discipline) {
  switch (discipline) {
  case Discipline::BROADCAST:
    return "observer";
  case Discipline::STRATEGY:
    return "strategy";
  case Discipline::MEDIATOR:
    return "mediator";
  case Discipline::ESCALATION:
    return "chain";
  default:
    return "unknown";
  }
}

std::optional<Discipline> ParseDiscipline(const std::string& name) {
  for (Discipline d : {Discipline::BROADCAST, Discipline::STRATEGY, Discipline::MEDIATOR, Discipline::ESCALATION}) {
    if (name == DisciplineAsString(d)) {
      return d;
    }
  }
  return std::nullopt;
}

std::optional<std::string> ParseCommandLine(const std::vector<std::string>& args, AppConfig& config) {
  std::optional<Discipline> discipline;

  for (const auto& arg : args) {
    if (arg == "--help" || arg == "-h") {
      config.show_help = true;
      return std::nullopt;
    } else if (arg == "--version" || arg == "-v") {
      config.show_version = true;
      return std::nullopt;
    } else if (arg.starts_with("--loglevel=")) {
      std::string level = arg.substr(11);
      if (!util::LogManager::IsValidLevel(level)) {
        return "Invalid log level '" + level + "' (use trace, debug, info, warn, error, critical or off)";
      }
      config.log_level = level;
    } else if (arg.starts_with("--logfile=")) {
      config.log_file_path = arg.substr(10);
      if (config.log_file_path.empty()) {
        return std::string("--logfile requires a non-empty path");
      }
      config.log_to_file = true;
    } else if (arg.starts_with("--duplicates=")) {
      auto policy = core::ParseDuplicatePolicy(arg.substr(13));
      if (!policy) {
        return "Invalid duplicate policy '" + arg.substr(13) + "' (use reject or replace)";
      }
      config.duplicate_policy = *policy;
    } else if (arg.starts_with("--chain-config=")) {
      config.chain_config_path = arg.substr(15);
      if (config.chain_config_path.empty()) {
        return std::string("--chain-config requires a non-empty path");
      }
    } else if (arg.starts_with("-")) {
      return "Unknown option '" + arg + "'";
    } else if (!discipline) {
      discipline = ParseDiscipline(arg);
      if (!discipline) {
        return "Unknown scenario '" + arg + "'";
      }
    } else {
      return "Unexpected argument '" + arg + "'";
    }
  }

  if (!discipline) {
    return std::string("No scenario specified");
  }
  config.discipline = *discipline;
  return std::nullopt;
}

std::string UsageText(const std::string& program_name) {
  std::ostringstream out;
  out << "Conduit - behavioral dispatch scenarios over stdin/stdout\n\n"
      << "Usage: " << program_name << " [options] <scenario>\n\n"
      << "Scenarios:\n"
      << "  observer                 Clock broadcasting the hour to every participant\n"
      << "  strategy                 Price transform selected by strategy id\n"
      << "  mediator                 Chat room relaying messages to other members\n"
      << "  chain                    Leave requests escalated through approvers\n\n"
      << "Options:\n"
      << "  --loglevel=<level>       trace, debug, info, warn, error, critical, off (default: off)\n"
      << "  --logfile=<path>         Also write logs to <path>\n"
      << "  --duplicates=<policy>    reject or replace duplicate names (default: reject)\n"
      << "  --chain-config=<path>    JSON chain definition for the chain scenario\n"
      << "  --version                Show version information\n"
      << "  --help                   Show this help message\n";
  return out.str();
}

std::string VersionString() {
  return std::string("Conduit version v") + kVersion;
}

}  // namespace app
}  // namespace conduit
