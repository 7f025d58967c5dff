// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "app/config.hpp"
#include "app/scenarios.hpp"
#include "escalation/escalation_chain.hpp"
#include "io/line_io.hpp"
#include "util/logging.hpp"
#include <exception>
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char *argv[]) {
  using namespace conduit;

  try {
    std::vector<std::string> args(argv + 1, argv + argc);

    app::AppConfig config;
    if (auto error = app::ParseCommandLine(args, config)) {
      std::cerr << "Error: " << *error << "\n\n" << app::UsageText(argv[0]);
      return 1;
    }

    if (config.show_help) {
      std::cout << app::UsageText(argv[0]);
      return 0;
    }
    if (config.show_version) {
      std::cout << app::VersionString() << std::endl;
      return 0;
    }

    util::LogManager::Initialize(config.log_level, config.log_to_file, config.log_file_path);

    // Chain definition is validated up front so a bad file fails before any input is read
    std::vector<escalation::ChainLink> links;
    if (auto error = app::BuildEscalationLinks(config, links)) {
      std::cerr << "Error: " << *error << "\n";
      util::LogManager::Shutdown();
      return 1;
    }
    escalation::EscalationChain chain(std::move(links));

    io::StreamLineSource source(std::cin);
    io::StreamLineSink sink(std::cout);
    auto status = app::RunScenario(config, chain, source, sink);
    std::cout.flush();

    LOG_APP_INFO("Scenario finished: {}", app::ScenarioStatusAsString(status));
    util::LogManager::Shutdown();
    return app::ExitCodeFor(status);

  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}
