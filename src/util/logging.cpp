// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/logging.hpp"

#include <array>
#include <map>
#include <mutex>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace conduit {
namespace util {

namespace {

constexpr std::array<const char*, 6> kComponents = {"default", "observer", "strategy", "mediator", "chain", "app"};

constexpr std::array<const char*, 7> kLevels = {"trace", "debug", "info", "warn", "error", "critical", "off"};

constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v";

// Guarded by g_mutex
std::mutex g_mutex;
bool g_initialized = false;
std::map<std::string, std::shared_ptr<spdlog::logger>> g_loggers;

spdlog::level::level_enum ParseLevel(const std::string& level) {
  if (!LogManager::IsValidLevel(level)) {
    return spdlog::level::info;
  }
  return spdlog::level::from_str(level);
}

// Caller must hold g_mutex
void InitializeLocked(const std::string& log_level, bool log_to_file, const std::string& log_file_path) {
  if (g_initialized) {
    return;
  }

  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

  std::string file_error;
  if (log_to_file && !log_file_path.empty()) {
    try {
      sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file_path, false));
    } catch (const spdlog::spdlog_ex& e) {
      // Keep console logging; the file is optional
      file_error = e.what();
    }
  }

  const auto level = ParseLevel(log_level);
  for (const char* component : kComponents) {
    auto logger = std::make_shared<spdlog::logger>(component, sinks.begin(), sinks.end());
    logger->set_pattern(kPattern);
    logger->set_level(level);
    logger->flush_on(spdlog::level::warn);
    g_loggers[component] = std::move(logger);
  }

  g_initialized = true;

  if (!file_error.empty()) {
    g_loggers["default"]->warn("Failed to open log file {}: {}", log_file_path, file_error);
  }
}

}  // namespace

void LogManager::Initialize(const std::string& log_level, bool log_to_file, const std::string& log_file_path) {
  std::lock_guard<std::mutex> lock(g_mutex);
  InitializeLocked(log_level, log_to_file, log_file_path);
}

void LogManager::Shutdown() {
  std::lock_guard<std::mutex> lock(g_mutex);
  for (auto& [name, logger] : g_loggers) {
    logger->flush();
  }
  g_loggers.clear();
  g_initialized = false;
}

std::shared_ptr<spdlog::logger> LogManager::GetLogger(const std::string& name) {
  std::lock_guard<std::mutex> lock(g_mutex);
  if (!g_initialized) {
    InitializeLocked("off", false, "");
  }

  auto it = g_loggers.find(name);
  if (it != g_loggers.end()) {
    return it->second;
  }
  return g_loggers["default"];
}

void LogManager::SetLogLevel(const std::string& level) {
  std::lock_guard<std::mutex> lock(g_mutex);
  const auto parsed = ParseLevel(level);
  for (auto& [name, logger] : g_loggers) {
    logger->set_level(parsed);
  }
}

void LogManager::SetComponentLevel(const std::string& component, const std::string& level) {
  std::lock_guard<std::mutex> lock(g_mutex);
  auto it = g_loggers.find(component);
  if (it != g_loggers.end()) {
    it->second->set_level(ParseLevel(level));
  }
}

bool LogManager::IsValidLevel(const std::string& level) {
  for (const char* known : kLevels) {
    if (level == known) {
      return true;
    }
  }
  return false;
}

}  // namespace util
}  // namespace conduit
