// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace conduit {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * Provides centralized logging configuration and access to per-component
 * loggers (observer, strategy, mediator, chain, app).
 *
 * Console output goes to stderr: stdout carries the scenario protocols and
 * must never be interleaved with log lines.
 *
 * Thread-safety: All methods are thread-safe. All state is guarded by one
 * mutex; the first Initialize() wins until Shutdown() is called.
 */
class LogManager {
public:
  // Initialize logging system with the specified minimum log level.
  // Only the first call performs initialization.
  static void Initialize(const std::string& log_level = "off", bool log_to_file = false,
                         const std::string& log_file_path = "conduit.log");

  // Flush and drop all loggers. Later calls to GetLogger() re-initialize
  // with defaults.
  static void Shutdown();

  // Get logger for a component. Unknown components map to "default".
  // Auto-initializes if not initialized.
  static std::shared_ptr<spdlog::logger> GetLogger(const std::string& name = "default");

  // Set log level at runtime (all components).
  static void SetLogLevel(const std::string& level);

  // Set log level for a single component.
  static void SetComponentLevel(const std::string& component, const std::string& level);

  // True if `level` names a spdlog level (trace, debug, info, warn, error, critical, off).
  static bool IsValidLevel(const std::string& level);
};

}  // namespace util
}  // namespace conduit

// Component-specific logging
#define LOG_OBS_TRACE(...) conduit::util::LogManager::GetLogger("observer")->trace(__VA_ARGS__)
#define LOG_OBS_DEBUG(...) conduit::util::LogManager::GetLogger("observer")->debug(__VA_ARGS__)
#define LOG_OBS_WARN(...) conduit::util::LogManager::GetLogger("observer")->warn(__VA_ARGS__)

#define LOG_STRAT_WARN(...) conduit::util::LogManager::GetLogger("strategy")->warn(__VA_ARGS__)

#define LOG_MED_TRACE(...) conduit::util::LogManager::GetLogger("mediator")->trace(__VA_ARGS__)
#define LOG_MED_DEBUG(...) conduit::util::LogManager::GetLogger("mediator")->debug(__VA_ARGS__)
#define LOG_MED_WARN(...) conduit::util::LogManager::GetLogger("mediator")->warn(__VA_ARGS__)

#define LOG_CHAIN_TRACE(...) conduit::util::LogManager::GetLogger("chain")->trace(__VA_ARGS__)
#define LOG_CHAIN_DEBUG(...) conduit::util::LogManager::GetLogger("chain")->debug(__VA_ARGS__)
#define LOG_CHAIN_INFO(...) conduit::util::LogManager::GetLogger("chain")->info(__VA_ARGS__)
#define LOG_CHAIN_ERROR(...) conduit::util::LogManager::GetLogger("chain")->error(__VA_ARGS__)

#define LOG_APP_DEBUG(...) conduit::util::LogManager::GetLogger("app")->debug(__VA_ARGS__)
#define LOG_APP_INFO(...) conduit::util::LogManager::GetLogger("app")->info(__VA_ARGS__)
#define LOG_APP_WARN(...) conduit::util::LogManager::GetLogger("app")->warn(__VA_ARGS__)
#define LOG_APP_ERROR(...) conduit::util::LogManager::GetLogger("app")->error(__VA_ARGS__)
