#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace privguard::common {

/// Thin wrapper over spdlog for console and durable file logging.
/// Uses spdlog's default logger to avoid static destruction order issues.
/// Class abbreviation: N/A (static interface)
///
/// Usage:
///   Logger::init("debug", "privguard.log");
///   Logger::get()->info("Collected {} domain controllers", iCount);
class Logger {
 public:
  /// Initialize the global logger with the given level string.
  /// When sLogFile is non-empty, records are also appended to that file.
  /// Valid levels: "trace", "debug", "info", "warn", "error", "critical", "off"
  static void init(const std::string& sLevel, const std::string& sLogFile = {});

  /// Get the shared spdlog logger instance.
  /// Returns spdlog's default logger (always valid).
  static std::shared_ptr<spdlog::logger> get();

 private:
  static bool _bInitialized;
};

}  // namespace privguard::common
