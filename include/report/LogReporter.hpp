#pragma once

#include <string>

#include "report/IReporter.hpp"

namespace privguard::report {

/// Routes records to the spdlog logger (console + durable log file)
/// and keeps per-severity tallies for the closing summary.
/// Class abbreviation: lr
class LogReporter : public IReporter {
 public:
  LogReporter();
  ~LogReporter() override;

  void record(common::Severity severity, const std::string& sMessage) override;

  int count(common::Severity severity) const;

  /// Log "N ok, N warnings, N errors".
  void summarize() const;

 private:
  int _iSuccess = 0;
  int _iWarning = 0;
  int _iError = 0;
};

}  // namespace privguard::report
