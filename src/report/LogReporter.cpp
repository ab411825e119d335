#include "report/LogReporter.hpp"

#include "common/Logger.hpp"

namespace privguard::report {

LogReporter::LogReporter() = default;
LogReporter::~LogReporter() = default;

void LogReporter::record(common::Severity severity, const std::string& sMessage) {
  auto spLog = common::Logger::get();
  switch (severity) {
    case common::Severity::Success:
      ++_iSuccess;
      spLog->info("[+] {}", sMessage);
      break;
    case common::Severity::Warning:
      ++_iWarning;
      spLog->warn("[!] {}", sMessage);
      break;
    case common::Severity::Error:
      ++_iError;
      spLog->error("[-] {}", sMessage);
      break;
  }
}

int LogReporter::count(common::Severity severity) const {
  switch (severity) {
    case common::Severity::Success: return _iSuccess;
    case common::Severity::Warning: return _iWarning;
    case common::Severity::Error: return _iError;
  }
  return 0;
}

void LogReporter::summarize() const {
  common::Logger::get()->info("Summary: {} ok, {} warnings, {} errors", _iSuccess, _iWarning,
                              _iError);
}

}  // namespace privguard::report
