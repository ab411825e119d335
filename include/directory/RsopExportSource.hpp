#pragma once

#include <string>

#include "directory/ISnapshotSource.hpp"

namespace privguard::directory {

/// Runs the configured resultant-policy export command and reads the JSON
/// document it writes to the scratch path.
/// With no command configured, reads a document already present at that path.
/// Class abbreviation: res
class RsopExportSource : public ISnapshotSource {
 public:
  RsopExportSource(std::string sExportCommand, std::string sOutputPath);
  ~RsopExportSource() override;

  nlohmann::json exportDocument() override;

  /// Command line with "{out}" replaced by the quoted output path.
  /// Appends the quoted path when the template has no placeholder.
  static std::string buildCommand(const std::string& sTemplate, const std::string& sOutputPath);

 private:
  std::string _sExportCommand;
  std::string _sOutputPath;
};

}  // namespace privguard::directory
