#pragma once

#include <nlohmann/json.hpp>

namespace privguard::directory {

/// Produces the resultant-policy document for the current domain controller.
class ISnapshotSource {
 public:
  virtual ~ISnapshotSource() = default;

  /// Throws CollectionError when the export cannot be produced or read.
  virtual nlohmann::json exportDocument() = 0;
};

}  // namespace privguard::directory
