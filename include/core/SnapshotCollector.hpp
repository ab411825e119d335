#pragma once

#include "common/Types.hpp"

namespace privguard::directory {
class IDirectory;
class ISnapshotSource;
}  // namespace privguard::directory

namespace privguard::core {

/// Gathers everything the FindingEngine needs into one immutable snapshot.
/// Class abbreviation: sc
class SnapshotCollector {
 public:
  SnapshotCollector(directory::ISnapshotSource& ssSource, directory::IDirectory& dirDirectory);
  ~SnapshotCollector();

  /// Throws CollectionError if any part of the snapshot cannot be produced.
  common::DomainSnapshot collect();

 private:
  directory::ISnapshotSource& _ssSource;
  directory::IDirectory& _dirDirectory;
};

}  // namespace privguard::core
