#pragma once

#include "common/Types.hpp"

namespace privguard::common {
struct Config;
}

namespace privguard::directory {
class IDirectory;
}

namespace privguard::core {

/// Gate run before any directory read or write.
/// Throws PrerequisiteError naming the first unmet requirement.
/// Class abbreviation: pc
class PrerequisiteChecker {
 public:
  PrerequisiteChecker(directory::IDirectory& dirDirectory, const common::Config& cfgApp);
  ~PrerequisiteChecker();

  void check(common::Mode mode);

 private:
  void checkConnectivity();
  void checkPrivilege();
  void checkRsopSource();
  void checkSysvol();
  void checkStateDir();

  directory::IDirectory& _dirDirectory;
  const common::Config& _cfgApp;
};

}  // namespace privguard::core
