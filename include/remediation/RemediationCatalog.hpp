#pragma once

#include <memory>
#include <vector>

#include "remediation/RemediationAction.hpp"

namespace privguard::directory {
class IDirectory;
class IPolicyObjectStore;
}  // namespace privguard::directory

namespace privguard::dal {
class LogonTargetLedger;
}

namespace privguard::cli {
class IConfirmer;
}

namespace privguard::remediation {

/// The fixed, ordered set of remediation actions:
/// password policy, logon restriction, null sessions, credential caching.
/// Class abbreviation: rc
class RemediationCatalog {
 public:
  RemediationCatalog(directory::IPolicyObjectStore& posStore, directory::IDirectory& dirDirectory,
                     dal::LogonTargetLedger& ltlLedger, cli::IConfirmer& cfConfirmer);
  ~RemediationCatalog();

  const std::vector<std::unique_ptr<RemediationAction>>& actions() const { return _vActions; }

 private:
  std::vector<std::unique_ptr<RemediationAction>> _vActions;
};

}  // namespace privguard::remediation
