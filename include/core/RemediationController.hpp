#pragma once

#include <string>
#include <vector>

#include "common/Types.hpp"

namespace privguard::remediation {
class RemediationCatalog;
}

namespace privguard::cli {
class IConfirmer;
}

namespace privguard::report {
class IReporter;
}

namespace privguard::core {

/// Outcome of one remediate or undo pass.
/// Class abbreviation: rs
struct RemediationSummary {
  struct Entry {
    std::string sActionId;
    common::ActionResult arResult;
  };

  std::vector<Entry> vEntries;
  int iApplied = 0;
  int iUnchanged = 0;
  int iSkipped = 0;
  int iFailed = 0;
  bool bDeclined = false;  // forced run refused at the top-level confirmation

  void add(const std::string& sActionId, const common::ActionResult& arResult);
};

/// Closing notice emitted once after the remediation loop.
inline constexpr const char* kRefreshNotice =
    "Changes require a Group Policy refresh (gpupdate /force) on domain controllers "
    "before they take effect";

/// Drives the catalog in interactive or forced mode.
/// One failing action never stops the remaining ones.
/// Class abbreviation: rctl
class RemediationController {
 public:
  RemediationController(remediation::RemediationCatalog& rcCatalog, cli::IConfirmer& cfConfirmer,
                        report::IReporter& rptReporter);
  ~RemediationController();

  /// mode must be Remediate or Forced; anything else throws std::invalid_argument.
  RemediationSummary run(common::Mode mode);

 private:
  RemediationSummary runInteractive();
  RemediationSummary runForced();
  void report(const std::string& sActionId, const common::ActionResult& arResult);

  remediation::RemediationCatalog& _rcCatalog;
  cli::IConfirmer& _cfConfirmer;
  report::IReporter& _rptReporter;
};

}  // namespace privguard::core
