#pragma once

#include "core/RemediationController.hpp"

namespace privguard::remediation {
class RemediationAction;
}

namespace privguard::core {

/// Removes everything the catalog may have created.
/// Actions sharing a managed object are removed once; actions that own no
/// object (the logon-target restore) run last. Absence counts as success.
/// Class abbreviation: uc
class UndoController {
 public:
  UndoController(remediation::RemediationCatalog& rcCatalog, report::IReporter& rptReporter);
  ~UndoController();

  RemediationSummary run();

 private:
  common::ActionResult removeOne(remediation::RemediationAction& raAction);

  remediation::RemediationCatalog& _rcCatalog;
  report::IReporter& _rptReporter;
};

}  // namespace privguard::core
