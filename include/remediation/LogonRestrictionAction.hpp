#pragma once

#include <string>
#include <vector>

#include "remediation/RemediationAction.hpp"

namespace privguard::directory {
class IDirectory;
}

namespace privguard::dal {
class LogonTargetLedger;
}

namespace privguard::remediation {

/// Restricts every privileged account to logging on to domain controllers only.
/// Prior values are captured in the ledger before they are overwritten.
/// Class abbreviation: lra
class LogonRestrictionAction : public RemediationAction {
 public:
  LogonRestrictionAction(directory::IDirectory& dirDirectory, dal::LogonTargetLedger& ltlLedger);
  ~LogonRestrictionAction() override;

  std::string id() const override { return "logon-restriction"; }
  std::string title() const override;
  std::string helpYes() const override;
  std::string helpNo() const override;

  common::ActionResult ensure(bool bConfirm) override;

  /// Restores captured values, then clears the ledger.
  common::ActionResult remove() override;

  /// Uppercase short names of the controllers, sorted and de-duplicated.
  static std::vector<std::string> logonTargetsFor(const std::vector<std::string>& vControllers);

 private:
  directory::IDirectory& _dirDirectory;
  dal::LogonTargetLedger& _ltlLedger;
};

}  // namespace privguard::remediation
