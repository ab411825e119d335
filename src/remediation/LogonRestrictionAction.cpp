#include "remediation/LogonRestrictionAction.hpp"

#include "common/Errors.hpp"
#include "common/HostNames.hpp"
#include "common/Logger.hpp"
#include "dal/LogonTargetLedger.hpp"
#include "directory/IDirectory.hpp"

#include <algorithm>
#include <cctype>

namespace privguard::remediation {

using common::ActionOutcome;
using common::ActionResult;

LogonRestrictionAction::LogonRestrictionAction(directory::IDirectory& dirDirectory,
                                               dal::LogonTargetLedger& ltlLedger)
    : _dirDirectory(dirDirectory), _ltlLedger(ltlLedger) {}

LogonRestrictionAction::~LogonRestrictionAction() = default;

std::string LogonRestrictionAction::title() const {
  return "Restrict privileged accounts to log on only to domain controllers?";
}

std::string LogonRestrictionAction::helpYes() const {
  return "Yes: sets the allowed logon workstations of every privileged account to exactly the "
         "domain controllers. Current values are saved so undo can restore them.";
}

std::string LogonRestrictionAction::helpNo() const {
  return "No: privileged accounts stay able to log on to other hosts, where their credentials "
         "can be harvested.";
}

std::vector<std::string> LogonRestrictionAction::logonTargetsFor(
    const std::vector<std::string>& vControllers) {
  std::vector<std::string> vTargets;
  for (const auto& sShort : common::shortHostSet(vControllers)) {
    std::string sUpper = sShort;
    std::transform(sUpper.begin(), sUpper.end(), sUpper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    vTargets.push_back(std::move(sUpper));
  }
  return vTargets;
}

ActionResult LogonRestrictionAction::ensure(bool /*bConfirm*/) {
  const auto vControllers = _dirDirectory.listDomainControllers();
  if (vControllers.empty()) {
    throw common::RemediationActionError("no_domain_controllers",
                                         "No domain controllers found; refusing to lock out "
                                         "privileged accounts");
  }
  const auto setControllers = common::shortHostSet(vControllers);
  const auto vTargets = logonTargetsFor(vControllers);

  std::vector<std::string> vUpdated;
  for (const auto& pa : _dirDirectory.listPrivilegedAccounts()) {
    if (!pa.vAllowedLogonTargets.empty() &&
        common::shortHostSet(pa.vAllowedLogonTargets) == setControllers) {
      continue;
    }
    _ltlLedger.capture(pa.sAccountName, pa.vAllowedLogonTargets);
    _dirDirectory.setAllowedLogonTargets(pa.sAccountName, vTargets);
    vUpdated.push_back(pa.sAccountName);
  }

  if (vUpdated.empty()) {
    return {ActionOutcome::Unchanged,
            "All privileged accounts are already restricted to domain controllers"};
  }

  std::string sNames;
  for (const auto& sName : vUpdated) {
    if (!sNames.empty()) sNames += ", ";
    sNames += sName;
  }
  return {ActionOutcome::Applied,
          "Restricted " + std::to_string(vUpdated.size()) +
              " privileged account(s) to domain controllers: " + sNames};
}

ActionResult LogonRestrictionAction::remove() {
  if (!_ltlLedger.exists()) {
    return {ActionOutcome::Unchanged, "No captured logon restrictions to restore"};
  }

  auto spLog = common::Logger::get();
  int iRestored = 0;
  for (const auto& [sAccount, vTargets] : _ltlLedger.load()) {
    try {
      _dirDirectory.setAllowedLogonTargets(sAccount, vTargets);
      ++iRestored;
    } catch (const common::NotFoundError&) {
      spLog->warn("Account {} no longer exists; its logon restriction was not restored",
                  sAccount);
    }
  }
  _ltlLedger.clear();

  return {ActionOutcome::Applied,
          "Restored prior logon workstations of " + std::to_string(iRestored) + " account(s)"};
}

}  // namespace privguard::remediation
