#include "core/UndoController.hpp"

#include <set>
#include <string>
#include <vector>

#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "remediation/RemediationCatalog.hpp"
#include "report/IReporter.hpp"

namespace privguard::core {

using common::ActionOutcome;
using common::ActionResult;
using common::Severity;

UndoController::UndoController(remediation::RemediationCatalog& rcCatalog,
                               report::IReporter& rptReporter)
    : _rcCatalog(rcCatalog), _rptReporter(rptReporter) {}

UndoController::~UndoController() = default;

RemediationSummary UndoController::run() {
  std::vector<remediation::RemediationAction*> vOrder;
  std::vector<remediation::RemediationAction*> vDeferred;
  std::set<std::string> setSeen;

  for (const auto& upAction : _rcCatalog.actions()) {
    const std::string sObject = upAction->managedObjectName();
    if (sObject.empty()) {
      vDeferred.push_back(upAction.get());
    } else if (setSeen.insert(sObject).second) {
      vOrder.push_back(upAction.get());
    }
  }
  vOrder.insert(vOrder.end(), vDeferred.begin(), vDeferred.end());

  RemediationSummary rsSummary;
  for (auto* pAction : vOrder) {
    ActionResult arResult = removeOne(*pAction);
    const std::string sSubject = pAction->managedObjectName().empty()
                                     ? pAction->id()
                                     : pAction->managedObjectName();
    if (arResult.outcome == ActionOutcome::Failed) {
      _rptReporter.record(Severity::Error, "Undo of " + sSubject + " failed: " + arResult.sMessage);
    } else {
      _rptReporter.record(Severity::Success, "Undo of " + sSubject + ": " + arResult.sMessage);
    }
    rsSummary.add(pAction->id(), arResult);
  }

  common::Logger::get()->info("Undo finished: {} removed, {} already absent, {} failed",
                              rsSummary.iApplied, rsSummary.iUnchanged, rsSummary.iFailed);
  return rsSummary;
}

ActionResult UndoController::removeOne(remediation::RemediationAction& raAction) {
  try {
    return raAction.remove();
  } catch (const common::NotFoundError& ex) {
    return {ActionOutcome::Unchanged, std::string("already absent (") + ex.what() + ")"};
  } catch (const std::exception& ex) {
    return {ActionOutcome::Failed, ex.what()};
  }
}

}  // namespace privguard::core
