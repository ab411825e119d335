#include "core/RemediationController.hpp"

#include <stdexcept>

#include "cli/Confirmer.hpp"
#include "common/Logger.hpp"
#include "remediation/RemediationCatalog.hpp"
#include "report/IReporter.hpp"

namespace privguard::core {

using common::ActionOutcome;
using common::ActionResult;
using common::Severity;

namespace {

constexpr const char* kForcedTitle =
    "Apply every remediation now, without asking about each one?";
constexpr const char* kForcedHelp =
    "Yes: creates the privileged password policy, restricts privileged accounts to domain "
    "controllers, and links the domain controller hardening policy. Every change can be "
    "reverted with 'privguard undo'.\n"
    "No: exits without changing anything.";

}  // namespace

void RemediationSummary::add(const std::string& sActionId, const ActionResult& arResult) {
  vEntries.push_back({sActionId, arResult});
  switch (arResult.outcome) {
    case ActionOutcome::Applied: ++iApplied; break;
    case ActionOutcome::Unchanged: ++iUnchanged; break;
    case ActionOutcome::Skipped: ++iSkipped; break;
    case ActionOutcome::Failed: ++iFailed; break;
  }
}

RemediationController::RemediationController(remediation::RemediationCatalog& rcCatalog,
                                             cli::IConfirmer& cfConfirmer,
                                             report::IReporter& rptReporter)
    : _rcCatalog(rcCatalog), _cfConfirmer(cfConfirmer), _rptReporter(rptReporter) {}

RemediationController::~RemediationController() = default;

RemediationSummary RemediationController::run(common::Mode mode) {
  RemediationSummary rsSummary;
  switch (mode) {
    case common::Mode::Remediate:
      rsSummary = runInteractive();
      break;
    case common::Mode::Forced:
      rsSummary = runForced();
      if (rsSummary.bDeclined) return rsSummary;
      break;
    default:
      throw std::invalid_argument("RemediationController cannot run mode '" +
                                  common::toString(mode) + "'");
  }

  _rptReporter.record(Severity::Warning, kRefreshNotice);
  common::Logger::get()->info("Remediation finished: {} applied, {} unchanged, {} skipped, "
                              "{} failed",
                              rsSummary.iApplied, rsSummary.iUnchanged, rsSummary.iSkipped,
                              rsSummary.iFailed);
  return rsSummary;
}

RemediationSummary RemediationController::runInteractive() {
  RemediationSummary rsSummary;
  for (const auto& upAction : _rcCatalog.actions()) {
    const std::string sHelp = upAction->helpYes() + "\n" + upAction->helpNo();
    ActionResult arResult;
    if (_cfConfirmer.ask(upAction->title(), sHelp) == cli::Answer::No) {
      arResult = {ActionOutcome::Skipped, "declined by operator"};
    } else {
      try {
        arResult = upAction->ensure(true);
      } catch (const std::exception& ex) {
        arResult = {ActionOutcome::Failed, ex.what()};
      }
    }
    report(upAction->id(), arResult);
    rsSummary.add(upAction->id(), arResult);
  }
  return rsSummary;
}

RemediationSummary RemediationController::runForced() {
  RemediationSummary rsSummary;
  if (_cfConfirmer.ask(kForcedTitle, kForcedHelp) == cli::Answer::No) {
    _rptReporter.record(Severity::Warning, "Forced remediation declined; no changes were made");
    rsSummary.bDeclined = true;
    return rsSummary;
  }

  for (const auto& upAction : _rcCatalog.actions()) {
    ActionResult arResult;
    try {
      arResult = upAction->ensure(false);
    } catch (const std::exception& ex) {
      arResult = {ActionOutcome::Failed, ex.what()};
    }
    report(upAction->id(), arResult);
    rsSummary.add(upAction->id(), arResult);
  }
  return rsSummary;
}

void RemediationController::report(const std::string& sActionId, const ActionResult& arResult) {
  switch (arResult.outcome) {
    case ActionOutcome::Applied:
    case ActionOutcome::Unchanged:
      _rptReporter.record(Severity::Success, sActionId + ": " + arResult.sMessage);
      break;
    case ActionOutcome::Skipped:
      _rptReporter.record(Severity::Warning, sActionId + " skipped: " + arResult.sMessage);
      break;
    case ActionOutcome::Failed:
      _rptReporter.record(Severity::Error, sActionId + " failed: " + arResult.sMessage);
      break;
  }
}

}  // namespace privguard::core
