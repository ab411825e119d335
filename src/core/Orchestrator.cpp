#include "core/Orchestrator.hpp"

#include <stdexcept>

#include "common/Logger.hpp"
#include "core/FindingEngine.hpp"
#include "core/PrerequisiteChecker.hpp"
#include "core/SnapshotCollector.hpp"
#include "core/UndoController.hpp"
#include "remediation/RemediationCatalog.hpp"
#include "report/IReporter.hpp"

namespace privguard::core {

Orchestrator::Orchestrator(RunContext& ctx) : _ctx(ctx) {}

Orchestrator::~Orchestrator() = default;

RunOutcome Orchestrator::run(common::Mode mode) {
  common::Logger::get()->info("Mode '{}' selected", common::toString(mode));

  if (mode == common::Mode::Help) {
    throw std::invalid_argument("Help is handled before a run context is built");
  }

  PrerequisiteChecker pcChecker(_ctx.dirDirectory, _ctx.cfgApp);
  pcChecker.check(mode);

  switch (mode) {
    case common::Mode::Evaluate:
      return evaluate();
    case common::Mode::Remediate:
    case common::Mode::Forced:
      return remediate(mode);
    case common::Mode::Undo:
      return undo();
    case common::Mode::Help:
      break;
  }
  throw std::invalid_argument("Unhandled mode");
}

RunOutcome Orchestrator::evaluate() {
  SnapshotCollector scCollector(_ctx.ssSource, _ctx.dirDirectory);
  const common::DomainSnapshot dsSnapshot = scCollector.collect();

  RunOutcome roOutcome;
  roOutcome.mode = common::Mode::Evaluate;
  roOutcome.vFindings = FindingEngine().evaluate(dsSnapshot);
  for (const auto& fd : roOutcome.vFindings) {
    _ctx.rptReporter.record(fd.severity, fd.sMessage);
  }
  return roOutcome;
}

RunOutcome Orchestrator::remediate(common::Mode mode) {
  // Remediation only starts from a snapshot that could be collected in full
  SnapshotCollector scCollector(_ctx.ssSource, _ctx.dirDirectory);
  const common::DomainSnapshot dsSnapshot = scCollector.collect();
  common::Logger::get()->debug("Snapshot {} gates remediation", dsSnapshot.sDocumentDigest);

  remediation::RemediationCatalog rcCatalog(_ctx.posStore, _ctx.dirDirectory, _ctx.ltlLedger,
                                            _ctx.cfConfirmer);
  RemediationController rctl(rcCatalog, _ctx.cfConfirmer, _ctx.rptReporter);

  RunOutcome roOutcome;
  roOutcome.mode = mode;
  roOutcome.oRemediation = rctl.run(mode);
  return roOutcome;
}

RunOutcome Orchestrator::undo() {
  remediation::RemediationCatalog rcCatalog(_ctx.posStore, _ctx.dirDirectory, _ctx.ltlLedger,
                                            _ctx.cfConfirmer);
  UndoController ucController(rcCatalog, _ctx.rptReporter);

  RunOutcome roOutcome;
  roOutcome.mode = common::Mode::Undo;
  roOutcome.oRemediation = ucController.run();
  return roOutcome;
}

}  // namespace privguard::core
