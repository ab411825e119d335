#pragma once

#include <optional>
#include <vector>

#include "common/Types.hpp"
#include "core/RemediationController.hpp"
#include "core/RunContext.hpp"

namespace privguard::core {

/// Result of one dispatched mode.
/// Class abbreviation: ro
struct RunOutcome {
  common::Mode mode = common::Mode::Help;
  std::vector<common::Finding> vFindings;            // evaluate only
  std::optional<RemediationSummary> oRemediation;    // remediate, deathblossom, undo
};

/// Dispatches the selected mode over the collaborators in a RunContext.
/// Prerequisite and collection failures propagate as fatal AppErrors.
/// Class abbreviation: orc
class Orchestrator {
 public:
  explicit Orchestrator(RunContext& ctx);
  ~Orchestrator();

  RunOutcome run(common::Mode mode);

 private:
  RunOutcome evaluate();
  RunOutcome remediate(common::Mode mode);
  RunOutcome undo();

  RunContext& _ctx;
};

}  // namespace privguard::core
