#include "common/Types.hpp"

namespace privguard::common {

std::string toString(Severity severity) {
  switch (severity) {
    case Severity::Success: return "success";
    case Severity::Warning: return "warning";
    case Severity::Error: return "error";
  }
  return "unknown";
}

std::string toString(CheckId checkId) {
  switch (checkId) {
    case CheckId::PrivilegedAccountCount: return "privileged-account-count";
    case CheckId::PasswordHistory: return "password-history";
    case CheckId::LockoutThreshold: return "lockout-threshold";
    case CheckId::PasswordComplexity: return "password-complexity";
    case CheckId::MinPasswordLength: return "min-password-length";
    case CheckId::LogonRestriction: return "logon-restriction";
    case CheckId::NullSessions: return "null-sessions";
    case CheckId::AnonymousSidTranslation: return "anonymous-sid-translation";
    case CheckId::AdminGroupMembership: return "admin-group-membership";
  }
  return "unknown";
}

std::string toString(ActionOutcome outcome) {
  switch (outcome) {
    case ActionOutcome::Applied: return "applied";
    case ActionOutcome::Unchanged: return "unchanged";
    case ActionOutcome::Skipped: return "skipped";
    case ActionOutcome::Failed: return "failed";
  }
  return "unknown";
}

std::string toString(Mode mode) {
  switch (mode) {
    case Mode::Help: return "help";
    case Mode::Evaluate: return "evaluate";
    case Mode::Remediate: return "remediate";
    case Mode::Forced: return "deathblossom";
    case Mode::Undo: return "undo";
  }
  return "unknown";
}

}  // namespace privguard::common
