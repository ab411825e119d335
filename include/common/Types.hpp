#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace privguard::common {

/// Member of the privileged (Domain Admins) group.
/// Class abbreviation: pa
struct PrivilegedAccount {
  std::string sAccountName;
  std::vector<std::string> vAllowedLogonTargets;  // empty = unrestricted
};

/// Member of the built-in Administrators group.
/// Class abbreviation: agm
struct AdminGroupMember {
  std::string sAccountName;
  bool bIsWellKnownAdministrator = false;
  bool bIsMemberOfPrivilegedOrEnterpriseGroup = false;
};

/// Policy values read from the resultant-policy document.
/// nullopt means the setting was absent or malformed.
/// Class abbreviation: pf
struct PolicyFields {
  std::optional<int> oMinPasswordAge;
  std::optional<int> oLockoutThreshold;
  std::optional<int> oMinPasswordLength;
  std::optional<bool> oComplexityEnabled;
  std::optional<int> oPasswordHistorySize;
  std::optional<bool> oNullSessionsRestricted;
  std::optional<bool> oAnonymousSidTranslationRestricted;
};

/// Immutable facts captured once at the start of a run.
/// Class abbreviation: ds
struct DomainSnapshot {
  PolicyFields pfPolicy;
  std::vector<PrivilegedAccount> vPrivilegedAccounts;
  std::vector<std::string> vDomainControllers;
  std::vector<AdminGroupMember> vAdminGroupMembers;
  std::string sDocumentDigest;
};

enum class Severity { Success, Warning, Error };

/// Evaluation order is the declaration order.
enum class CheckId {
  PrivilegedAccountCount,
  PasswordHistory,
  LockoutThreshold,
  PasswordComplexity,
  MinPasswordLength,
  LogonRestriction,
  NullSessions,
  AnonymousSidTranslation,
  AdminGroupMembership,
};

/// Class abbreviation: fd
struct Finding {
  Severity severity;
  CheckId checkId;
  std::string sMessage;
};

enum class ActionOutcome { Applied, Unchanged, Skipped, Failed };

/// Result of one remediation ensure/remove call.
/// Class abbreviation: ar
struct ActionResult {
  ActionOutcome outcome = ActionOutcome::Unchanged;
  std::string sMessage;

  bool applied() const { return outcome == ActionOutcome::Applied; }
  bool skipped() const { return outcome == ActionOutcome::Skipped; }
  std::optional<std::string> error() const {
    if (outcome == ActionOutcome::Failed) return sMessage;
    return std::nullopt;
  }
};

enum class PolicyKind { PasswordSettings, GroupPolicy };

/// Where a managed policy object gets linked.
enum class LinkTarget { PrivilegedGroup, DomainControllersContainer };

/// Handle to a policy object privguard created, located by its fixed name.
/// Class abbreviation: mor
struct ManagedObjectRef {
  PolicyKind kind = PolicyKind::GroupPolicy;
  std::string sName;
  std::string sDn;
  std::string sGuid;  // GroupPolicy only, braces included
};

/// Fine-grained password policy parameters. Durations in seconds.
/// Class abbreviation: pps
struct PasswordPolicySettings {
  int iPrecedence = 1;
  int iMinPasswordLength = 12;
  bool bComplexityEnabled = true;
  bool bReversibleEncryptionEnabled = false;
  int iPasswordHistoryLength = 10;
  int iLockoutThreshold = 5;
  int64_t iLockoutObservationWindowSeconds = 24 * 3600;
  bool bLockoutNeverExpires = true;
  int64_t iMinPasswordAgeSeconds = 3 * 86400;
  int64_t iMaxPasswordAgeSeconds = 30 * 86400;
};

/// Top-level CLI mode.
enum class Mode { Help, Evaluate, Remediate, Forced, Undo };

std::string toString(Severity severity);
std::string toString(CheckId checkId);
std::string toString(ActionOutcome outcome);
std::string toString(Mode mode);

}  // namespace privguard::common
