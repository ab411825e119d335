#pragma once

#include <string>

#include "common/Types.hpp"

namespace privguard::remediation {

/// Every object privguard creates carries this prefix plus a fixed suffix,
/// so it can be found again by name alone.
inline constexpr const char* kPasswordPolicyName = "PrivGuard-PrivilegedPasswordPolicy";
inline constexpr const char* kDcPolicyName = "PrivGuard-DomainControllerHardening";

/// One independently confirmable remediation.
/// ensure() converges to the desired state and is safe to repeat;
/// remove() treats an already-absent object as success.
/// Both may throw; the controllers turn exceptions into Failed results.
class RemediationAction {
 public:
  virtual ~RemediationAction() = default;

  virtual std::string id() const = 0;
  virtual std::string title() const = 0;

  /// What answering Yes does.
  virtual std::string helpYes() const = 0;

  /// What answering No leaves in place.
  virtual std::string helpNo() const = 0;

  virtual common::ActionResult ensure(bool bConfirm) = 0;
  virtual common::ActionResult remove() = 0;

  /// Name of the policy object this action owns; empty when it changes accounts instead.
  virtual std::string managedObjectName() const { return {}; }
};

}  // namespace privguard::remediation
