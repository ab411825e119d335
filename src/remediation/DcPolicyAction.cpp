#include "remediation/DcPolicyAction.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "directory/IPolicyObjectStore.hpp"

namespace privguard::remediation {

using common::ActionOutcome;
using common::ActionResult;
using common::LinkTarget;
using common::PolicyKind;

DcPolicyAction::DcPolicyAction(directory::IPolicyObjectStore& posStore) : _posStore(posStore) {}

DcPolicyAction::~DcPolicyAction() = default;

ActionResult DcPolicyAction::ensure(bool /*bConfirm*/) {
  bool bChanged = false;

  auto oPolicy = _posStore.findByName(PolicyKind::GroupPolicy, kDcPolicyName);
  if (!oPolicy.has_value()) {
    oPolicy = _posStore.createAndLink(PolicyKind::GroupPolicy, kDcPolicyName,
                                      LinkTarget::DomainControllersContainer);
    bChanged = true;
  } else if (!_posStore.isLinked(*oPolicy, LinkTarget::DomainControllersContainer)) {
    _posStore.link(*oPolicy, LinkTarget::DomainControllersContainer);
    bChanged = true;
  }

  for (const auto& [sKey, sValue] : values()) {
    if (_posStore.setValue(*oPolicy, sKey, sValue)) {
      common::Logger::get()->debug("{}: set {}", id(), sKey);
      bChanged = true;
    }
  }

  if (!bChanged) {
    return {ActionOutcome::Unchanged,
            std::string("Policy '") + kDcPolicyName + "' already enforces " + id()};
  }
  return {ActionOutcome::Applied,
          std::string("Policy '") + kDcPolicyName + "' now enforces " + id()};
}

ActionResult DcPolicyAction::remove() {
  try {
    if (_posStore.deleteByName(PolicyKind::GroupPolicy, kDcPolicyName)) {
      return {ActionOutcome::Applied, std::string("Policy '") + kDcPolicyName + "' deleted"};
    }
  } catch (const common::NotFoundError&) {
    // deleted concurrently; same as absent
  }
  return {ActionOutcome::Unchanged, std::string("Policy '") + kDcPolicyName + "' not present"};
}

// ── NullSessionAction ──────────────────────────────────────────────────────

std::string NullSessionAction::title() const {
  return "Block null sessions and anonymous enumeration on domain controllers?";
}

std::string NullSessionAction::helpYes() const {
  return std::string("Yes: in policy '") + kDcPolicyName +
         "' (linked to the Domain Controllers container) restricts anonymous access to named "
         "pipes and shares and disallows anonymous enumeration of SAM accounts.";
}

std::string NullSessionAction::helpNo() const {
  return "No: unauthenticated sessions may keep enumerating users and shares on domain "
         "controllers.";
}

std::vector<std::pair<std::string, std::string>> NullSessionAction::values() const {
  return {{kRestrictNullSessAccess, kDwordEnabled}, {kRestrictAnonymousSam, kDwordEnabled}};
}

// ── CredentialCachingAction ────────────────────────────────────────────────

std::string CredentialCachingAction::title() const {
  return "Stop domain controllers from storing credentials for network authentication?";
}

std::string CredentialCachingAction::helpYes() const {
  return std::string("Yes: in policy '") + kDcPolicyName +
         "' disables storage of passwords and credentials for network authentication.";
}

std::string CredentialCachingAction::helpNo() const {
  return "No: credentials stay cached on domain controllers where they can be harvested.";
}

std::vector<std::pair<std::string, std::string>> CredentialCachingAction::values() const {
  return {{kDisableDomainCreds, kDwordEnabled}};
}

}  // namespace privguard::remediation
