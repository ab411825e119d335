#include "remediation/PasswordPolicyAction.hpp"

#include "cli/Confirmer.hpp"
#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "directory/IPolicyObjectStore.hpp"

namespace privguard::remediation {

using common::ActionOutcome;
using common::ActionResult;
using common::LinkTarget;
using common::PolicyKind;

PasswordPolicyAction::PasswordPolicyAction(directory::IPolicyObjectStore& posStore,
                                           cli::IConfirmer& cfConfirmer)
    : _posStore(posStore), _cfConfirmer(cfConfirmer) {}

PasswordPolicyAction::~PasswordPolicyAction() = default;

std::string PasswordPolicyAction::title() const {
  return "Create a fine-grained password policy for privileged accounts?";
}

std::string PasswordPolicyAction::helpYes() const {
  return std::string("Yes: creates '") + kPasswordPolicyName +
         "' (minimum length 12, complexity on, lockout after 5 bad attempts within 24 hours "
         "until an administrator unlocks, history 10, minimum age 3 days, maximum age 30 days, "
         "no reversible encryption) and applies it to the privileged group.";
}

std::string PasswordPolicyAction::helpNo() const {
  return "No: privileged accounts keep the domain-wide password and lockout policy.";
}

ActionResult PasswordPolicyAction::ensure(bool bConfirm) {
  auto spLog = common::Logger::get();

  auto oExisting = _posStore.findByName(PolicyKind::PasswordSettings, kPasswordPolicyName);
  if (oExisting.has_value()) {
    if (_posStore.isLinked(*oExisting, LinkTarget::PrivilegedGroup)) {
      return {ActionOutcome::Unchanged,
              std::string("Password policy '") + kPasswordPolicyName +
                  "' already applies to the privileged group"};
    }
    // An object this run did not create is never deleted on No
    if (bConfirm &&
        _cfConfirmer.ask("Apply the existing password policy to the privileged group now?",
                         "Yes links the policy. No leaves it in place, unlinked.") ==
            cli::Answer::No) {
      return {ActionOutcome::Skipped,
              std::string("Existing password policy '") + kPasswordPolicyName +
                  "' left unlinked"};
    }
    _posStore.link(*oExisting, LinkTarget::PrivilegedGroup);
    return {ActionOutcome::Applied,
            std::string("Existing password policy '") + kPasswordPolicyName +
                "' linked to the privileged group"};
  }

  auto morPolicy =
      _posStore.createPasswordPolicy(kPasswordPolicyName, common::PasswordPolicySettings{});

  if (bConfirm &&
      _cfConfirmer.ask("Apply the new password policy to the privileged group now?",
                       "Yes links the policy. No deletes the policy that was just created.") ==
          cli::Answer::No) {
    _posStore.deleteByName(PolicyKind::PasswordSettings, kPasswordPolicyName);
    return {ActionOutcome::Skipped,
            std::string("Password policy '") + kPasswordPolicyName +
                "' was not linked and has been removed again"};
  }

  try {
    _posStore.link(morPolicy, LinkTarget::PrivilegedGroup);
  } catch (const std::exception& ex) {
    spLog->error("Linking '{}' failed, deleting it: {}", kPasswordPolicyName, ex.what());
    _posStore.deleteByName(PolicyKind::PasswordSettings, kPasswordPolicyName);
    throw;
  }

  return {ActionOutcome::Applied,
          std::string("Password policy '") + kPasswordPolicyName +
              "' created and applied to the privileged group"};
}

ActionResult PasswordPolicyAction::remove() {
  try {
    if (_posStore.deleteByName(PolicyKind::PasswordSettings, kPasswordPolicyName)) {
      return {ActionOutcome::Applied,
              std::string("Password policy '") + kPasswordPolicyName + "' deleted"};
    }
  } catch (const common::NotFoundError&) {
    // raced with another delete; same outcome as absent
  }
  return {ActionOutcome::Unchanged,
          std::string("Password policy '") + kPasswordPolicyName + "' not present"};
}

}  // namespace privguard::remediation
