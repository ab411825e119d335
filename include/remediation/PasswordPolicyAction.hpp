#pragma once

#include "remediation/RemediationAction.hpp"

namespace privguard::directory {
class IPolicyObjectStore;
}

namespace privguard::cli {
class IConfirmer;
}

namespace privguard::remediation {

/// Fine-grained password policy for the privileged group.
/// Class abbreviation: ppa
class PasswordPolicyAction : public RemediationAction {
 public:
  PasswordPolicyAction(directory::IPolicyObjectStore& posStore, cli::IConfirmer& cfConfirmer);
  ~PasswordPolicyAction() override;

  std::string id() const override { return "privileged-password-policy"; }
  std::string title() const override;
  std::string helpYes() const override;
  std::string helpNo() const override;

  /// With bConfirm, asks again after creating the object whether to link it;
  /// declining deletes the object just created.
  common::ActionResult ensure(bool bConfirm) override;
  common::ActionResult remove() override;
  std::string managedObjectName() const override { return kPasswordPolicyName; }

 private:
  directory::IPolicyObjectStore& _posStore;
  cli::IConfirmer& _cfConfirmer;
};

}  // namespace privguard::remediation
