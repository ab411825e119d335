#pragma once

#include <string>
#include <utility>
#include <vector>

#include "remediation/RemediationAction.hpp"

namespace privguard::directory {
class IPolicyObjectStore;
}

namespace privguard::remediation {

/// Registry values (type 4 = REG_DWORD) written to the domain controllers' security template.
inline constexpr const char* kRestrictNullSessAccess =
    "MACHINE\\System\\CurrentControlSet\\Services\\LanManServer\\Parameters\\RestrictNullSessAccess";
inline constexpr const char* kRestrictAnonymousSam =
    "MACHINE\\System\\CurrentControlSet\\Control\\Lsa\\RestrictAnonymousSAM";
inline constexpr const char* kDisableDomainCreds =
    "MACHINE\\System\\CurrentControlSet\\Control\\Lsa\\DisableDomainCreds";
inline constexpr const char* kDwordEnabled = "4,1";

/// Base for actions that write values into the shared domain controller policy.
/// The policy is found by name or created and linked to the Domain Controllers
/// container in one step; remove() deletes the whole policy.
/// Class abbreviation: dpa
class DcPolicyAction : public RemediationAction {
 public:
  explicit DcPolicyAction(directory::IPolicyObjectStore& posStore);
  ~DcPolicyAction() override;

  common::ActionResult ensure(bool bConfirm) override;
  common::ActionResult remove() override;
  std::string managedObjectName() const override { return kDcPolicyName; }

 protected:
  virtual std::vector<std::pair<std::string, std::string>> values() const = 0;

 private:
  directory::IPolicyObjectStore& _posStore;
};

/// Blocks anonymous named-pipe/share access and anonymous SAM enumeration on DCs.
class NullSessionAction : public DcPolicyAction {
 public:
  using DcPolicyAction::DcPolicyAction;

  std::string id() const override { return "null-session-lockdown"; }
  std::string title() const override;
  std::string helpYes() const override;
  std::string helpNo() const override;

 protected:
  std::vector<std::pair<std::string, std::string>> values() const override;
};

/// Stops DCs from storing domain credentials for network authentication.
class CredentialCachingAction : public DcPolicyAction {
 public:
  using DcPolicyAction::DcPolicyAction;

  std::string id() const override { return "credential-caching-lockdown"; }
  std::string title() const override;
  std::string helpYes() const override;
  std::string helpNo() const override;

 protected:
  std::vector<std::pair<std::string, std::string>> values() const override;
};

}  // namespace privguard::remediation
