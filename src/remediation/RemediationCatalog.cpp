#include "remediation/RemediationCatalog.hpp"

#include "remediation/DcPolicyAction.hpp"
#include "remediation/LogonRestrictionAction.hpp"
#include "remediation/PasswordPolicyAction.hpp"

namespace privguard::remediation {

RemediationCatalog::RemediationCatalog(directory::IPolicyObjectStore& posStore,
                                       directory::IDirectory& dirDirectory,
                                       dal::LogonTargetLedger& ltlLedger,
                                       cli::IConfirmer& cfConfirmer) {
  _vActions.push_back(std::make_unique<PasswordPolicyAction>(posStore, cfConfirmer));
  _vActions.push_back(std::make_unique<LogonRestrictionAction>(dirDirectory, ltlLedger));
  _vActions.push_back(std::make_unique<NullSessionAction>(posStore));
  _vActions.push_back(std::make_unique<CredentialCachingAction>(posStore));
}

RemediationCatalog::~RemediationCatalog() = default;

}  // namespace privguard::remediation
