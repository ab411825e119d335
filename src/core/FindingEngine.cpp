#include "core/FindingEngine.hpp"

#include "common/HostNames.hpp"

#include <string>

namespace privguard::core {

using common::CheckId;
using common::Finding;
using common::Severity;

namespace {

std::string joinNames(const std::vector<std::string>& vNames) {
  std::string sJoined;
  for (const auto& sName : vNames) {
    if (!sJoined.empty()) sJoined += ", ";
    sJoined += sName;
  }
  return sJoined;
}

}  // namespace

std::vector<Finding> FindingEngine::evaluate(const common::DomainSnapshot& dsSnapshot) const {
  const auto& pf = dsSnapshot.pfPolicy;
  return {
      checkAccountCount(dsSnapshot),
      checkPasswordHistory(pf),
      checkLockoutThreshold(pf),
      checkComplexity(pf),
      checkMinPasswordLength(pf),
      checkLogonRestriction(dsSnapshot),
      checkNullSessions(pf),
      checkAnonymousSidTranslation(pf),
      checkAdminGroupMembership(dsSnapshot),
  };
}

Finding FindingEngine::checkAccountCount(const common::DomainSnapshot& dsSnapshot) const {
  const auto iCount = static_cast<int>(dsSnapshot.vPrivilegedAccounts.size());
  if (iCount < kMinPrivilegedAccounts) {
    return {Severity::Warning, CheckId::PrivilegedAccountCount,
            "Only " + std::to_string(iCount) +
                " privileged account(s); keep at least two so one lockout cannot strand the domain"};
  }
  if (iCount > kMaxPrivilegedAccounts) {
    return {Severity::Warning, CheckId::PrivilegedAccountCount,
            std::to_string(iCount) + " privileged accounts exceeds the recommended maximum of " +
                std::to_string(kMaxPrivilegedAccounts)};
  }
  return {Severity::Success, CheckId::PrivilegedAccountCount,
          std::to_string(iCount) + " privileged accounts"};
}

Finding FindingEngine::checkPasswordHistory(const common::PolicyFields& pfPolicy) const {
  if (!pfPolicy.oPasswordHistorySize.has_value()) {
    return {Severity::Warning, CheckId::PasswordHistory,
            "Password history size is not defined in the resultant policy"};
  }
  const int iHistory = *pfPolicy.oPasswordHistorySize;
  if (pfPolicy.oLockoutThreshold.has_value() && iHistory < *pfPolicy.oLockoutThreshold) {
    return {Severity::Warning, CheckId::PasswordHistory,
            "Password history (" + std::to_string(iHistory) +
                ") is smaller than the lockout threshold (" +
                std::to_string(*pfPolicy.oLockoutThreshold) + ")"};
  }
  if (iHistory < kMinPasswordHistory) {
    return {Severity::Warning, CheckId::PasswordHistory,
            "Password history (" + std::to_string(iHistory) + ") is below " +
                std::to_string(kMinPasswordHistory)};
  }
  return {Severity::Success, CheckId::PasswordHistory,
          "Password history remembers " + std::to_string(iHistory) + " passwords"};
}

Finding FindingEngine::checkLockoutThreshold(const common::PolicyFields& pfPolicy) const {
  if (!pfPolicy.oLockoutThreshold.has_value()) {
    return {Severity::Error, CheckId::LockoutThreshold,
            "Account lockout threshold is not defined in the resultant policy"};
  }
  const int iThreshold = *pfPolicy.oLockoutThreshold;
  if (iThreshold == 0) {
    return {Severity::Error, CheckId::LockoutThreshold,
            "Account lockout is disabled (threshold 0); passwords can be guessed indefinitely"};
  }
  if (iThreshold > kMaxLockoutThreshold) {
    return {Severity::Warning, CheckId::LockoutThreshold,
            "Account lockout threshold (" + std::to_string(iThreshold) + ") is above " +
                std::to_string(kMaxLockoutThreshold)};
  }
  return {Severity::Success, CheckId::LockoutThreshold,
          "Account lockout threshold is " + std::to_string(iThreshold)};
}

Finding FindingEngine::checkComplexity(const common::PolicyFields& pfPolicy) const {
  if (pfPolicy.oComplexityEnabled.value_or(false)) {
    return {Severity::Success, CheckId::PasswordComplexity, "Password complexity is enabled"};
  }
  return {Severity::Warning, CheckId::PasswordComplexity, "Password complexity is not enabled"};
}

Finding FindingEngine::checkMinPasswordLength(const common::PolicyFields& pfPolicy) const {
  if (!pfPolicy.oMinPasswordLength.has_value()) {
    return {Severity::Error, CheckId::MinPasswordLength,
            "Minimum password length is not defined in the resultant policy"};
  }
  const int iLength = *pfPolicy.oMinPasswordLength;
  if (iLength < kMinPasswordLengthError) {
    return {Severity::Error, CheckId::MinPasswordLength,
            "Minimum password length (" + std::to_string(iLength) + ") is below " +
                std::to_string(kMinPasswordLengthError)};
  }
  if (iLength < kMinPasswordLengthWarning) {
    return {Severity::Warning, CheckId::MinPasswordLength,
            "Minimum password length (" + std::to_string(iLength) + ") is below " +
                std::to_string(kMinPasswordLengthWarning)};
  }
  return {Severity::Success, CheckId::MinPasswordLength,
          "Minimum password length is " + std::to_string(iLength)};
}

Finding FindingEngine::checkLogonRestriction(const common::DomainSnapshot& dsSnapshot) const {
  const auto setControllers = common::shortHostSet(dsSnapshot.vDomainControllers);

  std::vector<std::string> vOffenders;
  for (const auto& pa : dsSnapshot.vPrivilegedAccounts) {
    if (pa.vAllowedLogonTargets.empty() ||
        common::shortHostSet(pa.vAllowedLogonTargets) != setControllers) {
      vOffenders.push_back(pa.sAccountName);
    }
  }

  if (!vOffenders.empty()) {
    return {Severity::Error, CheckId::LogonRestriction,
            "Privileged accounts not restricted to domain controllers: " + joinNames(vOffenders)};
  }
  return {Severity::Success, CheckId::LogonRestriction,
          "All privileged accounts can only log on to domain controllers"};
}

Finding FindingEngine::checkNullSessions(const common::PolicyFields& pfPolicy) const {
  if (!pfPolicy.oNullSessionsRestricted.has_value()) {
    return {Severity::Error, CheckId::NullSessions,
            "Null session restriction is not defined on domain controllers"};
  }
  if (*pfPolicy.oNullSessionsRestricted) {
    return {Severity::Success, CheckId::NullSessions,
            "Anonymous access to named pipes and shares is restricted"};
  }
  return {Severity::Error, CheckId::NullSessions,
          "Anonymous access to named pipes and shares is not restricted"};
}

Finding FindingEngine::checkAnonymousSidTranslation(const common::PolicyFields& pfPolicy) const {
  if (!pfPolicy.oAnonymousSidTranslationRestricted.has_value()) {
    return {Severity::Warning, CheckId::AnonymousSidTranslation,
            "Anonymous SID/name translation is not defined on domain controllers"};
  }
  if (*pfPolicy.oAnonymousSidTranslationRestricted) {
    return {Severity::Success, CheckId::AnonymousSidTranslation,
            "Anonymous SID/name translation is disabled"};
  }
  return {Severity::Warning, CheckId::AnonymousSidTranslation,
          "Anonymous SID/name translation is enabled"};
}

Finding FindingEngine::checkAdminGroupMembership(const common::DomainSnapshot& dsSnapshot) const {
  std::vector<std::string> vOffenders;
  for (const auto& agm : dsSnapshot.vAdminGroupMembers) {
    if (!agm.bIsWellKnownAdministrator && !agm.bIsMemberOfPrivilegedOrEnterpriseGroup) {
      vOffenders.push_back(agm.sAccountName);
    }
  }

  if (!vOffenders.empty()) {
    return {Severity::Warning, CheckId::AdminGroupMembership,
            "Administrators group contains accounts outside the privileged groups: " +
                joinNames(vOffenders)};
  }
  return {Severity::Success, CheckId::AdminGroupMembership,
          "Administrators group membership is limited to the privileged groups"};
}

}  // namespace privguard::core
