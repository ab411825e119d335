#pragma once

#include <vector>

#include "common/Types.hpp"

namespace privguard::core {

/// Stateless rule evaluator over a DomainSnapshot.
/// Always returns exactly one finding per CheckId, in CheckId order.
/// Absent settings are graded as failing, never thrown.
/// Class abbreviation: fe
class FindingEngine {
 public:
  static constexpr int kMinPrivilegedAccounts = 2;
  static constexpr int kMaxPrivilegedAccounts = 10;
  static constexpr int kMinPasswordHistory = 10;
  static constexpr int kMaxLockoutThreshold = 10;
  static constexpr int kMinPasswordLengthError = 9;
  static constexpr int kMinPasswordLengthWarning = 12;

  std::vector<common::Finding> evaluate(const common::DomainSnapshot& dsSnapshot) const;

 private:
  common::Finding checkAccountCount(const common::DomainSnapshot& dsSnapshot) const;
  common::Finding checkPasswordHistory(const common::PolicyFields& pfPolicy) const;
  common::Finding checkLockoutThreshold(const common::PolicyFields& pfPolicy) const;
  common::Finding checkComplexity(const common::PolicyFields& pfPolicy) const;
  common::Finding checkMinPasswordLength(const common::PolicyFields& pfPolicy) const;
  common::Finding checkLogonRestriction(const common::DomainSnapshot& dsSnapshot) const;
  common::Finding checkNullSessions(const common::PolicyFields& pfPolicy) const;
  common::Finding checkAnonymousSidTranslation(const common::PolicyFields& pfPolicy) const;
  common::Finding checkAdminGroupMembership(const common::DomainSnapshot& dsSnapshot) const;
};

}  // namespace privguard::core
