#pragma once

#include <string>
#include <vector>

#include "common/Types.hpp"

namespace privguard::directory {

/// Pure abstract interface over the directory service.
/// Read access plus the single per-account mutation privguard performs.
class IDirectory {
 public:
  virtual ~IDirectory() = default;

  /// Throws DirectoryError when the directory cannot be reached.
  virtual void ping() = 0;
  virtual bool isBindIdentityPrivileged() = 0;

  virtual std::vector<common::PrivilegedAccount> listPrivilegedAccounts() = 0;
  virtual std::vector<std::string> listDomainControllers() = 0;
  virtual std::vector<common::AdminGroupMember> listAdminGroupMembers() = 0;

  /// Replace the account's allowed logon targets; an empty list removes the restriction.
  virtual void setAllowedLogonTargets(const std::string& sAccountName,
                                      const std::vector<std::string>& vTargets) = 0;
};

}  // namespace privguard::directory
