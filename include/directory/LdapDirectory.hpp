#pragma once

#include <string>
#include <vector>

#include "directory/IDirectory.hpp"

namespace privguard::common {
struct Config;
}

namespace privguard::directory {

class LdapConnection;

/// Distinguished names privguard works with, resolved once per run.
/// Class abbreviation: dl
struct DomainLayout {
  std::string sBaseDn;
  std::string sDnsDomain;
  std::string sPrivilegedGroupDn;
  std::string sEnterpriseGroupDn;
  std::string sAdminGroupDn;
  std::string sDomainControllersDn;
  std::string sPoliciesDn;
  std::string sPasswordSettingsDn;
};

/// Resolve the layout from config and the directory itself.
/// Throws DirectoryError when a required group cannot be found.
DomainLayout resolveDomainLayout(LdapConnection& lcConn, const common::Config& cfg);

/// "DC=corp,DC=example,DC=com" → "corp.example.com".
std::string dnsDomainFromDn(const std::string& sBaseDn);

/// Relative ID (last sub-authority) of a binary objectSid, -1 if malformed.
long ridFromSid(const std::string& sBinarySid);

/// Active Directory implementation of IDirectory over LDAP.
/// Class abbreviation: ld
class LdapDirectory : public IDirectory {
 public:
  LdapDirectory(LdapConnection& lcConn, DomainLayout dlLayout);
  ~LdapDirectory() override;

  void ping() override;
  bool isBindIdentityPrivileged() override;

  std::vector<common::PrivilegedAccount> listPrivilegedAccounts() override;
  std::vector<std::string> listDomainControllers() override;
  std::vector<common::AdminGroupMember> listAdminGroupMembers() override;

  void setAllowedLogonTargets(const std::string& sAccountName,
                              const std::vector<std::string>& vTargets) override;

  const DomainLayout& layout() const { return _dlLayout; }

 private:
  /// True when sDn is (transitively) a member of the privileged or enterprise group.
  bool inPrivilegedChain(const std::string& sDn);

  LdapConnection& _lcConn;
  DomainLayout _dlLayout;
};

}  // namespace privguard::directory
