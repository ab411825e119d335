#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "directory/IPolicyObjectStore.hpp"
#include "directory/LdapDirectory.hpp"

namespace privguard::directory {

class LdapConnection;
class SecurityTemplate;

/// Policy objects stored in Active Directory.
/// Password settings live entirely in LDAP (msDS-PasswordSettings).
/// Group policy objects pair a groupPolicyContainer with a GptTmpl.inf
/// security template on the mounted SYSVOL share.
/// Class abbreviation: lpos
class LdapPolicyObjectStore : public IPolicyObjectStore {
 public:
  LdapPolicyObjectStore(LdapConnection& lcConn, DomainLayout dlLayout,
                        std::filesystem::path pathSysvol);
  ~LdapPolicyObjectStore() override;

  std::optional<common::ManagedObjectRef> findByName(common::PolicyKind kind,
                                                     const std::string& sName) override;
  common::ManagedObjectRef createPasswordPolicy(
      const std::string& sName, const common::PasswordPolicySettings& ppsSettings) override;
  common::ManagedObjectRef createAndLink(common::PolicyKind kind, const std::string& sName,
                                         common::LinkTarget target) override;
  void link(const common::ManagedObjectRef& morObject, common::LinkTarget target) override;
  bool isLinked(const common::ManagedObjectRef& morObject, common::LinkTarget target) override;
  std::optional<std::string> getValue(const common::ManagedObjectRef& morObject,
                                      const std::string& sKey) override;
  bool setValue(const common::ManagedObjectRef& morObject, const std::string& sKey,
                const std::string& sValue) override;
  bool deleteByName(common::PolicyKind kind, const std::string& sName) override;

  /// "[LDAP://a;0][LDAP://b;0]" without the segment pointing at sGpoDn.
  static std::string removeLinkSegment(const std::string& sGpLink, const std::string& sGpoDn);

  /// Option bits of the segment pointing at sGpoDn, or nullopt when the policy is not linked.
  static std::optional<int> linkFlags(const std::string& sGpLink, const std::string& sGpoDn);

  /// sGpLink with exactly one enabled segment for sGpoDn; the enforced bit is kept.
  static std::string enableLinkSegment(const std::string& sGpLink, const std::string& sGpoDn);

 private:
  std::filesystem::path gpoRoot(const std::string& sGuid) const;
  std::filesystem::path templatePath(const std::string& sGuid) const;
  SecurityTemplate loadTemplate(const std::string& sGuid) const;
  void writeGptIni(const std::string& sGuid, int iVersion) const;
  void bumpVersion(const common::ManagedObjectRef& morObject);
  std::string linkTargetDn(common::LinkTarget target) const;
  void deleteTree(const std::string& sDn);

  LdapConnection& _lcConn;
  DomainLayout _dlLayout;
  std::filesystem::path _pathSysvol;
};

}  // namespace privguard::directory
