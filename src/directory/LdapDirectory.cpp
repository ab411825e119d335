#include "directory/LdapDirectory.hpp"

#include "common/Config.hpp"
#include "common/Errors.hpp"
#include "common/HostNames.hpp"
#include "common/Logger.hpp"
#include "directory/LdapConnection.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>

namespace privguard::directory {

namespace {

constexpr const char* kInChain = "1.2.840.113556.1.4.1941";
constexpr const char* kBitAnd = "1.2.840.113556.1.4.803";
constexpr int kServerTrustAccount = 8192;
constexpr long kWellKnownAdministratorRid = 500;

std::string findGroupDn(LdapConnection& lcConn, const std::string& sBaseDn,
                        const std::string& sGroupName) {
  auto vEntries = lcConn.search(
      sBaseDn, SearchScope::Subtree,
      "(&(objectClass=group)(sAMAccountName=" +
          LdapConnection::escapeFilterValue(sGroupName) + "))",
      {"distinguishedName"});
  if (vEntries.empty()) {
    throw common::DirectoryError(0, "group_not_found",
                                 "Group '" + sGroupName + "' not found under " + sBaseDn);
  }
  return vEntries.front().sDn;
}

bool equalsNoCase(const std::string& sA, const std::string& sB) {
  return sA.size() == sB.size() &&
         std::equal(sA.begin(), sA.end(), sB.begin(), [](unsigned char a, unsigned char b) {
           return std::tolower(a) == std::tolower(b);
         });
}

}  // namespace

std::string dnsDomainFromDn(const std::string& sBaseDn) {
  std::string sDomain;
  size_t nPos = 0;
  while (nPos < sBaseDn.size()) {
    size_t nComma = sBaseDn.find(',', nPos);
    if (nComma == std::string::npos) nComma = sBaseDn.size();
    std::string sRdn = sBaseDn.substr(nPos, nComma - nPos);
    sRdn.erase(0, sRdn.find_first_not_of(' '));
    if (sRdn.size() > 3 && (sRdn[0] == 'D' || sRdn[0] == 'd') &&
        (sRdn[1] == 'C' || sRdn[1] == 'c') && sRdn[2] == '=') {
      if (!sDomain.empty()) sDomain += '.';
      sDomain += sRdn.substr(3);
    }
    nPos = nComma + 1;
  }
  return sDomain;
}

long ridFromSid(const std::string& sBinarySid) {
  // revision(1) count(1) authority(6) sub-authorities(4 * count)
  if (sBinarySid.size() < 8) return -1;
  const auto iCount = static_cast<unsigned char>(sBinarySid[1]);
  if (iCount == 0 || sBinarySid.size() != 8 + 4 * static_cast<size_t>(iCount)) return -1;

  const size_t nOffset = sBinarySid.size() - 4;
  uint32_t uRid = 0;
  for (int i = 3; i >= 0; --i) {
    uRid = (uRid << 8) | static_cast<unsigned char>(sBinarySid[nOffset + static_cast<size_t>(i)]);
  }
  return static_cast<long>(uRid);
}

DomainLayout resolveDomainLayout(LdapConnection& lcConn, const common::Config& cfg) {
  DomainLayout dl;
  if (cfg.oBaseDn.has_value()) {
    dl.sBaseDn = *cfg.oBaseDn;
  } else {
    auto oRootDse = lcConn.read("", {"defaultNamingContext"});
    if (!oRootDse.has_value() || oRootDse->first("defaultNamingContext").empty()) {
      throw common::DirectoryError(0, "no_naming_context",
                                   "rootDSE did not return defaultNamingContext");
    }
    dl.sBaseDn = oRootDse->first("defaultNamingContext");
  }

  dl.sDnsDomain = dnsDomainFromDn(dl.sBaseDn);
  dl.sPrivilegedGroupDn = findGroupDn(lcConn, dl.sBaseDn, cfg.sPrivilegedGroup);
  dl.sEnterpriseGroupDn = findGroupDn(lcConn, dl.sBaseDn, cfg.sEnterpriseGroup);
  dl.sAdminGroupDn = findGroupDn(lcConn, dl.sBaseDn, cfg.sAdminGroup);
  dl.sDomainControllersDn = "OU=Domain Controllers," + dl.sBaseDn;
  dl.sPoliciesDn = "CN=Policies,CN=System," + dl.sBaseDn;
  dl.sPasswordSettingsDn = "CN=Password Settings Container,CN=System," + dl.sBaseDn;

  common::Logger::get()->debug("Domain layout resolved: base={}, dns={}", dl.sBaseDn,
                               dl.sDnsDomain);
  return dl;
}

LdapDirectory::LdapDirectory(LdapConnection& lcConn, DomainLayout dlLayout)
    : _lcConn(lcConn), _dlLayout(std::move(dlLayout)) {}

LdapDirectory::~LdapDirectory() = default;

void LdapDirectory::ping() {
  if (!_lcConn.read("", {"dnsHostName"}).has_value()) {
    throw common::DirectoryError(0, "rootdse_unreadable", "rootDSE could not be read");
  }
}

bool LdapDirectory::isBindIdentityPrivileged() {
  return inPrivilegedChain(_lcConn.bindDn());
}

bool LdapDirectory::inPrivilegedChain(const std::string& sDn) {
  const std::string sFilter =
      std::string("(|(memberOf:") + kInChain + ":=" +
      LdapConnection::escapeFilterValue(_dlLayout.sPrivilegedGroupDn) + ")(memberOf:" +
      kInChain + ":=" + LdapConnection::escapeFilterValue(_dlLayout.sEnterpriseGroupDn) + "))";
  return !_lcConn.search(sDn, SearchScope::Base, sFilter, {"distinguishedName"}).empty();
}

std::vector<common::PrivilegedAccount> LdapDirectory::listPrivilegedAccounts() {
  const std::string sFilter =
      std::string("(&(objectCategory=person)(objectClass=user)(memberOf:") + kInChain + ":=" +
      LdapConnection::escapeFilterValue(_dlLayout.sPrivilegedGroupDn) + "))";
  auto vEntries = _lcConn.search(_dlLayout.sBaseDn, SearchScope::Subtree, sFilter,
                                 {"sAMAccountName", "userWorkstations"});

  std::vector<common::PrivilegedAccount> vAccounts;
  vAccounts.reserve(vEntries.size());
  for (const auto& le : vEntries) {
    common::PrivilegedAccount pa;
    pa.sAccountName = le.first("sAMAccountName");
    pa.vAllowedLogonTargets = common::splitList(le.first("userWorkstations"));
    vAccounts.push_back(std::move(pa));
  }
  std::sort(vAccounts.begin(), vAccounts.end(),
            [](const auto& a, const auto& b) { return a.sAccountName < b.sAccountName; });
  return vAccounts;
}

std::vector<std::string> LdapDirectory::listDomainControllers() {
  const std::string sFilter = std::string("(&(objectCategory=computer)(userAccountControl:") +
                              kBitAnd + ":=" + std::to_string(kServerTrustAccount) + "))";
  auto vEntries = _lcConn.search(_dlLayout.sBaseDn, SearchScope::Subtree, sFilter,
                                 {"dNSHostName", "cn"});

  std::vector<std::string> vControllers;
  for (const auto& le : vEntries) {
    std::string sHost = le.first("dNSHostName");
    if (sHost.empty()) sHost = le.first("cn");
    if (!sHost.empty()) vControllers.push_back(std::move(sHost));
  }
  std::sort(vControllers.begin(), vControllers.end());
  return vControllers;
}

std::vector<common::AdminGroupMember> LdapDirectory::listAdminGroupMembers() {
  auto oGroup = _lcConn.read(_dlLayout.sAdminGroupDn, {"member"});
  if (!oGroup.has_value()) {
    throw common::DirectoryError(0, "admin_group_missing",
                                 "Group " + _dlLayout.sAdminGroupDn + " could not be read");
  }

  std::vector<common::AdminGroupMember> vMembers;
  for (const auto& sMemberDn : oGroup->values("member")) {
    auto oMember = _lcConn.read(sMemberDn, {"sAMAccountName", "objectSid"});
    if (!oMember.has_value()) {
      common::Logger::get()->warn("Administrators member {} could not be read", sMemberDn);
      continue;
    }

    common::AdminGroupMember agm;
    agm.sAccountName = oMember->first("sAMAccountName");
    if (agm.sAccountName.empty()) agm.sAccountName = sMemberDn;
    agm.bIsWellKnownAdministrator = ridFromSid(oMember->first("objectSid")) ==
                                    kWellKnownAdministratorRid;
    agm.bIsMemberOfPrivilegedOrEnterpriseGroup =
        equalsNoCase(sMemberDn, _dlLayout.sPrivilegedGroupDn) ||
        equalsNoCase(sMemberDn, _dlLayout.sEnterpriseGroupDn) || inPrivilegedChain(sMemberDn);
    vMembers.push_back(std::move(agm));
  }
  return vMembers;
}

void LdapDirectory::setAllowedLogonTargets(const std::string& sAccountName,
                                           const std::vector<std::string>& vTargets) {
  auto vEntries = _lcConn.search(
      _dlLayout.sBaseDn, SearchScope::Subtree,
      "(&(objectClass=user)(sAMAccountName=" +
          LdapConnection::escapeFilterValue(sAccountName) + "))",
      {"distinguishedName"});
  if (vEntries.empty()) {
    throw common::NotFoundError("account_not_found", "Account '" + sAccountName + "' not found");
  }

  std::vector<std::string> vValues;
  if (!vTargets.empty()) {
    std::string sJoined;
    for (const auto& sTarget : vTargets) {
      if (!sJoined.empty()) sJoined += ',';
      sJoined += sTarget;
    }
    vValues.push_back(std::move(sJoined));
  }

  // Replace with no values removes the attribute even when it is absent
  _lcConn.modify(vEntries.front().sDn, {{ModOp::Replace, "userWorkstations", vValues}});
}

}  // namespace privguard::directory
