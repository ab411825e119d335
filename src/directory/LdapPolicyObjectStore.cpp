#include "directory/LdapPolicyObjectStore.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "directory/LdapConnection.hpp"
#include "directory/SecurityTemplate.hpp"
#include "security/Digest.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <fstream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace privguard::directory {

namespace {

constexpr int64_t kTicksPerSecond = 10'000'000;
constexpr const char* kNeverExpires = "-9223372036854775808";
// Security settings client-side extension + its editor tool extension
constexpr const char* kSecurityExtensions =
    "[{827D319E-6EAC-11D2-A4EA-00C04F79F83A}{803E14A0-B4FB-11D0-A0D0-00A0C90F574B}]";
constexpr const char* kPsoAppliesTo = "msDS-PSOAppliesTo";

std::string interval(int64_t iSeconds) {
  // Directory intervals are negative 100-nanosecond counts
  return std::to_string(-iSeconds * kTicksPerSecond);
}

std::string boolValue(bool b) { return b ? "TRUE" : "FALSE"; }

std::string toLower(std::string sValue) {
  std::transform(sValue.begin(), sValue.end(), sValue.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return sValue;
}

bool containsNoCase(const std::vector<std::string>& vValues, const std::string& sNeedle) {
  const std::string sLower = toLower(sNeedle);
  return std::any_of(vValues.begin(), vValues.end(),
                     [&](const std::string& s) { return toLower(s) == sLower; });
}

// gPLink option bits
constexpr int kLinkDisabled = 1;
constexpr int kLinkEnforced = 2;

/// One "[LDAP://<dn>;<flags>]" entry of a gPLink value.
/// Unparseable flags are treated as disabled so the link gets rewritten.
struct GpLinkSegment {
  std::string sRaw;
  std::string sPath;
  int iFlags = kLinkDisabled;

  bool matches(const std::string& sGpoDn) const {
    return !sPath.empty() && toLower(sPath) == toLower(sGpoDn);
  }
};

std::vector<GpLinkSegment> splitGpLink(const std::string& sGpLink) {
  static const std::string kPrefix = "[ldap://";
  std::vector<GpLinkSegment> vSegments;
  size_t nPos = 0;
  while (nPos < sGpLink.size()) {
    const size_t nOpen = sGpLink.find('[', nPos);
    if (nOpen == std::string::npos) break;
    const size_t nClose = sGpLink.find(']', nOpen);
    if (nClose == std::string::npos) break;

    GpLinkSegment gls;
    gls.sRaw = sGpLink.substr(nOpen, nClose - nOpen + 1);
    const size_t nSemi = gls.sRaw.rfind(';');
    if (toLower(gls.sRaw).rfind(kPrefix, 0) == 0 && nSemi != std::string::npos &&
        nSemi > kPrefix.size()) {
      gls.sPath = gls.sRaw.substr(kPrefix.size(), nSemi - kPrefix.size());
      const std::string sFlags = gls.sRaw.substr(nSemi + 1, gls.sRaw.size() - nSemi - 2);
      if (!sFlags.empty() && sFlags.size() < 10 &&
          std::all_of(sFlags.begin(), sFlags.end(),
                      [](unsigned char c) { return std::isdigit(c) != 0; })) {
        gls.iFlags = std::stoi(sFlags);
      }
    }
    vSegments.push_back(std::move(gls));
    nPos = nClose + 1;
  }
  return vSegments;
}

void checkPairing(common::PolicyKind kind, common::LinkTarget target) {
  const bool bValid =
      (kind == common::PolicyKind::PasswordSettings &&
       target == common::LinkTarget::PrivilegedGroup) ||
      (kind == common::PolicyKind::GroupPolicy &&
       target == common::LinkTarget::DomainControllersContainer);
  if (!bValid) {
    throw std::invalid_argument("Policy kind cannot be linked to the requested target");
  }
}

}  // namespace

LdapPolicyObjectStore::LdapPolicyObjectStore(LdapConnection& lcConn, DomainLayout dlLayout,
                                             std::filesystem::path pathSysvol)
    : _lcConn(lcConn), _dlLayout(std::move(dlLayout)), _pathSysvol(std::move(pathSysvol)) {}

LdapPolicyObjectStore::~LdapPolicyObjectStore() = default;

// ── Paths and helpers ──────────────────────────────────────────────────────

std::filesystem::path LdapPolicyObjectStore::gpoRoot(const std::string& sGuid) const {
  return _pathSysvol / "Policies" / sGuid;
}

std::filesystem::path LdapPolicyObjectStore::templatePath(const std::string& sGuid) const {
  return gpoRoot(sGuid) / "Machine" / "Microsoft" / "Windows NT" / "SecEdit" / "GptTmpl.inf";
}

SecurityTemplate LdapPolicyObjectStore::loadTemplate(const std::string& sGuid) const {
  std::ifstream ifs(templatePath(sGuid), std::ios::binary);
  if (!ifs.is_open()) {
    return SecurityTemplate::empty();
  }
  std::ostringstream oss;
  oss << ifs.rdbuf();
  return SecurityTemplate::fromFileBytes(oss.str());
}

void LdapPolicyObjectStore::writeGptIni(const std::string& sGuid, int iVersion) const {
  std::ofstream ofs(gpoRoot(sGuid) / "GPT.INI", std::ios::binary | std::ios::trunc);
  if (!ofs.is_open()) {
    throw common::DirectoryError(0, "sysvol_write_failed",
                                 "Cannot write GPT.INI for policy " + sGuid);
  }
  ofs << "[General]\r\nVersion=" << iVersion << "\r\n";
}

std::string LdapPolicyObjectStore::linkTargetDn(common::LinkTarget target) const {
  switch (target) {
    case common::LinkTarget::PrivilegedGroup: return _dlLayout.sPrivilegedGroupDn;
    case common::LinkTarget::DomainControllersContainer: return _dlLayout.sDomainControllersDn;
  }
  return {};
}

std::string LdapPolicyObjectStore::removeLinkSegment(const std::string& sGpLink,
                                                     const std::string& sGpoDn) {
  std::string sResult;
  for (const auto& gls : splitGpLink(sGpLink)) {
    if (!gls.matches(sGpoDn)) sResult += gls.sRaw;
  }
  return sResult;
}

std::optional<int> LdapPolicyObjectStore::linkFlags(const std::string& sGpLink,
                                                    const std::string& sGpoDn) {
  for (const auto& gls : splitGpLink(sGpLink)) {
    if (gls.matches(sGpoDn)) return gls.iFlags;
  }
  return std::nullopt;
}

std::string LdapPolicyObjectStore::enableLinkSegment(const std::string& sGpLink,
                                                     const std::string& sGpoDn) {
  std::string sResult;
  bool bFound = false;
  for (const auto& gls : splitGpLink(sGpLink)) {
    if (!gls.matches(sGpoDn)) {
      sResult += gls.sRaw;
      continue;
    }
    if (bFound) continue;  // collapse duplicate links to the same policy
    bFound = true;
    if ((gls.iFlags & kLinkDisabled) == 0) {
      sResult += gls.sRaw;
    } else {
      sResult += "[LDAP://" + gls.sPath + ";" + std::to_string(gls.iFlags & kLinkEnforced) + "]";
    }
  }
  if (!bFound) {
    sResult += "[LDAP://" + sGpoDn + ";0]";
  }
  return sResult;
}

void LdapPolicyObjectStore::bumpVersion(const common::ManagedObjectRef& morObject) {
  auto oEntry = _lcConn.read(morObject.sDn, {"versionNumber"});
  if (!oEntry.has_value()) {
    throw common::NotFoundError("policy_not_found", "Policy " + morObject.sDn + " disappeared");
  }
  int iVersion = 0;
  try {
    iVersion = std::stoi(oEntry->first("versionNumber"));
  } catch (const std::exception&) {
    iVersion = 0;
  }
  ++iVersion;  // machine half of the version lives in the low 16 bits

  _lcConn.modify(morObject.sDn,
                 {{ModOp::Replace, "versionNumber", {std::to_string(iVersion)}}});
  writeGptIni(morObject.sGuid, iVersion);
}

void LdapPolicyObjectStore::deleteTree(const std::string& sDn) {
  for (const auto& le : _lcConn.search(sDn, SearchScope::OneLevel, "(objectClass=*)",
                                       {"distinguishedName"})) {
    deleteTree(le.sDn);
  }
  _lcConn.remove(sDn);
}

// ── IPolicyObjectStore ─────────────────────────────────────────────────────

std::optional<common::ManagedObjectRef> LdapPolicyObjectStore::findByName(
    common::PolicyKind kind, const std::string& sName) {
  if (kind == common::PolicyKind::PasswordSettings) {
    const std::string sDn = "CN=" + sName + "," + _dlLayout.sPasswordSettingsDn;
    if (!_lcConn.read(sDn, {"cn"}).has_value()) return std::nullopt;
    return common::ManagedObjectRef{kind, sName, sDn, {}};
  }

  auto vEntries = _lcConn.search(
      _dlLayout.sPoliciesDn, SearchScope::OneLevel,
      "(&(objectClass=groupPolicyContainer)(displayName=" +
          LdapConnection::escapeFilterValue(sName) + "))",
      {"cn"});
  if (vEntries.empty()) return std::nullopt;
  if (vEntries.size() > 1) {
    common::Logger::get()->warn("{} policy objects are named '{}'; using {}", vEntries.size(),
                                sName, vEntries.front().sDn);
  }
  return common::ManagedObjectRef{kind, sName, vEntries.front().sDn,
                                  vEntries.front().first("cn")};
}

common::ManagedObjectRef LdapPolicyObjectStore::createPasswordPolicy(
    const std::string& sName, const common::PasswordPolicySettings& ppsSettings) {
  const std::string sDn = "CN=" + sName + "," + _dlLayout.sPasswordSettingsDn;

  const std::map<std::string, std::vector<std::string>> mAttributes = {
      {"objectClass", {"msDS-PasswordSettings"}},
      {"msDS-PasswordSettingsPrecedence", {std::to_string(ppsSettings.iPrecedence)}},
      {"msDS-PasswordReversibleEncryptionEnabled",
       {boolValue(ppsSettings.bReversibleEncryptionEnabled)}},
      {"msDS-PasswordHistoryLength", {std::to_string(ppsSettings.iPasswordHistoryLength)}},
      {"msDS-PasswordComplexityEnabled", {boolValue(ppsSettings.bComplexityEnabled)}},
      {"msDS-MinimumPasswordLength", {std::to_string(ppsSettings.iMinPasswordLength)}},
      {"msDS-MinimumPasswordAge", {interval(ppsSettings.iMinPasswordAgeSeconds)}},
      {"msDS-MaximumPasswordAge", {interval(ppsSettings.iMaxPasswordAgeSeconds)}},
      {"msDS-LockoutThreshold", {std::to_string(ppsSettings.iLockoutThreshold)}},
      {"msDS-LockoutObservationWindow",
       {interval(ppsSettings.iLockoutObservationWindowSeconds)}},
      {"msDS-LockoutDuration",
       {ppsSettings.bLockoutNeverExpires ? kNeverExpires
                                         : interval(ppsSettings.iLockoutObservationWindowSeconds)}},
  };
  _lcConn.add(sDn, mAttributes);

  common::Logger::get()->info("Created password settings object {}", sDn);
  return common::ManagedObjectRef{common::PolicyKind::PasswordSettings, sName, sDn, {}};
}

common::ManagedObjectRef LdapPolicyObjectStore::createAndLink(common::PolicyKind kind,
                                                              const std::string& sName,
                                                              common::LinkTarget target) {
  checkPairing(kind, target);

  if (kind == common::PolicyKind::PasswordSettings) {
    auto morPolicy = createPasswordPolicy(sName, common::PasswordPolicySettings{});
    link(morPolicy, target);
    return morPolicy;
  }

  const std::string sGuid = security::Digest::randomGuid();
  const std::string sDn = "CN=" + sGuid + "," + _dlLayout.sPoliciesDn;
  const std::string sFileSysPath = "\\\\" + _dlLayout.sDnsDomain + "\\SysVol\\" +
                                   _dlLayout.sDnsDomain + "\\Policies\\" + sGuid;
  auto spLog = common::Logger::get();

  // SYSVOL first: a container without its template would look applied but do nothing
  std::error_code ec;
  std::filesystem::create_directories(templatePath(sGuid).parent_path(), ec);
  if (!ec) std::filesystem::create_directories(gpoRoot(sGuid) / "User", ec);
  if (ec) {
    throw common::DirectoryError(0, "sysvol_write_failed",
                                 "Cannot create policy folder under " + _pathSysvol.string() +
                                     ": " + ec.message());
  }

  common::ManagedObjectRef morPolicy{kind, sName, sDn, sGuid};
  try {
    writeGptIni(sGuid, 0);
    {
      std::ofstream ofs(templatePath(sGuid), std::ios::binary | std::ios::trunc);
      ofs << SecurityTemplate::empty().toFileBytes();
    }

    _lcConn.add(sDn, {
                         {"objectClass", {"groupPolicyContainer"}},
                         {"displayName", {sName}},
                         {"gPCFileSysPath", {sFileSysPath}},
                         {"gPCFunctionalityVersion", {"2"}},
                         {"gPCMachineExtensionNames", {kSecurityExtensions}},
                         {"flags", {"0"}},
                         {"versionNumber", {"0"}},
                     });
    _lcConn.add("CN=Machine," + sDn, {{"objectClass", {"container"}}});
    _lcConn.add("CN=User," + sDn, {{"objectClass", {"container"}}});
    link(morPolicy, target);
  } catch (const std::exception& ex) {
    spLog->error("Creating policy '{}' failed, rolling back: {}", sName, ex.what());
    try {
      if (_lcConn.read(sDn, {"cn"}).has_value()) {
        deleteTree(sDn);
      }
    } catch (const common::DirectoryError& exRollback) {
      spLog->error("Rollback of {} failed: {}", sDn, exRollback.what());
    }
    std::filesystem::remove_all(gpoRoot(sGuid), ec);
    throw;
  }

  spLog->info("Created group policy object '{}' ({}) linked to {}", sName, sGuid,
              linkTargetDn(target));
  return morPolicy;
}

void LdapPolicyObjectStore::link(const common::ManagedObjectRef& morObject,
                                 common::LinkTarget target) {
  checkPairing(morObject.kind, target);
  if (isLinked(morObject, target)) return;

  const std::string sTargetDn = linkTargetDn(target);
  if (morObject.kind == common::PolicyKind::PasswordSettings) {
    _lcConn.modify(morObject.sDn, {{ModOp::Add, kPsoAppliesTo, {sTargetDn}}});
    return;
  }

  auto oTarget = _lcConn.read(sTargetDn, {"gPLink"});
  if (!oTarget.has_value()) {
    throw common::NotFoundError("link_target_missing", "Link target " + sTargetDn + " not found");
  }
  const std::string sGpLink = enableLinkSegment(oTarget->first("gPLink"), morObject.sDn);
  _lcConn.modify(sTargetDn, {{ModOp::Replace, "gPLink", {sGpLink}}});
}

bool LdapPolicyObjectStore::isLinked(const common::ManagedObjectRef& morObject,
                                     common::LinkTarget target) {
  const std::string sTargetDn = linkTargetDn(target);
  if (morObject.kind == common::PolicyKind::PasswordSettings) {
    auto oEntry = _lcConn.read(morObject.sDn, {kPsoAppliesTo});
    return oEntry.has_value() && containsNoCase(oEntry->values(kPsoAppliesTo), sTargetDn);
  }

  auto oTarget = _lcConn.read(sTargetDn, {"gPLink"});
  if (!oTarget.has_value()) return false;
  const auto oFlags = linkFlags(oTarget->first("gPLink"), morObject.sDn);
  return oFlags.has_value() && (*oFlags & kLinkDisabled) == 0;
}

std::optional<std::string> LdapPolicyObjectStore::getValue(
    const common::ManagedObjectRef& morObject, const std::string& sKey) {
  if (morObject.kind == common::PolicyKind::PasswordSettings) {
    auto oEntry = _lcConn.read(morObject.sDn, {sKey});
    if (!oEntry.has_value() || oEntry->values(sKey).empty()) return std::nullopt;
    return oEntry->first(sKey);
  }
  return loadTemplate(morObject.sGuid).get(SecurityTemplate::kRegistryValues, sKey);
}

bool LdapPolicyObjectStore::setValue(const common::ManagedObjectRef& morObject,
                                     const std::string& sKey, const std::string& sValue) {
  if (morObject.kind == common::PolicyKind::PasswordSettings) {
    if (getValue(morObject, sKey) == sValue) return false;
    _lcConn.modify(morObject.sDn, {{ModOp::Replace, sKey, {sValue}}});
    return true;
  }

  auto stTemplate = loadTemplate(morObject.sGuid);
  if (!stTemplate.set(SecurityTemplate::kRegistryValues, sKey, sValue)) {
    return false;
  }

  std::ofstream ofs(templatePath(morObject.sGuid), std::ios::binary | std::ios::trunc);
  if (!ofs.is_open()) {
    throw common::DirectoryError(0, "sysvol_write_failed",
                                 "Cannot write security template for " + morObject.sName);
  }
  ofs << stTemplate.toFileBytes();
  ofs.close();

  bumpVersion(morObject);
  common::Logger::get()->debug("Set {}={} in '{}'", sKey, sValue, morObject.sName);
  return true;
}

bool LdapPolicyObjectStore::deleteByName(common::PolicyKind kind, const std::string& sName) {
  auto oObject = findByName(kind, sName);
  if (!oObject.has_value()) return false;

  if (kind == common::PolicyKind::PasswordSettings) {
    return _lcConn.remove(oObject->sDn);
  }

  // Unlink first so domain controllers never reference a missing container
  auto oTarget = _lcConn.read(_dlLayout.sDomainControllersDn, {"gPLink"});
  if (oTarget.has_value()) {
    const std::string sGpLink = oTarget->first("gPLink");
    if (linkFlags(sGpLink, oObject->sDn).has_value()) {
      const std::string sRemaining = removeLinkSegment(sGpLink, oObject->sDn);
      std::vector<std::string> vValues;
      if (!sRemaining.empty()) vValues.push_back(sRemaining);
      _lcConn.modify(_dlLayout.sDomainControllersDn, {{ModOp::Replace, "gPLink", vValues}});
    }
  }

  deleteTree(oObject->sDn);

  std::error_code ec;
  std::filesystem::remove_all(gpoRoot(oObject->sGuid), ec);
  if (ec) {
    throw common::DirectoryError(0, "sysvol_delete_failed",
                                 "Policy container removed but SYSVOL folder " +
                                     gpoRoot(oObject->sGuid).string() +
                                     " could not be deleted: " + ec.message());
  }
  common::Logger::get()->info("Deleted group policy object '{}' ({})", sName, oObject->sGuid);
  return true;
}

}  // namespace privguard::directory
