#include "directory/LdapConnection.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "security/Digest.hpp"

#include <ldap.h>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <list>

namespace privguard::directory {

namespace {

const std::vector<std::string> kNoValues;

int toLdapScope(SearchScope scope) {
  switch (scope) {
    case SearchScope::Base: return LDAP_SCOPE_BASE;
    case SearchScope::OneLevel: return LDAP_SCOPE_ONELEVEL;
    case SearchScope::Subtree: return LDAP_SCOPE_SUBTREE;
  }
  return LDAP_SCOPE_SUBTREE;
}

int toLdapModOp(ModOp op) {
  switch (op) {
    case ModOp::Add: return LDAP_MOD_ADD;
    case ModOp::Replace: return LDAP_MOD_REPLACE;
    case ModOp::Delete: return LDAP_MOD_DELETE;
  }
  return LDAP_MOD_REPLACE;
}

std::string toLower(std::string sValue) {
  std::transform(sValue.begin(), sValue.end(), sValue.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return sValue;
}

/// Owns the berval storage backing an LDAPMod array for one add/modify call.
class ModBuilder {
 public:
  void append(int iOp, const std::string& sAttribute, const std::vector<std::string>& vValues) {
    auto& vBer = _lBerStorage.emplace_back();
    vBer.reserve(vValues.size());
    for (const auto& sValue : vValues) {
      berval bv{};
      bv.bv_len = static_cast<ber_len_t>(sValue.size());
      bv.bv_val = const_cast<char*>(sValue.data());
      vBer.push_back(bv);
    }
    auto& vBerPtrs = _lBerPtrStorage.emplace_back();
    for (auto& bv : vBer) {
      vBerPtrs.push_back(&bv);
    }
    vBerPtrs.push_back(nullptr);

    auto& mod = _lMods.emplace_back();
    mod.mod_op = iOp | LDAP_MOD_BVALUES;
    mod.mod_type = const_cast<char*>(sAttribute.c_str());
    mod.mod_bvalues = vValues.empty() ? nullptr : vBerPtrs.data();
  }

  LDAPMod** finish() {
    _vModPtrs.clear();
    for (auto& mod : _lMods) {
      _vModPtrs.push_back(&mod);
    }
    _vModPtrs.push_back(nullptr);
    return _vModPtrs.data();
  }

 private:
  // std::list keeps element addresses stable while appending
  std::list<std::vector<berval>> _lBerStorage;
  std::list<std::vector<berval*>> _lBerPtrStorage;
  std::list<LDAPMod> _lMods;
  std::vector<LDAPMod*> _vModPtrs;
};

}  // namespace

// ── LdapEntry ──────────────────────────────────────────────────────────────

const std::vector<std::string>& LdapEntry::values(const std::string& sName) const {
  auto it = mAttributes.find(toLower(sName));
  return it == mAttributes.end() ? kNoValues : it->second;
}

std::string LdapEntry::first(const std::string& sName) const {
  const auto& vValues = values(sName);
  return vValues.empty() ? std::string{} : vValues.front();
}

// ── LdapConnection ─────────────────────────────────────────────────────────

LdapConnection::LdapConnection(const std::string& sUri, const std::string& sBindDn,
                               std::string sPassword)
    : _sUri(sUri), _sBindDn(sBindDn) {
  auto spLog = common::Logger::get();

  int iRc = ldap_initialize(&_pLdap, _sUri.c_str());
  if (iRc != LDAP_SUCCESS) {
    security::Digest::wipe(sPassword);
    fail(iRc, "initialize", _sUri);
  }

  const int iVersion = LDAP_VERSION3;
  ldap_set_option(_pLdap, LDAP_OPT_PROTOCOL_VERSION, &iVersion);
  ldap_set_option(_pLdap, LDAP_OPT_REFERRALS, LDAP_OPT_OFF);

  berval bvCred{};
  bvCred.bv_len = static_cast<ber_len_t>(sPassword.size());
  bvCred.bv_val = sPassword.data();
  iRc = ldap_sasl_bind_s(_pLdap, _sBindDn.c_str(), LDAP_SASL_SIMPLE, &bvCred,
                         nullptr, nullptr, nullptr);
  security::Digest::wipe(sPassword);
  if (iRc != LDAP_SUCCESS) {
    ldap_unbind_ext_s(_pLdap, nullptr, nullptr);
    _pLdap = nullptr;
    fail(iRc, "bind", _sBindDn);
  }

  spLog->info("Bound to {} as {}", _sUri, _sBindDn);
}

LdapConnection::~LdapConnection() {
  if (_pLdap) {
    ldap_unbind_ext_s(_pLdap, nullptr, nullptr);
  }
}

void LdapConnection::fail(int iResultCode, const std::string& sOperation,
                          const std::string& sTarget) const {
  throw common::DirectoryError(
      iResultCode, "ldap_" + sOperation + "_failed",
      "LDAP " + sOperation + " on '" + sTarget + "' failed: " + ldap_err2string(iResultCode));
}

std::vector<LdapEntry> LdapConnection::search(const std::string& sBase, SearchScope scope,
                                              const std::string& sFilter,
                                              const std::vector<std::string>& vAttributes) {
  std::vector<char*> vAttrPtrs;
  for (const auto& sAttr : vAttributes) {
    vAttrPtrs.push_back(const_cast<char*>(sAttr.c_str()));
  }
  vAttrPtrs.push_back(nullptr);

  LDAPMessage* pResult = nullptr;
  const int iRc = ldap_search_ext_s(_pLdap, sBase.c_str(), toLdapScope(scope), sFilter.c_str(),
                                    vAttrPtrs.data(), 0, nullptr, nullptr, nullptr,
                                    LDAP_NO_LIMIT, &pResult);
  if (iRc != LDAP_SUCCESS) {
    if (pResult) ldap_msgfree(pResult);
    fail(iRc, "search", sBase + " " + sFilter);
  }

  std::vector<LdapEntry> vEntries;
  for (LDAPMessage* pEntry = ldap_first_entry(_pLdap, pResult); pEntry != nullptr;
       pEntry = ldap_next_entry(_pLdap, pEntry)) {
    LdapEntry le;
    if (char* pDn = ldap_get_dn(_pLdap, pEntry)) {
      le.sDn = pDn;
      ldap_memfree(pDn);
    }

    BerElement* pBer = nullptr;
    for (char* pAttr = ldap_first_attribute(_pLdap, pEntry, &pBer); pAttr != nullptr;
         pAttr = ldap_next_attribute(_pLdap, pEntry, pBer)) {
      auto& vValues = le.mAttributes[toLower(pAttr)];
      if (berval** ppValues = ldap_get_values_len(_pLdap, pEntry, pAttr)) {
        for (int i = 0; ppValues[i] != nullptr; ++i) {
          vValues.emplace_back(ppValues[i]->bv_val, ppValues[i]->bv_len);
        }
        ldap_value_free_len(ppValues);
      }
      ldap_memfree(pAttr);
    }
    if (pBer) ber_free(pBer, 0);

    vEntries.push_back(std::move(le));
  }

  ldap_msgfree(pResult);
  return vEntries;
}

std::optional<LdapEntry> LdapConnection::read(const std::string& sDn,
                                              const std::vector<std::string>& vAttributes) {
  try {
    auto vEntries = search(sDn, SearchScope::Base, "(objectClass=*)", vAttributes);
    if (vEntries.empty()) return std::nullopt;
    return vEntries.front();
  } catch (const common::DirectoryError& ex) {
    if (ex._iResultCode == LDAP_NO_SUCH_OBJECT) return std::nullopt;
    throw;
  }
}

void LdapConnection::add(const std::string& sDn,
                         const std::map<std::string, std::vector<std::string>>& mAttributes) {
  ModBuilder mb;
  for (const auto& [sAttr, vValues] : mAttributes) {
    mb.append(LDAP_MOD_ADD, sAttr, vValues);
  }
  const int iRc = ldap_add_ext_s(_pLdap, sDn.c_str(), mb.finish(), nullptr, nullptr);
  if (iRc != LDAP_SUCCESS) {
    fail(iRc, "add", sDn);
  }
  common::Logger::get()->debug("LDAP add {}", sDn);
}

void LdapConnection::modify(const std::string& sDn, const std::vector<LdapModification>& vMods) {
  ModBuilder mb;
  for (const auto& lm : vMods) {
    mb.append(toLdapModOp(lm.op), lm.sAttribute, lm.vValues);
  }
  const int iRc = ldap_modify_ext_s(_pLdap, sDn.c_str(), mb.finish(), nullptr, nullptr);
  if (iRc != LDAP_SUCCESS) {
    fail(iRc, "modify", sDn);
  }
  common::Logger::get()->debug("LDAP modify {} ({} changes)", sDn, vMods.size());
}

bool LdapConnection::remove(const std::string& sDn) {
  const int iRc = ldap_delete_ext_s(_pLdap, sDn.c_str(), nullptr, nullptr);
  if (iRc == LDAP_NO_SUCH_OBJECT) {
    return false;
  }
  if (iRc != LDAP_SUCCESS) {
    fail(iRc, "delete", sDn);
  }
  common::Logger::get()->debug("LDAP delete {}", sDn);
  return true;
}

std::string LdapConnection::escapeFilterValue(const std::string& sValue) {
  std::string sEscaped;
  sEscaped.reserve(sValue.size());
  for (unsigned char c : sValue) {
    if (c == '*' || c == '(' || c == ')' || c == '\\' || c == '\0') {
      char vHex[4];
      std::snprintf(vHex, sizeof(vHex), "\\%02x", c);
      sEscaped += vHex;
    } else {
      sEscaped += static_cast<char>(c);
    }
  }
  return sEscaped;
}

}  // namespace privguard::directory
