#pragma once

#include <map>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>

#include "common/Errors.hpp"
#include "directory/IPolicyObjectStore.hpp"

namespace privguard::test {

/// In-memory policy store keyed by (kind, name).
/// Counts creations so tests can assert nothing is duplicated.
class FakePolicyObjectStore : public directory::IPolicyObjectStore {
 public:
  struct Object {
    common::ManagedObjectRef mor;
    std::set<common::LinkTarget> setLinks;
    std::map<std::string, std::string> mValues;
    common::PasswordPolicySettings pps;
  };

  std::map<std::pair<common::PolicyKind, std::string>, Object> mObjects;
  int iCreated = 0;
  int iValueWrites = 0;
  bool bFailLink = false;
  bool bFailSetValue = false;

  std::optional<common::ManagedObjectRef> findByName(common::PolicyKind kind,
                                                     const std::string& sName) override {
    auto it = mObjects.find({kind, sName});
    if (it == mObjects.end()) return std::nullopt;
    return it->second.mor;
  }

  common::ManagedObjectRef createPasswordPolicy(
      const std::string& sName, const common::PasswordPolicySettings& ppsSettings) override {
    Object& obj = insert(common::PolicyKind::PasswordSettings, sName);
    obj.pps = ppsSettings;
    return obj.mor;
  }

  common::ManagedObjectRef createAndLink(common::PolicyKind kind, const std::string& sName,
                                         common::LinkTarget target) override {
    Object& obj = insert(kind, sName);
    obj.setLinks.insert(target);
    return obj.mor;
  }

  void link(const common::ManagedObjectRef& mor, common::LinkTarget target) override {
    if (bFailLink) throw common::DirectoryError(50, "ldap_insufficient_access", "link refused");
    at(mor).setLinks.insert(target);
  }

  bool isLinked(const common::ManagedObjectRef& mor, common::LinkTarget target) override {
    return at(mor).setLinks.count(target) > 0;
  }

  std::optional<std::string> getValue(const common::ManagedObjectRef& mor,
                                      const std::string& sKey) override {
    const auto& mValues = at(mor).mValues;
    auto it = mValues.find(sKey);
    if (it == mValues.end()) return std::nullopt;
    return it->second;
  }

  bool setValue(const common::ManagedObjectRef& mor, const std::string& sKey,
                const std::string& sValue) override {
    if (bFailSetValue) throw std::runtime_error("SYSVOL is read-only");
    auto& mValues = at(mor).mValues;
    auto it = mValues.find(sKey);
    if (it != mValues.end() && it->second == sValue) return false;
    mValues[sKey] = sValue;
    ++iValueWrites;
    return true;
  }

  bool deleteByName(common::PolicyKind kind, const std::string& sName) override {
    return mObjects.erase({kind, sName}) > 0;
  }

  bool contains(common::PolicyKind kind, const std::string& sName) const {
    return mObjects.count({kind, sName}) > 0;
  }

 private:
  Object& insert(common::PolicyKind kind, const std::string& sName) {
    if (contains(kind, sName)) {
      throw common::DirectoryError(68, "ldap_already_exists", "Already exists: " + sName);
    }
    ++iCreated;
    Object obj;
    obj.mor = {kind, sName, "CN=" + sName + ",CN=System,DC=corp,DC=example,DC=com",
               kind == common::PolicyKind::GroupPolicy
                   ? "{" + std::to_string(iCreated) + "}"
                   : std::string{}};
    return mObjects.emplace(std::make_pair(kind, sName), std::move(obj)).first->second;
  }

  Object& at(const common::ManagedObjectRef& mor) {
    auto it = mObjects.find({mor.kind, mor.sName});
    if (it == mObjects.end()) {
      throw common::NotFoundError("policy_not_found", "No policy object " + mor.sName);
    }
    return it->second;
  }
};

}  // namespace privguard::test
