#pragma once

#include <optional>
#include <string>

#include "common/Types.hpp"

namespace privguard::directory {

/// Pure abstract interface over policy objects (fine-grained password
/// policies and group policy objects) that privguard owns.
class IPolicyObjectStore {
 public:
  virtual ~IPolicyObjectStore() = default;

  virtual std::optional<common::ManagedObjectRef> findByName(common::PolicyKind kind,
                                                             const std::string& sName) = 0;

  /// Create an unlinked fine-grained password policy.
  virtual common::ManagedObjectRef createPasswordPolicy(
      const std::string& sName, const common::PasswordPolicySettings& ppsSettings) = 0;

  /// Create a group policy object and link it in one step.
  virtual common::ManagedObjectRef createAndLink(common::PolicyKind kind,
                                                 const std::string& sName,
                                                 common::LinkTarget target) = 0;

  /// Link an existing object. No-op when already linked.
  virtual void link(const common::ManagedObjectRef& morObject, common::LinkTarget target) = 0;
  virtual bool isLinked(const common::ManagedObjectRef& morObject, common::LinkTarget target) = 0;

  virtual std::optional<std::string> getValue(const common::ManagedObjectRef& morObject,
                                              const std::string& sKey) = 0;

  /// Set a named value within the object. Returns false when it already held sValue.
  virtual bool setValue(const common::ManagedObjectRef& morObject, const std::string& sKey,
                        const std::string& sValue) = 0;

  /// Returns false when no object with that name exists.
  virtual bool deleteByName(common::PolicyKind kind, const std::string& sName) = 0;
};

}  // namespace privguard::directory
