#include "directory/RsopDocument.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>

namespace privguard::directory {

namespace {

constexpr const char* kNullSessionKeySuffix = "\\restrictnullsessaccess";
constexpr const char* kAnonymousNameLookup = "LSAAnonymousNameLookup";

/// Integers that do not fit an int are treated as absent.
std::optional<int> toInt(const nlohmann::json& jValue) {
  if (jValue.is_number_unsigned()) {
    const auto uValue = jValue.get<uint64_t>();
    if (uValue > static_cast<uint64_t>(std::numeric_limits<int>::max())) return std::nullopt;
    return static_cast<int>(uValue);
  }
  if (!jValue.is_number_integer()) return std::nullopt;
  const auto iValue = jValue.get<int64_t>();
  if (iValue < std::numeric_limits<int>::min() || iValue > std::numeric_limits<int>::max()) {
    return std::nullopt;
  }
  return static_cast<int>(iValue);
}

std::optional<int> readInt(const nlohmann::json& jSection, const char* pKey) {
  if (!jSection.is_object()) return std::nullopt;
  auto it = jSection.find(pKey);
  if (it == jSection.end()) return std::nullopt;
  return toInt(*it);
}

std::optional<bool> readFlag(const nlohmann::json& jSection, const char* pKey) {
  if (!jSection.is_object()) return std::nullopt;
  auto it = jSection.find(pKey);
  if (it == jSection.end()) return std::nullopt;
  if (it->is_boolean()) return it->get<bool>();
  const auto oValue = toInt(*it);
  if (oValue == 0 || oValue == 1) return oValue == 1;
  return std::nullopt;
}

bool endsWithNoCase(std::string sValue, const std::string& sSuffix) {
  std::transform(sValue.begin(), sValue.end(), sValue.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return sValue.size() >= sSuffix.size() &&
         sValue.compare(sValue.size() - sSuffix.size(), sSuffix.size(), sSuffix) == 0;
}

std::optional<bool> readNullSessions(const nlohmann::json& jDocument) {
  auto it = jDocument.find("securityOptions");
  if (it == jDocument.end() || !it->is_array()) return std::nullopt;

  for (const auto& jOption : *it) {
    if (!jOption.is_object()) continue;
    auto itKey = jOption.find("keyName");
    if (itKey == jOption.end() || !itKey->is_string()) continue;
    if (!endsWithNoCase(itKey->get<std::string>(), kNullSessionKeySuffix)) continue;

    auto itValue = jOption.find("value");
    if (itValue == jOption.end()) return std::nullopt;
    const auto oValue = toInt(*itValue);
    if (!oValue.has_value()) return std::nullopt;
    return *oValue == 1;
  }
  return std::nullopt;
}

}  // namespace

common::PolicyFields RsopDocument::parse(const nlohmann::json& jDocument) {
  common::PolicyFields pf;
  if (!jDocument.is_object()) {
    return pf;
  }

  const auto& jAccount = jDocument.contains("accountPolicies")
                             ? jDocument.at("accountPolicies")
                             : nlohmann::json::object();
  pf.oMinPasswordAge = readInt(jAccount, "MinimumPasswordAge");
  pf.oLockoutThreshold = readInt(jAccount, "LockoutBadCount");
  pf.oMinPasswordLength = readInt(jAccount, "MinimumPasswordLength");
  pf.oComplexityEnabled = readFlag(jAccount, "PasswordComplexity");
  pf.oPasswordHistorySize = readInt(jAccount, "PasswordHistorySize");

  pf.oNullSessionsRestricted = readNullSessions(jDocument);

  // LSAAnonymousNameLookup = 0 means anonymous SID/name translation is disabled
  const auto& jSystem = jDocument.contains("systemAccess")
                            ? jDocument.at("systemAccess")
                            : nlohmann::json::object();
  auto oLookup = readFlag(jSystem, kAnonymousNameLookup);
  if (oLookup.has_value()) {
    pf.oAnonymousSidTranslationRestricted = !*oLookup;
  }

  return pf;
}

}  // namespace privguard::directory
