#include "common/Config.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

#include <spdlog/common.h>

namespace privguard::common {

std::string Config::getEnv(const char* pVarName) {
  const char* pValue = std::getenv(pVarName);
  return pValue ? std::string(pValue) : std::string{};
}

std::string Config::getEnvOr(const char* pVarName, const std::string& sDefault) {
  std::string sValue = getEnv(pVarName);
  return sValue.empty() ? sDefault : sValue;
}

bool Config::getEnvBool(const char* pVarName, bool bDefault) {
  const std::string sValue = getEnv(pVarName);
  if (sValue.empty()) {
    return bDefault;
  }
  return sValue == "true" || sValue == "1" || sValue == "yes";
}

std::string Config::loadSecret(const char* pVarName) {
  // Try the direct env var first
  std::string sValue = getEnv(pVarName);
  if (!sValue.empty()) {
    return sValue;
  }

  // Try _FILE fallback
  const std::string sFileVar = std::string(pVarName) + "_FILE";
  const std::string sFilePath = getEnv(sFileVar.c_str());
  if (sFilePath.empty()) {
    throw std::runtime_error(
        std::string("Required secret not set: neither ") + pVarName + " nor " + sFileVar +
        " is defined");
  }

  std::ifstream ifs(sFilePath);
  if (!ifs.is_open()) {
    throw std::runtime_error(
        std::string("Cannot open secret file specified by ") + sFileVar + ": " + sFilePath);
  }

  std::ostringstream oss;
  oss << ifs.rdbuf();
  sValue = oss.str();

  while (!sValue.empty() &&
         (sValue.back() == '\n' || sValue.back() == '\r' || sValue.back() == ' ')) {
    sValue.pop_back();
  }

  if (sValue.empty()) {
    throw std::runtime_error(
        std::string("Secret file is empty: ") + sFilePath + " (from " + sFileVar + ")");
  }

  return sValue;
}

Config Config::load() {
  Config cfg;

  // ── Required vars ──────────────────────────────────────────────────────
  cfg.sLdapUri = getEnv("PRIVGUARD_LDAP_URI");
  if (cfg.sLdapUri.empty()) {
    throw std::runtime_error("Required environment variable PRIVGUARD_LDAP_URI is not set");
  }
  cfg.sBindDn = getEnv("PRIVGUARD_BIND_DN");
  if (cfg.sBindDn.empty()) {
    throw std::runtime_error("Required environment variable PRIVGUARD_BIND_DN is not set");
  }
  cfg.sBindPassword = loadSecret("PRIVGUARD_BIND_PASSWORD");

  // ── Optional vars with defaults ────────────────────────────────────────
  const std::string sBaseDn = getEnv("PRIVGUARD_BASE_DN");
  if (!sBaseDn.empty()) {
    cfg.oBaseDn = sBaseDn;
  }

  cfg.sPrivilegedGroup = getEnvOr("PRIVGUARD_PRIVILEGED_GROUP", cfg.sPrivilegedGroup);
  cfg.sEnterpriseGroup = getEnvOr("PRIVGUARD_ENTERPRISE_GROUP", cfg.sEnterpriseGroup);
  cfg.sAdminGroup = getEnvOr("PRIVGUARD_ADMIN_GROUP", cfg.sAdminGroup);

  cfg.sSysvolPath = getEnvOr("PRIVGUARD_SYSVOL_PATH", cfg.sSysvolPath);
  cfg.sRsopExportCommand = getEnv("PRIVGUARD_RSOP_EXPORT_CMD");
  cfg.sRsopPath = getEnvOr("PRIVGUARD_RSOP_PATH", cfg.sRsopPath);
  cfg.sStateDir = getEnvOr("PRIVGUARD_STATE_DIR", cfg.sStateDir);

  cfg.sLogLevel = getEnvOr("PRIVGUARD_LOG_LEVEL", cfg.sLogLevel);
  cfg.sLogFile = getEnvOr("PRIVGUARD_LOG_FILE", cfg.sLogFile);

  cfg.bAssumeYes = getEnvBool("PRIVGUARD_ASSUME_YES", false);

  // ── Validation ─────────────────────────────────────────────────────────

  if (cfg.sLdapUri.rfind("ldap://", 0) != 0 && cfg.sLdapUri.rfind("ldaps://", 0) != 0) {
    throw std::runtime_error(
        "PRIVGUARD_LDAP_URI must start with ldap:// or ldaps:// (got " + cfg.sLdapUri + ")");
  }

  // spdlog maps unknown names to "off"; reject them instead of silencing the run
  if (spdlog::level::from_str(cfg.sLogLevel) == spdlog::level::off && cfg.sLogLevel != "off") {
    throw std::runtime_error("Invalid PRIVGUARD_LOG_LEVEL: " + cfg.sLogLevel);
  }

  if (cfg.sPrivilegedGroup == cfg.sEnterpriseGroup) {
    throw std::runtime_error(
        "PRIVGUARD_PRIVILEGED_GROUP and PRIVGUARD_ENTERPRISE_GROUP must differ");
  }

  return cfg;
}

}  // namespace privguard::common
