#pragma once

#include <optional>
#include <string>

namespace privguard::common {

/// Environment variable loader.
/// Loads all PRIVGUARD_* env vars into a typed struct with validation.
/// Class abbreviation: cfg
struct Config {
  // ── Directory ─────────────────────────────────────────────────────────
  std::string sLdapUri;
  std::string sBindDn;
  std::string sBindPassword;  // zeroed after handoff to LdapConnection
  std::optional<std::string> oBaseDn;  // nullopt = rootDSE defaultNamingContext

  // ── Group names ───────────────────────────────────────────────────────
  std::string sPrivilegedGroup = "Domain Admins";
  std::string sEnterpriseGroup = "Enterprise Admins";
  std::string sAdminGroup = "Administrators";

  // ── Policy storage ────────────────────────────────────────────────────
  std::string sSysvolPath = "/mnt/sysvol";
  std::string sRsopExportCommand;
  std::string sRsopPath = "/tmp/privguard-rsop.json";
  std::string sStateDir = "/var/lib/privguard";

  // ── Logging ───────────────────────────────────────────────────────────
  std::string sLogLevel = "info";
  std::string sLogFile = "privguard.log";

  // ── Prompting ─────────────────────────────────────────────────────────
  bool bAssumeYes = false;

  /// Load and validate all config from environment variables.
  /// Implements _FILE fallback for PRIVGUARD_BIND_PASSWORD.
  /// Throws on missing required vars or invalid constraints.
  static Config load();

 private:
  /// Read an env var with optional _FILE fallback for secrets.
  /// If varName is unset, tries varName + "_FILE" and reads file contents.
  /// Trims trailing whitespace/newlines from file contents.
  static std::string loadSecret(const char* pVarName);

  /// Read an env var, return empty string if unset.
  static std::string getEnv(const char* pVarName);

  /// Read an env var, return sDefault if unset or empty.
  static std::string getEnvOr(const char* pVarName, const std::string& sDefault);

  /// Read an env var as bool (true/false/1/0/yes), default bDefault.
  static bool getEnvBool(const char* pVarName, bool bDefault);
};

}  // namespace privguard::common
