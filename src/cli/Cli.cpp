#include "cli/Cli.hpp"

#include <map>

namespace privguard::cli {

namespace {

std::string stripDashes(const std::string& sArg) {
  const auto nFirst = sArg.find_first_not_of('-');
  if (nFirst == std::string::npos || nFirst > 2) return sArg;
  return sArg.substr(nFirst);
}

}  // namespace

CliOptions parseArguments(const std::vector<std::string>& vArgs) {
  static const std::map<std::string, common::Mode> mModes = {
      {"evaluate", common::Mode::Evaluate},  {"remediate", common::Mode::Remediate},
      {"deathblossom", common::Mode::Forced}, {"undo", common::Mode::Undo},
      {"help", common::Mode::Help},          {"h", common::Mode::Help},
  };

  CliOptions co;
  std::optional<common::Mode> oMode;
  for (const auto& sArg : vArgs) {
    const std::string sName = stripDashes(sArg);
    if (sName == "yes" || sName == "y") {
      co.bAssumeYes = true;
      continue;
    }

    auto it = mModes.find(sName);
    if (it == mModes.end()) {
      co.oError = "Unknown argument: " + sArg;
      co.mode = common::Mode::Help;
      return co;
    }
    if (oMode.has_value()) {
      co.oError = "Only one mode may be given per invocation";
      co.mode = common::Mode::Help;
      return co;
    }
    oMode = it->second;
  }

  co.mode = oMode.value_or(common::Mode::Help);
  return co;
}

std::string usage() {
  return "Audits and hardens privileged-account policy and domain controller exposure.\n"
         "\n"
         "Usage: privguard <MODE> [--yes]\n"
         "\n"
         "Modes:\n"
         "  evaluate      Report findings for the current domain; changes nothing\n"
         "  remediate     Offer each remediation and apply the ones you confirm\n"
         "  deathblossom  Confirm once, then apply every remediation without prompting\n"
         "  undo          Remove the policy objects privguard created and restore\n"
         "                captured logon restrictions\n"
         "  help          Print this help\n"
         "\n"
         "Options:\n"
         "      --yes     Answer every confirmation with Yes (unattended deathblossom)\n"
         "\n"
         "Environment:\n"
         "  PRIVGUARD_LDAP_URI, PRIVGUARD_BIND_DN, PRIVGUARD_BIND_PASSWORD[_FILE] (required)\n"
         "  PRIVGUARD_BASE_DN, PRIVGUARD_SYSVOL_PATH, PRIVGUARD_RSOP_EXPORT_CMD,\n"
         "  PRIVGUARD_RSOP_PATH, PRIVGUARD_STATE_DIR, PRIVGUARD_PRIVILEGED_GROUP,\n"
         "  PRIVGUARD_ENTERPRISE_GROUP, PRIVGUARD_ADMIN_GROUP, PRIVGUARD_LOG_LEVEL,\n"
         "  PRIVGUARD_LOG_FILE, PRIVGUARD_ASSUME_YES\n";
}

}  // namespace privguard::cli
