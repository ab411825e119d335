#include "core/PrerequisiteChecker.hpp"

#include <filesystem>
#include <system_error>

#include "common/Config.hpp"
#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "directory/IDirectory.hpp"

namespace privguard::core {

namespace fs = std::filesystem;

PrerequisiteChecker::PrerequisiteChecker(directory::IDirectory& dirDirectory,
                                         const common::Config& cfgApp)
    : _dirDirectory(dirDirectory), _cfgApp(cfgApp) {}

PrerequisiteChecker::~PrerequisiteChecker() = default;

void PrerequisiteChecker::check(common::Mode mode) {
  auto spLog = common::Logger::get();

  checkConnectivity();
  checkPrivilege();

  switch (mode) {
    case common::Mode::Evaluate:
      checkRsopSource();
      break;
    case common::Mode::Remediate:
    case common::Mode::Forced:
      checkRsopSource();
      checkSysvol();
      checkStateDir();
      break;
    case common::Mode::Undo:
      checkSysvol();
      checkStateDir();
      break;
    case common::Mode::Help:
      break;
  }

  spLog->info("Prerequisites satisfied for '{}'", common::toString(mode));
}

void PrerequisiteChecker::checkConnectivity() {
  try {
    _dirDirectory.ping();
  } catch (const std::exception& ex) {
    throw common::PrerequisiteError(
        "directory_unreachable",
        "Cannot reach the directory at " + _cfgApp.sLdapUri + ": " + ex.what());
  }
}

void PrerequisiteChecker::checkPrivilege() {
  bool bPrivileged = false;
  try {
    bPrivileged = _dirDirectory.isBindIdentityPrivileged();
  } catch (const std::exception& ex) {
    throw common::PrerequisiteError(
        "privilege_check_failed",
        "Cannot determine group membership of " + _cfgApp.sBindDn + ": " + ex.what());
  }
  if (!bPrivileged) {
    throw common::PrerequisiteError(
        "insufficient_privilege",
        _cfgApp.sBindDn + " is not a member of '" + _cfgApp.sPrivilegedGroup + "' or '" +
            _cfgApp.sEnterpriseGroup + "'");
  }
}

void PrerequisiteChecker::checkRsopSource() {
  if (!_cfgApp.sRsopExportCommand.empty()) return;

  std::error_code ec;
  if (!fs::is_regular_file(_cfgApp.sRsopPath, ec)) {
    throw common::PrerequisiteError(
        "rsop_unavailable",
        "PRIVGUARD_RSOP_EXPORT_CMD is not set and no resultant-policy document exists at " +
            _cfgApp.sRsopPath);
  }
}

void PrerequisiteChecker::checkSysvol() {
  std::error_code ec;
  if (!fs::is_directory(fs::path(_cfgApp.sSysvolPath) / "Policies", ec)) {
    throw common::PrerequisiteError(
        "sysvol_unavailable",
        "Not running with the domain controller role: no Policies folder under SYSVOL mount " +
            _cfgApp.sSysvolPath);
  }
}

void PrerequisiteChecker::checkStateDir() {
  std::error_code ec;
  fs::create_directories(_cfgApp.sStateDir, ec);
  if (ec) {
    throw common::PrerequisiteError(
        "state_dir_unwritable",
        "Cannot create state directory " + _cfgApp.sStateDir + ": " + ec.message());
  }
}

}  // namespace privguard::core
