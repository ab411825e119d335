#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace privguard::dal {

/// Prior userWorkstations values captured before the logon restriction
/// overwrites them, persisted as JSON so undo can restore them.
/// Class abbreviation: ltl
class LogonTargetLedger {
 public:
  explicit LogonTargetLedger(std::filesystem::path pathStateDir);
  ~LogonTargetLedger();

  /// Record sAccountName's current targets unless a value is already recorded.
  /// The first capture wins so repeated runs keep the pre-hardening value.
  void capture(const std::string& sAccountName, const std::vector<std::string>& vTargets);

  /// All captured accounts; empty when nothing has been recorded.
  std::map<std::string, std::vector<std::string>> load() const;

  bool exists() const;

  /// Remove the ledger file. No-op when absent.
  void clear();

  const std::filesystem::path& path() const { return _pathFile; }

 private:
  void save(const std::map<std::string, std::vector<std::string>>& mAccounts) const;

  std::filesystem::path _pathFile;
};

}  // namespace privguard::dal
