#include "dal/LogonTargetLedger.hpp"

#include "common/Logger.hpp"

#include <fstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

namespace privguard::dal {

LogonTargetLedger::LogonTargetLedger(std::filesystem::path pathStateDir)
    : _pathFile(std::move(pathStateDir) / "logon-targets.json") {}

LogonTargetLedger::~LogonTargetLedger() = default;

bool LogonTargetLedger::exists() const {
  return std::filesystem::exists(_pathFile);
}

std::map<std::string, std::vector<std::string>> LogonTargetLedger::load() const {
  std::map<std::string, std::vector<std::string>> mAccounts;
  std::ifstream ifs(_pathFile);
  if (!ifs.is_open()) {
    return mAccounts;
  }

  nlohmann::json jLedger;
  try {
    jLedger = nlohmann::json::parse(ifs);
  } catch (const nlohmann::json::parse_error& ex) {
    throw std::runtime_error("Logon target ledger " + _pathFile.string() +
                             " is corrupt: " + ex.what());
  }

  if (!jLedger.contains("accounts") || !jLedger["accounts"].is_object()) {
    throw std::runtime_error("Logon target ledger " + _pathFile.string() +
                             " has no accounts object");
  }
  for (const auto& [sAccount, jTargets] : jLedger["accounts"].items()) {
    mAccounts[sAccount] = jTargets.get<std::vector<std::string>>();
  }
  return mAccounts;
}

void LogonTargetLedger::capture(const std::string& sAccountName,
                                const std::vector<std::string>& vTargets) {
  auto mAccounts = load();
  if (mAccounts.count(sAccountName) > 0) {
    return;
  }
  mAccounts[sAccountName] = vTargets;
  save(mAccounts);
  common::Logger::get()->debug("Captured prior logon targets of {} ({} hosts)", sAccountName,
                               vTargets.size());
}

void LogonTargetLedger::save(
    const std::map<std::string, std::vector<std::string>>& mAccounts) const {
  std::filesystem::create_directories(_pathFile.parent_path());

  nlohmann::json jLedger;
  jLedger["accounts"] = mAccounts;

  // Write-then-rename so a crash never leaves a truncated ledger
  const auto pathTmp = std::filesystem::path(_pathFile.string() + ".tmp");
  {
    std::ofstream ofs(pathTmp, std::ios::trunc);
    if (!ofs.is_open()) {
      throw std::runtime_error("Cannot write logon target ledger " + pathTmp.string());
    }
    ofs << jLedger.dump(2) << "\n";
  }
  std::filesystem::rename(pathTmp, _pathFile);
}

void LogonTargetLedger::clear() {
  std::error_code ec;
  std::filesystem::remove(_pathFile, ec);
  if (ec) {
    throw std::runtime_error("Cannot remove logon target ledger " + _pathFile.string() + ": " +
                             ec.message());
  }
}

}  // namespace privguard::dal
