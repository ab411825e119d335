#include "directory/RsopExportSource.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace privguard::directory {

namespace {

constexpr const char* kPlaceholder = "{out}";

std::string shellQuote(const std::string& sValue) {
  std::string sQuoted = "'";
  for (char c : sValue) {
    if (c == '\'') {
      sQuoted += "'\\''";
    } else {
      sQuoted += c;
    }
  }
  sQuoted += "'";
  return sQuoted;
}

}  // namespace

RsopExportSource::RsopExportSource(std::string sExportCommand, std::string sOutputPath)
    : _sExportCommand(std::move(sExportCommand)), _sOutputPath(std::move(sOutputPath)) {}

RsopExportSource::~RsopExportSource() = default;

std::string RsopExportSource::buildCommand(const std::string& sTemplate,
                                           const std::string& sOutputPath) {
  const std::string sQuoted = shellQuote(sOutputPath);
  std::string sCommand = sTemplate;
  const auto nPos = sCommand.find(kPlaceholder);
  if (nPos == std::string::npos) {
    return sCommand + " " + sQuoted;
  }
  sCommand.replace(nPos, std::char_traits<char>::length(kPlaceholder), sQuoted);
  return sCommand;
}

nlohmann::json RsopExportSource::exportDocument() {
  auto spLog = common::Logger::get();

  if (!_sExportCommand.empty()) {
    std::error_code ec;
    std::filesystem::remove(_sOutputPath, ec);  // never parse a stale export

    const std::string sCommand = buildCommand(_sExportCommand, _sOutputPath);
    spLog->debug("Exporting resultant policy: {}", sCommand);
    const int iStatus = std::system(sCommand.c_str());
    if (iStatus != 0) {
      throw common::CollectionError(
          "rsop_export_failed",
          "Resultant-policy export command failed with status " + std::to_string(iStatus));
    }
  }

  std::ifstream ifs(_sOutputPath);
  if (!ifs.is_open()) {
    throw common::CollectionError("rsop_missing",
                                  "Resultant-policy document not found at " + _sOutputPath);
  }

  try {
    return nlohmann::json::parse(ifs);
  } catch (const nlohmann::json::parse_error& ex) {
    throw common::CollectionError(
        "rsop_unparseable",
        "Resultant-policy document " + _sOutputPath + " is not valid JSON: " + ex.what());
  }
}

}  // namespace privguard::directory
