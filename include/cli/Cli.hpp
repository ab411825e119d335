#pragma once

#include <optional>
#include <string>
#include <vector>

#include "common/Types.hpp"

namespace privguard::cli {

/// Parsed command line.
/// Class abbreviation: co
struct CliOptions {
  common::Mode mode = common::Mode::Help;
  bool bAssumeYes = false;              // --yes
  std::optional<std::string> oError;    // set when the arguments were rejected
};

/// Exactly one mode per invocation; none means help.
/// Modes are accepted bare or with a leading "-" / "--".
CliOptions parseArguments(const std::vector<std::string>& vArgs);

std::string usage();

}  // namespace privguard::cli
