#pragma once

#include <set>
#include <string>
#include <vector>

namespace privguard::common {

/// Lowercased host name with the domain suffix stripped ("DC01.corp.local" → "dc01").
std::string shortHostName(const std::string& sHostName);

/// Set of short host names, for case-insensitive set comparison.
std::set<std::string> shortHostSet(const std::vector<std::string>& vHostNames);

/// Split a comma-separated list, trimming blanks and dropping empty items.
std::vector<std::string> splitList(const std::string& sValue);

}  // namespace privguard::common
