#include "common/HostNames.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace privguard::common {

std::string shortHostName(const std::string& sHostName) {
  std::string sShort = sHostName.substr(0, sHostName.find('.'));
  std::transform(sShort.begin(), sShort.end(), sShort.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return sShort;
}

std::set<std::string> shortHostSet(const std::vector<std::string>& vHostNames) {
  std::set<std::string> setHosts;
  for (const auto& sHost : vHostNames) {
    std::string sShort = shortHostName(sHost);
    if (!sShort.empty()) {
      setHosts.insert(std::move(sShort));
    }
  }
  return setHosts;
}

std::vector<std::string> splitList(const std::string& sValue) {
  std::vector<std::string> vItems;
  std::istringstream iss(sValue);
  std::string sItem;
  while (std::getline(iss, sItem, ',')) {
    const auto nFirst = sItem.find_first_not_of(" \t");
    if (nFirst == std::string::npos) continue;
    const auto nLast = sItem.find_last_not_of(" \t");
    vItems.push_back(sItem.substr(nFirst, nLast - nFirst + 1));
  }
  return vItems;
}

}  // namespace privguard::common
