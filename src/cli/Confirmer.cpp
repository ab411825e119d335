#include "cli/Confirmer.hpp"

#include <algorithm>
#include <cctype>
#include <istream>
#include <ostream>

namespace privguard::cli {

ConsoleConfirmer::ConsoleConfirmer(std::istream& isIn, std::ostream& osOut)
    : _isIn(isIn), _osOut(osOut) {}

ConsoleConfirmer::~ConsoleConfirmer() = default;

Answer ConsoleConfirmer::ask(const std::string& sTitle, const std::string& sHelp) {
  while (true) {
    _osOut << "\n" << sTitle << "\n[Y] Yes  [N] No  [?] Help (default is \"N\"): " << std::flush;

    std::string sLine;
    if (!std::getline(_isIn, sLine)) {
      _osOut << "\n";
      return Answer::No;
    }
    std::transform(sLine.begin(), sLine.end(), sLine.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (sLine == "y" || sLine == "yes") return Answer::Yes;
    if (sLine.empty() || sLine == "n" || sLine == "no") return Answer::No;
    if (sLine == "?") {
      _osOut << sHelp << "\n";
    }
  }
}

Answer AlwaysYesConfirmer::ask(const std::string& /*sTitle*/, const std::string& /*sHelp*/) {
  return Answer::Yes;
}

ScriptedConfirmer::ScriptedConfirmer(std::vector<Answer> vAnswers)
    : _dqAnswers(vAnswers.begin(), vAnswers.end()) {}

ScriptedConfirmer::~ScriptedConfirmer() = default;

Answer ScriptedConfirmer::ask(const std::string& sTitle, const std::string& /*sHelp*/) {
  _vAskedTitles.push_back(sTitle);
  if (_dqAnswers.empty()) return Answer::No;
  Answer answer = _dqAnswers.front();
  _dqAnswers.pop_front();
  return answer;
}

}  // namespace privguard::cli
