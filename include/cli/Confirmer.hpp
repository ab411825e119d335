#pragma once

#include <deque>
#include <iosfwd>
#include <string>
#include <vector>

namespace privguard::cli {

enum class Answer { Yes, No };

/// Yes/no confirmation capability injected into the controllers.
class IConfirmer {
 public:
  virtual ~IConfirmer() = default;

  virtual Answer ask(const std::string& sTitle, const std::string& sHelp) = 0;
};

/// Interactive prompt. "?" prints the help text and asks again;
/// end of input counts as No.
/// Class abbreviation: cc
class ConsoleConfirmer : public IConfirmer {
 public:
  ConsoleConfirmer(std::istream& isIn, std::ostream& osOut);
  ~ConsoleConfirmer() override;

  Answer ask(const std::string& sTitle, const std::string& sHelp) override;

 private:
  std::istream& _isIn;
  std::ostream& _osOut;
};

/// Unattended runs: every question is answered Yes.
class AlwaysYesConfirmer : public IConfirmer {
 public:
  Answer ask(const std::string& sTitle, const std::string& sHelp) override;
};

/// Replays a fixed list of answers; once exhausted every answer is No.
/// Class abbreviation: sc
class ScriptedConfirmer : public IConfirmer {
 public:
  explicit ScriptedConfirmer(std::vector<Answer> vAnswers);
  ~ScriptedConfirmer() override;

  Answer ask(const std::string& sTitle, const std::string& sHelp) override;

  const std::vector<std::string>& askedTitles() const { return _vAskedTitles; }

 private:
  std::deque<Answer> _dqAnswers;
  std::vector<std::string> _vAskedTitles;
};

}  // namespace privguard::cli
