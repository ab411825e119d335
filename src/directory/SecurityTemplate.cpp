#include "directory/SecurityTemplate.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <sstream>

namespace privguard::directory {

namespace {

bool equalsNoCase(const std::string& sA, const std::string& sB) {
  return sA.size() == sB.size() &&
         std::equal(sA.begin(), sA.end(), sB.begin(), [](unsigned char a, unsigned char b) {
           return std::tolower(a) == std::tolower(b);
         });
}

std::string trim(const std::string& sValue) {
  const auto nFirst = sValue.find_first_not_of(" \t\r");
  if (nFirst == std::string::npos) return {};
  const auto nLast = sValue.find_last_not_of(" \t\r");
  return sValue.substr(nFirst, nLast - nFirst + 1);
}

constexpr char32_t kReplacement = 0xFFFD;

void appendUtf8(std::string& sOut, char32_t cp) {
  if (cp < 0x80) {
    sOut += static_cast<char>(cp);
  } else if (cp < 0x800) {
    sOut += static_cast<char>(0xC0 | (cp >> 6));
    sOut += static_cast<char>(0x80 | (cp & 0x3F));
  } else if (cp < 0x10000) {
    sOut += static_cast<char>(0xE0 | (cp >> 12));
    sOut += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    sOut += static_cast<char>(0x80 | (cp & 0x3F));
  } else {
    sOut += static_cast<char>(0xF0 | (cp >> 18));
    sOut += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
    sOut += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    sOut += static_cast<char>(0x80 | (cp & 0x3F));
  }
}

void appendUtf16Le(std::string& sOut, char32_t cp) {
  auto appendUnit = [&sOut](char32_t u) {
    sOut += static_cast<char>(u & 0xFF);
    sOut += static_cast<char>((u >> 8) & 0xFF);
  };
  if (cp < 0x10000) {
    appendUnit(cp);
  } else {
    cp -= 0x10000;
    appendUnit(0xD800 + (cp >> 10));
    appendUnit(0xDC00 + (cp & 0x3FF));
  }
}

/// Next code point of a UTF-8 string; malformed sequences yield U+FFFD and skip one byte.
char32_t nextUtf8(const std::string& sText, size_t& nPos) {
  const auto c0 = static_cast<unsigned char>(sText[nPos]);
  size_t nExtra = 0;
  char32_t cp = 0;
  char32_t cpMin = 0;
  if (c0 < 0x80) {
    ++nPos;
    return c0;
  } else if ((c0 & 0xE0) == 0xC0) {
    nExtra = 1;
    cp = c0 & 0x1F;
    cpMin = 0x80;
  } else if ((c0 & 0xF0) == 0xE0) {
    nExtra = 2;
    cp = c0 & 0x0F;
    cpMin = 0x800;
  } else if ((c0 & 0xF8) == 0xF0) {
    nExtra = 3;
    cp = c0 & 0x07;
    cpMin = 0x10000;
  } else {
    ++nPos;
    return kReplacement;
  }
  if (nPos + nExtra >= sText.size()) {
    ++nPos;
    return kReplacement;
  }
  for (size_t i = 1; i <= nExtra; ++i) {
    const auto c = static_cast<unsigned char>(sText[nPos + i]);
    if ((c & 0xC0) != 0x80) {
      ++nPos;
      return kReplacement;
    }
    cp = (cp << 6) | (c & 0x3F);
  }
  if (cp < cpMin || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
    ++nPos;
    return kReplacement;
  }
  nPos += nExtra + 1;
  return cp;
}

}  // namespace

SecurityTemplate SecurityTemplate::empty() {
  SecurityTemplate st;
  st.set("Unicode", "Unicode", "yes");
  st.set("Version", "signature", "\"$CHICAGO$\"");
  st.set("Version", "Revision", "1");
  return st;
}

SecurityTemplate SecurityTemplate::parse(const std::string& sText) {
  SecurityTemplate st;
  Section* pCurrent = nullptr;

  std::istringstream iss(sText);
  std::string sLine;
  while (std::getline(iss, sLine)) {
    sLine = trim(sLine);
    if (sLine.empty() || sLine.front() == ';') continue;

    if (sLine.front() == '[' && sLine.back() == ']') {
      st._vSections.push_back(Section{trim(sLine.substr(1, sLine.size() - 2)), {}});
      pCurrent = &st._vSections.back();
      continue;
    }

    if (!pCurrent) continue;
    const auto nEq = sLine.find('=');
    if (nEq == std::string::npos) continue;
    pCurrent->vEntries.emplace_back(trim(sLine.substr(0, nEq)), trim(sLine.substr(nEq + 1)));
  }
  return st;
}

SecurityTemplate SecurityTemplate::fromFileBytes(const std::string& sBytes) {
  const bool bUtf16 = sBytes.size() >= 2 && static_cast<unsigned char>(sBytes[0]) == 0xFF &&
                      static_cast<unsigned char>(sBytes[1]) == 0xFE;
  if (!bUtf16) {
    return parse(sBytes);
  }

  // Held as UTF-8 in memory so hand-edited non-ASCII entries survive a rewrite
  std::string sText;
  sText.reserve(sBytes.size() / 2);
  size_t i = 2;
  auto unitAt = [&sBytes](size_t n) {
    return static_cast<char32_t>(static_cast<unsigned char>(sBytes[n]) |
                                 (static_cast<unsigned char>(sBytes[n + 1]) << 8));
  };
  while (i + 1 < sBytes.size()) {
    char32_t cp = unitAt(i);
    i += 2;
    if (cp >= 0xD800 && cp <= 0xDBFF) {
      if (i + 1 < sBytes.size() && unitAt(i) >= 0xDC00 && unitAt(i) <= 0xDFFF) {
        cp = 0x10000 + ((cp - 0xD800) << 10) + (unitAt(i) - 0xDC00);
        i += 2;
      } else {
        cp = kReplacement;
      }
    } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
      cp = kReplacement;
    }
    appendUtf8(sText, cp);
  }
  return parse(sText);
}

std::optional<std::string> SecurityTemplate::get(const std::string& sSection,
                                                 const std::string& sKey) const {
  for (const auto& section : _vSections) {
    if (!equalsNoCase(section.sName, sSection)) continue;
    for (const auto& [sEntryKey, sEntryValue] : section.vEntries) {
      if (equalsNoCase(sEntryKey, sKey)) return sEntryValue;
    }
  }
  return std::nullopt;
}

bool SecurityTemplate::set(const std::string& sSection, const std::string& sKey,
                           const std::string& sValue) {
  auto itSection = std::find_if(_vSections.begin(), _vSections.end(), [&](const Section& s) {
    return equalsNoCase(s.sName, sSection);
  });
  if (itSection == _vSections.end()) {
    _vSections.push_back(Section{sSection, {}});
    itSection = std::prev(_vSections.end());
  }

  for (auto& [sEntryKey, sEntryValue] : itSection->vEntries) {
    if (equalsNoCase(sEntryKey, sKey)) {
      if (sEntryValue == sValue) return false;
      sEntryValue = sValue;
      return true;
    }
  }
  itSection->vEntries.emplace_back(sKey, sValue);
  return true;
}

std::string SecurityTemplate::serialize() const {
  std::string sText;
  for (const auto& section : _vSections) {
    sText += "[" + section.sName + "]\r\n";
    for (const auto& [sKey, sValue] : section.vEntries) {
      sText += sKey + "=" + sValue + "\r\n";
    }
  }
  return sText;
}

std::string SecurityTemplate::toFileBytes() const {
  const std::string sText = serialize();
  std::string sBytes;
  sBytes.reserve(2 + sText.size() * 2);
  sBytes += static_cast<char>(0xFF);
  sBytes += static_cast<char>(0xFE);
  size_t nPos = 0;
  while (nPos < sText.size()) {
    appendUtf16Le(sBytes, nextUtf8(sText, nPos));
  }
  return sBytes;
}

}  // namespace privguard::directory
