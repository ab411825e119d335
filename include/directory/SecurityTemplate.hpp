#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace privguard::directory {

/// In-memory form of a GptTmpl.inf security template.
/// Section and key lookups are case-insensitive; order is preserved on write.
/// Class abbreviation: st
class SecurityTemplate {
 public:
  static constexpr const char* kRegistryValues = "Registry Values";

  /// Empty template with the [Unicode] and [Version] headers Windows expects.
  static SecurityTemplate empty();

  /// Parse template text. Lines outside a section and comments (';') are ignored.
  static SecurityTemplate parse(const std::string& sText);

  /// Decode raw file bytes (UTF-16LE with BOM, or plain ASCII) and parse; text is held as UTF-8.
  static SecurityTemplate fromFileBytes(const std::string& sBytes);

  std::optional<std::string> get(const std::string& sSection, const std::string& sKey) const;

  /// Returns false when the key already held sValue.
  bool set(const std::string& sSection, const std::string& sKey, const std::string& sValue);

  /// CRLF-separated text.
  std::string serialize() const;

  /// UTF-16LE with BOM, as written to SYSVOL.
  std::string toFileBytes() const;

 private:
  struct Section {
    std::string sName;
    std::vector<std::pair<std::string, std::string>> vEntries;
  };

  std::vector<Section> _vSections;
};

}  // namespace privguard::directory
