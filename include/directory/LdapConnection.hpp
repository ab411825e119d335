#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

struct ldap;

namespace privguard::directory {

/// One directory entry returned by a search.
/// Attribute names are lowercased; binary values are kept as raw bytes.
/// Class abbreviation: le
struct LdapEntry {
  std::string sDn;
  std::map<std::string, std::vector<std::string>> mAttributes;

  /// All values of an attribute, empty when absent.
  const std::vector<std::string>& values(const std::string& sName) const;

  /// First value of an attribute, empty string when absent.
  std::string first(const std::string& sName) const;
};

enum class SearchScope { Base, OneLevel, Subtree };

enum class ModOp { Add, Replace, Delete };

/// Class abbreviation: lm
struct LdapModification {
  ModOp op;
  std::string sAttribute;
  std::vector<std::string> vValues;
};

/// RAII owner of a bound libldap session.
/// Every failing operation throws DirectoryError carrying the LDAP result code.
/// Class abbreviation: lc
class LdapConnection {
 public:
  /// Connect and simple-bind. The password copy is wiped once the bind completes.
  LdapConnection(const std::string& sUri, const std::string& sBindDn, std::string sPassword);
  ~LdapConnection();

  LdapConnection(const LdapConnection&) = delete;
  LdapConnection& operator=(const LdapConnection&) = delete;

  std::vector<LdapEntry> search(const std::string& sBase, SearchScope scope,
                                const std::string& sFilter,
                                const std::vector<std::string>& vAttributes);

  /// Base-scope read of a single entry. Returns nullopt if the DN does not exist.
  std::optional<LdapEntry> read(const std::string& sDn,
                                const std::vector<std::string>& vAttributes);

  void add(const std::string& sDn,
           const std::map<std::string, std::vector<std::string>>& mAttributes);
  void modify(const std::string& sDn, const std::vector<LdapModification>& vMods);

  /// Returns false when the entry does not exist.
  bool remove(const std::string& sDn);

  const std::string& bindDn() const { return _sBindDn; }

  /// Escape a value for inclusion in a search filter (RFC 4515).
  static std::string escapeFilterValue(const std::string& sValue);

 private:
  [[noreturn]] void fail(int iResultCode, const std::string& sOperation,
                         const std::string& sTarget) const;

  ::ldap* _pLdap = nullptr;
  std::string _sUri;
  std::string _sBindDn;
};

}  // namespace privguard::directory
