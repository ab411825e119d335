#pragma once

#include <string>

namespace privguard::security {

/// OpenSSL-backed helpers for digests, random identifiers and secret wiping.
/// Class abbreviation: N/A (static interface)
class Digest {
 public:
  /// SHA-256 hash → 64-char lowercase hex string.
  /// Used to fingerprint the exported resultant-policy document in the log.
  static std::string sha256Hex(const std::string& sInput);

  /// Random RFC 4122 version-4 GUID in registry form:
  /// "{XXXXXXXX-XXXX-4XXX-YXXX-XXXXXXXXXXXX}" (uppercase, braces included).
  static std::string randomGuid();

  /// Overwrite the string's bytes with zeros and clear it.
  static void wipe(std::string& sSecret);
};

}  // namespace privguard::security
