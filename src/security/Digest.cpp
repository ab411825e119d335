#include "security/Digest.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include <array>
#include <cstddef>
#include <stdexcept>

namespace privguard::security {

namespace {
constexpr int kGuidBytes = 16;

std::string toHex(const unsigned char* pBytes, size_t nLen, bool bUpper) {
  static constexpr char kLower[] = "0123456789abcdef";
  static constexpr char kUpper[] = "0123456789ABCDEF";
  const char* pDigits = bUpper ? kUpper : kLower;
  std::string sHex;
  sHex.reserve(nLen * 2);
  for (size_t i = 0; i < nLen; ++i) {
    sHex += pDigits[pBytes[i] >> 4];
    sHex += pDigits[pBytes[i] & 0x0F];
  }
  return sHex;
}

}  // namespace

std::string Digest::sha256Hex(const std::string& sInput) {
  std::array<unsigned char, EVP_MAX_MD_SIZE> aHash{};
  unsigned int uHashLen = 0;
  if (EVP_Digest(sInput.data(), sInput.size(), aHash.data(), &uHashLen, EVP_sha256(),
                 nullptr) != 1) {
    throw std::runtime_error("SHA-256 digest failed");
  }
  return toHex(aHash.data(), uHashLen, false);
}

std::string Digest::randomGuid() {
  unsigned char vBytes[kGuidBytes];
  if (RAND_bytes(vBytes, kGuidBytes) != 1) {
    throw std::runtime_error("Failed to generate random bytes for GUID");
  }

  // Version 4, variant 10xx
  vBytes[6] = static_cast<unsigned char>((vBytes[6] & 0x0F) | 0x40);
  vBytes[8] = static_cast<unsigned char>((vBytes[8] & 0x3F) | 0x80);

  // {XXXXXXXX-XXXX-XXXX-XXXX-XXXXXXXXXXXX}
  return "{" + toHex(vBytes, 4, true) + "-" + toHex(vBytes + 4, 2, true) + "-" +
         toHex(vBytes + 6, 2, true) + "-" + toHex(vBytes + 8, 2, true) + "-" +
         toHex(vBytes + 10, 6, true) + "}";
}

void Digest::wipe(std::string& sSecret) {
  if (!sSecret.empty()) {
    OPENSSL_cleanse(sSecret.data(), sSecret.size());
  }
  sSecret.clear();
}

}  // namespace privguard::security
