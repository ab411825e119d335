#include "directory/LdapConnection.hpp"
#include "directory/LdapDirectory.hpp"
#include "directory/LdapPolicyObjectStore.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace privguard::directory;

TEST(LdapHelpersTest, EscapeFilterValueEscapesSpecials) {
  EXPECT_EQ(LdapConnection::escapeFilterValue("Domain Admins"), "Domain Admins");
  EXPECT_EQ(LdapConnection::escapeFilterValue("a*b(c)d\\e"), "a\\2ab\\28c\\29d\\5ce");
  EXPECT_EQ(LdapConnection::escapeFilterValue(std::string("x\0y", 3)), "x\\00y");
}

TEST(LdapHelpersTest, DnsDomainFromDn) {
  EXPECT_EQ(dnsDomainFromDn("DC=corp,DC=example,DC=com"), "corp.example.com");
  EXPECT_EQ(dnsDomainFromDn("OU=Domain Controllers, dc=corp, dc=local"), "corp.local");
  EXPECT_EQ(dnsDomainFromDn("CN=Users"), "");
}

TEST(LdapHelpersTest, RidFromSid) {
  // S-1-5-21-1-2-3-500
  const unsigned char vSid[] = {1, 5, 0, 0, 0, 0, 0, 5, 21, 0, 0, 0, 1, 0, 0, 0,
                                2, 0, 0, 0, 3, 0, 0, 0, 0xF4, 0x01, 0, 0};
  const std::string sSid(reinterpret_cast<const char*>(vSid), sizeof(vSid));
  EXPECT_EQ(ridFromSid(sSid), 500);

  // S-1-5-21-1-2-3-1104
  std::string sUser = sSid;
  sUser[24] = static_cast<char>(0x50);
  sUser[25] = static_cast<char>(0x04);
  EXPECT_EQ(ridFromSid(sUser), 1104);

  EXPECT_EQ(ridFromSid(""), -1);
  EXPECT_EQ(ridFromSid(sSid.substr(0, 20)), -1);
}

TEST(LdapHelpersTest, RemoveLinkSegmentDropsOnlyMatchingGpo) {
  const std::string sOurs = "CN={AAAA},CN=Policies,CN=System,DC=corp,DC=example,DC=com";
  const std::string sOther = "CN={BBBB},CN=Policies,CN=System,DC=corp,DC=example,DC=com";
  const std::string sGpLink = "[LDAP://" + sOther + ";0][LDAP://cn={aaaa},cn=policies,cn=system,"
                              "DC=corp,DC=example,DC=com;0]";

  EXPECT_EQ(LdapPolicyObjectStore::removeLinkSegment(sGpLink, sOurs), "[LDAP://" + sOther + ";0]");
  EXPECT_EQ(LdapPolicyObjectStore::removeLinkSegment("", sOurs), "");
  EXPECT_EQ(LdapPolicyObjectStore::removeLinkSegment("[LDAP://" + sOther + ";0]", sOurs),
            "[LDAP://" + sOther + ";0]");
}

namespace {

const std::string kOurGpo = "CN={AAAA},CN=Policies,CN=System,DC=corp,DC=example,DC=com";
const std::string kDefaultDcGpo =
    "CN={6AC1786C-016F-11D2-945F-00C04FB984F9},CN=Policies,CN=System,DC=corp,DC=example,DC=com";

}  // namespace

TEST(LdapHelpersTest, LinkFlagsAbsentForBlankOrForeignGpLink) {
  EXPECT_FALSE(LdapPolicyObjectStore::linkFlags("", kOurGpo).has_value());
  EXPECT_FALSE(LdapPolicyObjectStore::linkFlags(" ", kOurGpo).has_value());
  EXPECT_FALSE(
      LdapPolicyObjectStore::linkFlags("[LDAP://" + kDefaultDcGpo + ";0] ", kOurGpo).has_value());
}

TEST(LdapHelpersTest, LinkFlagsReportsDisabledAndEnforcedBits) {
  const std::string sGpLink =
      "[LDAP://" + kDefaultDcGpo + ";0][LDAP://cn={aaaa},cn=policies,cn=system,"
      "DC=corp,DC=example,DC=com;1]";
  EXPECT_EQ(LdapPolicyObjectStore::linkFlags(sGpLink, kOurGpo).value_or(-1), 1);
  EXPECT_EQ(LdapPolicyObjectStore::linkFlags("[LDAP://" + kOurGpo + ";2]", kOurGpo).value_or(-1),
            2);
  EXPECT_EQ(LdapPolicyObjectStore::linkFlags("[LDAP://" + kOurGpo + ";x]", kOurGpo).value_or(-1),
            1);
}

TEST(LdapHelpersTest, EnableLinkSegmentAppendsWhenMissing) {
  EXPECT_EQ(LdapPolicyObjectStore::enableLinkSegment(" ", kOurGpo), "[LDAP://" + kOurGpo + ";0]");
  EXPECT_EQ(LdapPolicyObjectStore::enableLinkSegment("[LDAP://" + kDefaultDcGpo + ";0] ", kOurGpo),
            "[LDAP://" + kDefaultDcGpo + ";0][LDAP://" + kOurGpo + ";0]");
}

TEST(LdapHelpersTest, EnableLinkSegmentReEnablesInPlace) {
  const std::string sGpLink =
      "[LDAP://" + kOurGpo + ";3][LDAP://" + kDefaultDcGpo + ";0][LDAP://" + kOurGpo + ";0]";
  const std::string sEnabled = LdapPolicyObjectStore::enableLinkSegment(sGpLink, kOurGpo);

  EXPECT_EQ(sEnabled, "[LDAP://" + kOurGpo + ";2][LDAP://" + kDefaultDcGpo + ";0]");
  EXPECT_EQ(LdapPolicyObjectStore::linkFlags(sEnabled, kOurGpo).value_or(-1), 2);
}

TEST(LdapHelpersTest, EnableLinkSegmentKeepsEnabledLinkUntouched) {
  const std::string sGpLink = "[LDAP://" + kDefaultDcGpo + ";0][LDAP://" + kOurGpo + ";0]";
  EXPECT_EQ(LdapPolicyObjectStore::enableLinkSegment(sGpLink, kOurGpo), sGpLink);
}
