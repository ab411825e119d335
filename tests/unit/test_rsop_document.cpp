#include "directory/RsopDocument.hpp"

#include <gtest/gtest.h>

using privguard::directory::RsopDocument;
using json = nlohmann::json;

TEST(RsopDocumentTest, ParsesCompleteDocument) {
  auto jDoc = json::parse(R"({
    "accountPolicies": { "MinimumPasswordAge": 1, "LockoutBadCount": 5,
                         "MinimumPasswordLength": 12, "PasswordComplexity": 1,
                         "PasswordHistorySize": 24 },
    "securityOptions": [
      { "keyName": "MACHINE\\System\\CurrentControlSet\\Control\\Lsa\\NoLMHash", "value": 1 },
      { "keyName": "MACHINE\\System\\CurrentControlSet\\Services\\LanManServer\\Parameters\\RestrictNullSessAccess", "value": 1 }
    ],
    "systemAccess": { "LSAAnonymousNameLookup": 0 }
  })");

  auto pf = RsopDocument::parse(jDoc);
  EXPECT_EQ(pf.oMinPasswordAge, 1);
  EXPECT_EQ(pf.oLockoutThreshold, 5);
  EXPECT_EQ(pf.oMinPasswordLength, 12);
  EXPECT_EQ(pf.oComplexityEnabled, true);
  EXPECT_EQ(pf.oPasswordHistorySize, 24);
  EXPECT_EQ(pf.oNullSessionsRestricted, true);
  EXPECT_EQ(pf.oAnonymousSidTranslationRestricted, true);
}

TEST(RsopDocumentTest, EmptyDocumentLeavesEverythingAbsent) {
  for (const auto& jDoc : {json::object(), json::array(), json("text")}) {
    auto pf = RsopDocument::parse(jDoc);
    EXPECT_FALSE(pf.oMinPasswordAge.has_value());
    EXPECT_FALSE(pf.oLockoutThreshold.has_value());
    EXPECT_FALSE(pf.oMinPasswordLength.has_value());
    EXPECT_FALSE(pf.oComplexityEnabled.has_value());
    EXPECT_FALSE(pf.oPasswordHistorySize.has_value());
    EXPECT_FALSE(pf.oNullSessionsRestricted.has_value());
    EXPECT_FALSE(pf.oAnonymousSidTranslationRestricted.has_value());
  }
}

TEST(RsopDocumentTest, WrongTypesAreTreatedAsAbsent) {
  auto jDoc = json::parse(R"({
    "accountPolicies": { "LockoutBadCount": "5", "MinimumPasswordLength": 8.5,
                         "PasswordComplexity": 2 },
    "securityOptions": { "keyName": "RestrictNullSessAccess" },
    "systemAccess": { "LSAAnonymousNameLookup": "0" }
  })");

  auto pf = RsopDocument::parse(jDoc);
  EXPECT_FALSE(pf.oLockoutThreshold.has_value());
  EXPECT_FALSE(pf.oMinPasswordLength.has_value());
  EXPECT_FALSE(pf.oComplexityEnabled.has_value());
  EXPECT_FALSE(pf.oNullSessionsRestricted.has_value());
  EXPECT_FALSE(pf.oAnonymousSidTranslationRestricted.has_value());
}

TEST(RsopDocumentTest, ComplexityAcceptsBoolean) {
  auto pf = RsopDocument::parse(json::parse(R"({"accountPolicies":{"PasswordComplexity":false}})"));
  EXPECT_EQ(pf.oComplexityEnabled, false);
}

TEST(RsopDocumentTest, NullSessionKeyMatchIsCaseInsensitive) {
  auto pf = RsopDocument::parse(json::parse(R"({
    "securityOptions": [
      { "keyName": "machine\\system\\currentcontrolset\\services\\lanmanserver\\parameters\\restrictnullsessaccess", "value": 0 }
    ]
  })"));
  EXPECT_EQ(pf.oNullSessionsRestricted, false);
}

TEST(RsopDocumentTest, AnonymousLookupEnabledIsNotRestricted) {
  auto pf = RsopDocument::parse(json::parse(R"({"systemAccess":{"LSAAnonymousNameLookup":1}})"));
  EXPECT_EQ(pf.oAnonymousSidTranslationRestricted, false);
}

TEST(RsopDocumentTest, OutOfRangeIntegersAreTreatedAsAbsent) {
  auto jDoc = json::parse(R"({
    "accountPolicies": { "LockoutBadCount": 4294967296, "MinimumPasswordLength": -4294967296,
                         "PasswordComplexity": 4294967297, "PasswordHistorySize": 18446744073709551615 },
    "securityOptions": [
      { "keyName": "MACHINE\\System\\CurrentControlSet\\Services\\LanManServer\\Parameters\\RestrictNullSessAccess", "value": 4294967297 }
    ]
  })");

  auto pf = RsopDocument::parse(jDoc);
  EXPECT_FALSE(pf.oLockoutThreshold.has_value());
  EXPECT_FALSE(pf.oMinPasswordLength.has_value());
  EXPECT_FALSE(pf.oComplexityEnabled.has_value());
  EXPECT_FALSE(pf.oPasswordHistorySize.has_value());
  EXPECT_FALSE(pf.oNullSessionsRestricted.has_value());
}

TEST(RsopDocumentTest, LargestIntStillParses) {
  auto jDoc = json::parse(R"({ "accountPolicies": { "LockoutBadCount": 2147483647 } })");
  EXPECT_EQ(RsopDocument::parse(jDoc).oLockoutThreshold, 2147483647);
}
