#include "remediation/RemediationCatalog.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <string>

#include "cli/Confirmer.hpp"
#include "common/Errors.hpp"
#include "dal/LogonTargetLedger.hpp"
#include "fakes/FakeDirectory.hpp"
#include "fakes/FakePolicyObjectStore.hpp"
#include "remediation/DcPolicyAction.hpp"
#include "remediation/LogonRestrictionAction.hpp"
#include "remediation/PasswordPolicyAction.hpp"

using namespace privguard::common;
using namespace privguard::remediation;
using privguard::cli::AlwaysYesConfirmer;
using privguard::cli::Answer;
using privguard::cli::ScriptedConfirmer;
using privguard::dal::LogonTargetLedger;
using privguard::test::FakeDirectory;
using privguard::test::FakePolicyObjectStore;

namespace fs = std::filesystem;

class RemediationCatalogTest : public ::testing::Test {
 protected:
  void SetUp() override {
    _pathState = fs::temp_directory_path() /
                 ("privguard_catalog_" +
                  std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
    fs::remove_all(_pathState);

    _fdDirectory.vControllers = {"DC01.corp.example.com", "dc02.corp.example.com"};
    _fdDirectory.mAccounts = {{"alice", {}}, {"bob", {"WS01", "WS02"}}, {"carol", {"DC01", "DC02"}}};
  }

  void TearDown() override { fs::remove_all(_pathState); }

  fs::path _pathState;
  FakeDirectory _fdDirectory;
  FakePolicyObjectStore _fposStore;
  AlwaysYesConfirmer _aycConfirmer;
};

TEST_F(RemediationCatalogTest, HoldsFourActionsInOrder) {
  LogonTargetLedger ltl(_pathState);
  RemediationCatalog rc(_fposStore, _fdDirectory, ltl, _aycConfirmer);

  ASSERT_EQ(rc.actions().size(), 4u);
  EXPECT_EQ(rc.actions()[0]->id(), "privileged-password-policy");
  EXPECT_EQ(rc.actions()[1]->id(), "logon-restriction");
  EXPECT_EQ(rc.actions()[2]->id(), "null-session-lockdown");
  EXPECT_EQ(rc.actions()[3]->id(), "credential-caching-lockdown");

  EXPECT_EQ(rc.actions()[0]->managedObjectName(), kPasswordPolicyName);
  EXPECT_TRUE(rc.actions()[1]->managedObjectName().empty());
  EXPECT_EQ(rc.actions()[2]->managedObjectName(), kDcPolicyName);
  EXPECT_EQ(rc.actions()[3]->managedObjectName(), kDcPolicyName);
}

TEST_F(RemediationCatalogTest, EnsureTwiceIsIdempotentForEveryAction) {
  LogonTargetLedger ltl(_pathState);
  RemediationCatalog rc(_fposStore, _fdDirectory, ltl, _aycConfirmer);

  for (const auto& upAction : rc.actions()) {
    auto arFirst = upAction->ensure(false);
    EXPECT_TRUE(arFirst.applied()) << upAction->id() << ": " << arFirst.sMessage;

    const int iCreatedBefore = _fposStore.iCreated;
    const int iWritesBefore = _fposStore.iValueWrites;
    const int iSetsBefore = _fdDirectory.iSetCalls;

    auto arSecond = upAction->ensure(false);
    EXPECT_EQ(arSecond.outcome, ActionOutcome::Unchanged) << upAction->id();
    EXPECT_FALSE(arSecond.applied());
    EXPECT_FALSE(arSecond.error().has_value());
    EXPECT_EQ(_fposStore.iCreated, iCreatedBefore) << upAction->id();
    EXPECT_EQ(_fposStore.iValueWrites, iWritesBefore) << upAction->id();
    EXPECT_EQ(_fdDirectory.iSetCalls, iSetsBefore) << upAction->id();
  }

  // Two named objects, never duplicated
  EXPECT_EQ(_fposStore.mObjects.size(), 2u);
  EXPECT_EQ(_fposStore.iCreated, 2);
}

TEST_F(RemediationCatalogTest, EnsureThenRemoveLeavesNothingAndRemoveAgainSucceeds) {
  LogonTargetLedger ltl(_pathState);
  RemediationCatalog rc(_fposStore, _fdDirectory, ltl, _aycConfirmer);

  for (const auto& upAction : rc.actions()) {
    upAction->ensure(false);
  }
  for (const auto& upAction : rc.actions()) {
    auto ar = upAction->remove();
    EXPECT_FALSE(ar.error().has_value()) << upAction->id();
  }

  EXPECT_FALSE(_fposStore.contains(PolicyKind::PasswordSettings, kPasswordPolicyName));
  EXPECT_FALSE(_fposStore.contains(PolicyKind::GroupPolicy, kDcPolicyName));
  EXPECT_FALSE(ltl.exists());

  for (const auto& upAction : rc.actions()) {
    auto ar = upAction->remove();
    EXPECT_EQ(ar.outcome, ActionOutcome::Unchanged) << upAction->id();
  }
}

TEST_F(RemediationCatalogTest, PasswordPolicyCarriesHardenedSettingsAndIsLinked) {
  AlwaysYesConfirmer ayc;
  PasswordPolicyAction ppa(_fposStore, ayc);
  ASSERT_TRUE(ppa.ensure(true).applied());

  const auto& obj = _fposStore.mObjects.at({PolicyKind::PasswordSettings, kPasswordPolicyName});
  EXPECT_EQ(obj.pps.iMinPasswordLength, 12);
  EXPECT_TRUE(obj.pps.bComplexityEnabled);
  EXPECT_FALSE(obj.pps.bReversibleEncryptionEnabled);
  EXPECT_EQ(obj.pps.iPasswordHistoryLength, 10);
  EXPECT_EQ(obj.pps.iLockoutThreshold, 5);
  EXPECT_EQ(obj.pps.iLockoutObservationWindowSeconds, 24 * 3600);
  EXPECT_TRUE(obj.pps.bLockoutNeverExpires);
  EXPECT_EQ(obj.pps.iMinPasswordAgeSeconds, 3 * 86400);
  EXPECT_EQ(obj.pps.iMaxPasswordAgeSeconds, 30 * 86400);
  EXPECT_EQ(obj.pps.iPrecedence, 1);
  EXPECT_EQ(obj.setLinks.count(LinkTarget::PrivilegedGroup), 1u);
}

TEST_F(RemediationCatalogTest, PasswordPolicyNestedNoDeletesJustCreatedObject) {
  ScriptedConfirmer sc({Answer::No});
  PasswordPolicyAction ppa(_fposStore, sc);

  auto ar = ppa.ensure(true);
  EXPECT_TRUE(ar.skipped());
  EXPECT_EQ(sc.askedTitles().size(), 1u);
  EXPECT_FALSE(_fposStore.contains(PolicyKind::PasswordSettings, kPasswordPolicyName));
}

TEST_F(RemediationCatalogTest, PasswordPolicyWithoutConfirmDoesNotAsk) {
  ScriptedConfirmer sc({});
  PasswordPolicyAction ppa(_fposStore, sc);

  EXPECT_TRUE(ppa.ensure(false).applied());
  EXPECT_TRUE(sc.askedTitles().empty());
}

TEST_F(RemediationCatalogTest, PasswordPolicyLinksExistingUnlinkedObject) {
  _fposStore.createPasswordPolicy(kPasswordPolicyName, PasswordPolicySettings{});
  AlwaysYesConfirmer ayc;
  PasswordPolicyAction ppa(_fposStore, ayc);

  auto ar = ppa.ensure(true);
  EXPECT_TRUE(ar.applied());
  EXPECT_EQ(_fposStore.iCreated, 1);
  EXPECT_EQ(_fposStore.mObjects.begin()->second.setLinks.count(LinkTarget::PrivilegedGroup), 1u);
}

TEST_F(RemediationCatalogTest, PasswordPolicyAsksBeforeLinkingExistingObject) {
  _fposStore.createPasswordPolicy(kPasswordPolicyName, PasswordPolicySettings{});
  ScriptedConfirmer sc({Answer::No});
  PasswordPolicyAction ppa(_fposStore, sc);

  auto ar = ppa.ensure(true);
  EXPECT_TRUE(ar.skipped());
  EXPECT_EQ(sc.askedTitles().size(), 1u);
  ASSERT_TRUE(_fposStore.contains(PolicyKind::PasswordSettings, kPasswordPolicyName));
  EXPECT_TRUE(_fposStore.mObjects.begin()->second.setLinks.empty());
}

TEST_F(RemediationCatalogTest, PasswordPolicyLinksExistingObjectWithoutConfirmSilently) {
  _fposStore.createPasswordPolicy(kPasswordPolicyName, PasswordPolicySettings{});
  ScriptedConfirmer sc({});
  PasswordPolicyAction ppa(_fposStore, sc);

  EXPECT_TRUE(ppa.ensure(false).applied());
  EXPECT_TRUE(sc.askedTitles().empty());
  EXPECT_EQ(_fposStore.mObjects.begin()->second.setLinks.count(LinkTarget::PrivilegedGroup), 1u);
}

TEST_F(RemediationCatalogTest, PasswordPolicyLinkFailureRemovesObjectAndThrows) {
  _fposStore.bFailLink = true;
  AlwaysYesConfirmer ayc;
  PasswordPolicyAction ppa(_fposStore, ayc);

  EXPECT_THROW(ppa.ensure(false), DirectoryError);
  EXPECT_FALSE(_fposStore.contains(PolicyKind::PasswordSettings, kPasswordPolicyName));
}

TEST_F(RemediationCatalogTest, LogonRestrictionSetsDcTargetsAndCapturesPriorValues) {
  LogonTargetLedger ltl(_pathState);
  LogonRestrictionAction lra(_fdDirectory, ltl);

  auto ar = lra.ensure(false);
  ASSERT_TRUE(ar.applied());
  EXPECT_NE(ar.sMessage.find("alice"), std::string::npos);
  EXPECT_NE(ar.sMessage.find("bob"), std::string::npos);
  EXPECT_EQ(ar.sMessage.find("carol"), std::string::npos);

  const std::vector<std::string> vDcs = {"DC01", "DC02"};
  EXPECT_EQ(_fdDirectory.mAccounts["alice"], vDcs);
  EXPECT_EQ(_fdDirectory.mAccounts["bob"], vDcs);

  auto mCaptured = ltl.load();
  ASSERT_EQ(mCaptured.size(), 2u);
  EXPECT_TRUE(mCaptured["alice"].empty());
  EXPECT_EQ(mCaptured["bob"], (std::vector<std::string>{"WS01", "WS02"}));
}

TEST_F(RemediationCatalogTest, LogonRestrictionRemoveRestoresCapturedValues) {
  LogonTargetLedger ltl(_pathState);
  LogonRestrictionAction lra(_fdDirectory, ltl);
  lra.ensure(false);

  auto ar = lra.remove();
  EXPECT_TRUE(ar.applied());
  EXPECT_TRUE(_fdDirectory.mAccounts["alice"].empty());
  EXPECT_EQ(_fdDirectory.mAccounts["bob"], (std::vector<std::string>{"WS01", "WS02"}));
  EXPECT_EQ(_fdDirectory.mAccounts["carol"], (std::vector<std::string>{"DC01", "DC02"}));
  EXPECT_FALSE(ltl.exists());
}

TEST_F(RemediationCatalogTest, LogonRestrictionRemoveToleratesDeletedAccount) {
  LogonTargetLedger ltl(_pathState);
  LogonRestrictionAction lra(_fdDirectory, ltl);
  lra.ensure(false);
  _fdDirectory.mAccounts.erase("bob");

  auto ar = lra.remove();
  EXPECT_FALSE(ar.error().has_value());
  EXPECT_FALSE(ltl.exists());
}

TEST_F(RemediationCatalogTest, LogonRestrictionRefusesWithoutDomainControllers) {
  _fdDirectory.vControllers.clear();
  LogonTargetLedger ltl(_pathState);
  LogonRestrictionAction lra(_fdDirectory, ltl);

  EXPECT_THROW(lra.ensure(false), RemediationActionError);
  EXPECT_EQ(_fdDirectory.iSetCalls, 0);
}

TEST_F(RemediationCatalogTest, LogonTargetsAreUppercaseShortNames) {
  auto vTargets = LogonRestrictionAction::logonTargetsFor(
      {"dc02.corp.example.com", "DC01.corp.example.com", "dc01"});
  EXPECT_EQ(vTargets, (std::vector<std::string>{"DC01", "DC02"}));
}

TEST_F(RemediationCatalogTest, DcPolicyActionsShareOneLinkedGpo) {
  NullSessionAction nsa(_fposStore);
  CredentialCachingAction cca(_fposStore);

  ASSERT_TRUE(nsa.ensure(false).applied());
  ASSERT_TRUE(cca.ensure(false).applied());
  EXPECT_EQ(_fposStore.iCreated, 1);

  auto oGpo = _fposStore.findByName(PolicyKind::GroupPolicy, kDcPolicyName);
  ASSERT_TRUE(oGpo.has_value());
  EXPECT_TRUE(_fposStore.isLinked(*oGpo, LinkTarget::DomainControllersContainer));
  EXPECT_EQ(_fposStore.getValue(*oGpo, kRestrictNullSessAccess).value_or(""), "4,1");
  EXPECT_EQ(_fposStore.getValue(*oGpo, kRestrictAnonymousSam).value_or(""), "4,1");
  EXPECT_EQ(_fposStore.getValue(*oGpo, kDisableDomainCreds).value_or(""), "4,1");

  // Removing through either action deletes the shared object
  EXPECT_TRUE(nsa.remove().applied());
  EXPECT_EQ(cca.remove().outcome, ActionOutcome::Unchanged);
}

TEST_F(RemediationCatalogTest, DcPolicyActionRelinksExistingUnlinkedGpo) {
  auto mor = _fposStore.createAndLink(PolicyKind::GroupPolicy, kDcPolicyName,
                                      LinkTarget::PrivilegedGroup);
  _fposStore.setValue(mor, kDisableDomainCreds, "4,1");

  CredentialCachingAction cca(_fposStore);
  auto ar = cca.ensure(false);
  EXPECT_TRUE(ar.applied());
  EXPECT_TRUE(_fposStore.isLinked(mor, LinkTarget::DomainControllersContainer));
  EXPECT_EQ(_fposStore.iCreated, 1);
}
