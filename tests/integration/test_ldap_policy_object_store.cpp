#include "directory/LdapPolicyObjectStore.hpp"

#include "common/Config.hpp"
#include "common/Logger.hpp"
#include "directory/LdapConnection.hpp"
#include "directory/LdapDirectory.hpp"
#include "security/Digest.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <memory>
#include <string>

using namespace privguard::common;
using namespace privguard::directory;

namespace fs = std::filesystem;

namespace {

const char* kDisableDomainCreds =
    "MACHINE\\System\\CurrentControlSet\\Control\\Lsa\\DisableDomainCreds";

}  // namespace

/// Runs against a disposable test domain: needs PRIVGUARD_LDAP_URI, the bind
/// credentials and a writable PRIVGUARD_SYSVOL_PATH.
class LdapPolicyObjectStoreTest : public ::testing::Test {
 protected:
  void SetUp() override {
    if (std::getenv("PRIVGUARD_LDAP_URI") == nullptr) {
      GTEST_SKIP() << "PRIVGUARD_LDAP_URI not set; skipping integration test";
    }
    Logger::init("warn");
    _cfg = Config::load();
    _upConn = std::make_unique<LdapConnection>(_cfg.sLdapUri, _cfg.sBindDn, _cfg.sBindPassword);
    privguard::security::Digest::wipe(_cfg.sBindPassword);
    _dlLayout = resolveDomainLayout(*_upConn, _cfg);
    _upStore = std::make_unique<LdapPolicyObjectStore>(*_upConn, _dlLayout, _cfg.sSysvolPath);

    // Unique per run so a crashed run never collides with the next one
    _sName = "PrivGuard-IntegrationTest-" + privguard::security::Digest::randomGuid().substr(1, 8);
  }

  void TearDown() override {
    if (!_upStore) return;
    _upStore->deleteByName(PolicyKind::GroupPolicy, _sName);
    _upStore->deleteByName(PolicyKind::PasswordSettings, _sName);
  }

  Config _cfg;
  DomainLayout _dlLayout;
  std::unique_ptr<LdapConnection> _upConn;
  std::unique_ptr<LdapPolicyObjectStore> _upStore;
  std::string _sName;
};

TEST_F(LdapPolicyObjectStoreTest, PasswordPolicyCreateLinkFindDelete) {
  EXPECT_FALSE(_upStore->findByName(PolicyKind::PasswordSettings, _sName).has_value());

  auto mor = _upStore->createPasswordPolicy(_sName, PasswordPolicySettings{});
  EXPECT_FALSE(_upStore->isLinked(mor, LinkTarget::PrivilegedGroup));

  _upStore->link(mor, LinkTarget::PrivilegedGroup);
  _upStore->link(mor, LinkTarget::PrivilegedGroup);
  EXPECT_TRUE(_upStore->isLinked(mor, LinkTarget::PrivilegedGroup));
  EXPECT_EQ(_upStore->getValue(mor, "msDS-MinimumPasswordLength").value_or(""), "12");
  EXPECT_EQ(_upStore->getValue(mor, "msDS-LockoutThreshold").value_or(""), "5");

  auto oFound = _upStore->findByName(PolicyKind::PasswordSettings, _sName);
  ASSERT_TRUE(oFound.has_value());
  EXPECT_EQ(oFound->sDn, mor.sDn);

  EXPECT_TRUE(_upStore->deleteByName(PolicyKind::PasswordSettings, _sName));
  EXPECT_FALSE(_upStore->deleteByName(PolicyKind::PasswordSettings, _sName));
}

TEST_F(LdapPolicyObjectStoreTest, GroupPolicyWritesTemplateAndBumpsVersion) {
  auto mor = _upStore->createAndLink(PolicyKind::GroupPolicy, _sName,
                                     LinkTarget::DomainControllersContainer);
  EXPECT_TRUE(_upStore->isLinked(mor, LinkTarget::DomainControllersContainer));

  const fs::path pathRoot = fs::path(_cfg.sSysvolPath) / "Policies" / mor.sGuid;
  EXPECT_TRUE(fs::exists(pathRoot / "GPT.INI"));
  EXPECT_TRUE(fs::exists(pathRoot / "Machine" / "Microsoft" / "Windows NT" / "SecEdit" /
                         "GptTmpl.inf"));

  EXPECT_TRUE(_upStore->setValue(mor, kDisableDomainCreds, "4,1"));
  EXPECT_FALSE(_upStore->setValue(mor, kDisableDomainCreds, "4,1"));
  EXPECT_EQ(_upStore->getValue(mor, kDisableDomainCreds).value_or(""), "4,1");

  auto oEntry = _upConn->read(mor.sDn, {"versionNumber"});
  ASSERT_TRUE(oEntry.has_value());
  EXPECT_EQ(oEntry->first("versionNumber"), "1");

  EXPECT_TRUE(_upStore->deleteByName(PolicyKind::GroupPolicy, _sName));
  EXPECT_FALSE(fs::exists(pathRoot));
  EXPECT_FALSE(_upStore->findByName(PolicyKind::GroupPolicy, _sName).has_value());
}

TEST_F(LdapPolicyObjectStoreTest, RejectsMismatchedLinkTarget) {
  EXPECT_THROW(_upStore->createAndLink(PolicyKind::GroupPolicy, _sName,
                                       LinkTarget::PrivilegedGroup),
               std::invalid_argument);
  EXPECT_FALSE(_upStore->findByName(PolicyKind::GroupPolicy, _sName).has_value());
}
