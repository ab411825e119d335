#include "core/SnapshotCollector.hpp"

#include <gtest/gtest.h>

#include "common/Errors.hpp"
#include "fakes/FakeDirectory.hpp"
#include "fakes/FakeSnapshotSource.hpp"

using namespace privguard::common;
using privguard::core::SnapshotCollector;
using privguard::test::FakeDirectory;
using privguard::test::FakeSnapshotSource;

TEST(SnapshotCollectorTest, CombinesDocumentAndDirectoryFacts) {
  FakeSnapshotSource fss;
  fss.jDocument = {
      {"accountPolicies", {{"LockoutBadCount", 5}, {"MinimumPasswordLength", 12}}},
      {"systemAccess", {{"LSAAnonymousNameLookup", 0}}},
  };
  FakeDirectory fd;
  fd.mAccounts = {{"alice", {"DC01"}}, {"bob", {}}};
  fd.vControllers = {"DC01.corp.example.com"};
  fd.vAdminMembers = {{"Administrator", true, false}};

  auto ds = SnapshotCollector(fss, fd).collect();

  EXPECT_EQ(ds.pfPolicy.oLockoutThreshold, 5);
  EXPECT_EQ(ds.pfPolicy.oMinPasswordLength, 12);
  EXPECT_FALSE(ds.pfPolicy.oPasswordHistorySize.has_value());
  EXPECT_EQ(ds.pfPolicy.oAnonymousSidTranslationRestricted, true);
  ASSERT_EQ(ds.vPrivilegedAccounts.size(), 2u);
  EXPECT_EQ(ds.vPrivilegedAccounts[0].sAccountName, "alice");
  EXPECT_EQ(ds.vDomainControllers.size(), 1u);
  EXPECT_EQ(ds.vAdminGroupMembers.size(), 1u);
  EXPECT_EQ(ds.sDocumentDigest.size(), 64u);
  EXPECT_EQ(fss.iExports, 1);
}

TEST(SnapshotCollectorTest, ExportFailureBecomesCollectionError) {
  FakeSnapshotSource fss;
  fss.bFail = true;
  FakeDirectory fd;

  try {
    SnapshotCollector(fss, fd).collect();
    FAIL() << "expected CollectionError";
  } catch (const CollectionError& ex) {
    EXPECT_TRUE(ex._bFatal);
    EXPECT_EQ(ex._sErrorCode, "rsop_export_failed");
  }
}

TEST(SnapshotCollectorTest, DirectoryFailureBecomesCollectionError) {
  FakeSnapshotSource fss;
  FakeDirectory fd;
  fd.bFailListing = true;

  try {
    SnapshotCollector(fss, fd).collect();
    FAIL() << "expected CollectionError";
  } catch (const CollectionError& ex) {
    EXPECT_EQ(ex._sErrorCode, "directory_query_failed");
  }
}
