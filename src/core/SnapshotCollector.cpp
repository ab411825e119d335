#include "core/SnapshotCollector.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "directory/IDirectory.hpp"
#include "directory/ISnapshotSource.hpp"
#include "directory/RsopDocument.hpp"
#include "security/Digest.hpp"

namespace privguard::core {

SnapshotCollector::SnapshotCollector(directory::ISnapshotSource& ssSource,
                                     directory::IDirectory& dirDirectory)
    : _ssSource(ssSource), _dirDirectory(dirDirectory) {}

SnapshotCollector::~SnapshotCollector() = default;

common::DomainSnapshot SnapshotCollector::collect() {
  auto spLog = common::Logger::get();
  common::DomainSnapshot ds;

  nlohmann::json jDocument;
  try {
    jDocument = _ssSource.exportDocument();
  } catch (const common::CollectionError&) {
    throw;
  } catch (const std::exception& ex) {
    throw common::CollectionError("rsop_export_failed",
                                  std::string("Resultant-policy export failed: ") + ex.what());
  }

  ds.pfPolicy = directory::RsopDocument::parse(jDocument);
  ds.sDocumentDigest = security::Digest::sha256Hex(jDocument.dump());

  try {
    ds.vPrivilegedAccounts = _dirDirectory.listPrivilegedAccounts();
    ds.vDomainControllers = _dirDirectory.listDomainControllers();
    ds.vAdminGroupMembers = _dirDirectory.listAdminGroupMembers();
  } catch (const std::exception& ex) {
    throw common::CollectionError("directory_query_failed",
                                  std::string("Directory query failed: ") + ex.what());
  }

  spLog->info("Snapshot collected: {} privileged accounts, {} domain controllers, "
              "{} Administrators members (policy digest {})",
              ds.vPrivilegedAccounts.size(), ds.vDomainControllers.size(),
              ds.vAdminGroupMembers.size(), ds.sDocumentDigest.substr(0, 12));
  if (ds.pfPolicy.oMinPasswordAge.has_value()) {
    spLog->debug("Minimum password age: {} day(s)", *ds.pfPolicy.oMinPasswordAge);
  }
  return ds;
}

}  // namespace privguard::core
