#pragma once

namespace privguard::common {
struct Config;
}

namespace privguard::directory {
class IDirectory;
class IPolicyObjectStore;
class ISnapshotSource;
}  // namespace privguard::directory

namespace privguard::dal {
class LogonTargetLedger;
}

namespace privguard::cli {
class IConfirmer;
}

namespace privguard::report {
class IReporter;
}

namespace privguard::core {

/// Everything one run needs, constructed once in main and passed by reference.
/// Non-owning: the referenced collaborators must outlive the run.
/// Class abbreviation: ctx
struct RunContext {
  const common::Config& cfgApp;
  directory::IDirectory& dirDirectory;
  directory::IPolicyObjectStore& posStore;
  directory::ISnapshotSource& ssSource;
  dal::LogonTargetLedger& ltlLedger;
  cli::IConfirmer& cfConfirmer;
  report::IReporter& rptReporter;
};

}  // namespace privguard::core
