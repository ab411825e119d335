#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "cli/Cli.hpp"
#include "cli/Confirmer.hpp"
#include "common/Config.hpp"
#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "core/Orchestrator.hpp"
#include "core/RunContext.hpp"
#include "dal/LogonTargetLedger.hpp"
#include "directory/LdapConnection.hpp"
#include "directory/LdapDirectory.hpp"
#include "directory/LdapPolicyObjectStore.hpp"
#include "directory/RsopExportSource.hpp"
#include "report/LogReporter.hpp"
#include "security/Digest.hpp"

int main(int argc, char* argv[]) {
  // ── Step 1: Parse the command line ─────────────────────────────────────
  const auto coOptions =
      privguard::cli::parseArguments(std::vector<std::string>(argv + 1, argv + argc));
  if (coOptions.oError.has_value()) {
    std::cerr << "error: " << *coOptions.oError << "\n\n" << privguard::cli::usage();
    return EXIT_FAILURE;
  }
  if (coOptions.mode == privguard::common::Mode::Help) {
    std::cout << privguard::cli::usage();
    return EXIT_SUCCESS;
  }

  try {
    // ── Step 2: Load and validate configuration ──────────────────────────
    auto cfgApp = privguard::common::Config::load();

    privguard::common::Logger::init(cfgApp.sLogLevel, cfgApp.sLogFile);
    auto spLog = privguard::common::Logger::get();
    spLog->info("Configuration loaded (uri={}, bind={})", cfgApp.sLdapUri, cfgApp.sBindDn);

    // ── Step 3: Bind to the directory ────────────────────────────────────
    std::unique_ptr<privguard::directory::LdapConnection> upConn;
    try {
      upConn = std::make_unique<privguard::directory::LdapConnection>(
          cfgApp.sLdapUri, cfgApp.sBindDn, cfgApp.sBindPassword);
    } catch (const privguard::common::DirectoryError& ex) {
      privguard::security::Digest::wipe(cfgApp.sBindPassword);
      throw privguard::common::PrerequisiteError("directory_unreachable", ex.what());
    }

    // Zero bind password from Config after handoff
    privguard::security::Digest::wipe(cfgApp.sBindPassword);

    auto dlLayout = privguard::directory::resolveDomainLayout(*upConn, cfgApp);
    spLog->info("Domain {} ({})", dlLayout.sDnsDomain, dlLayout.sBaseDn);

    // ── Step 4: Build collaborators ──────────────────────────────────────
    privguard::directory::LdapDirectory ldDirectory(*upConn, dlLayout);
    privguard::directory::LdapPolicyObjectStore lposStore(*upConn, dlLayout, cfgApp.sSysvolPath);
    privguard::directory::RsopExportSource resSource(cfgApp.sRsopExportCommand, cfgApp.sRsopPath);
    privguard::dal::LogonTargetLedger ltlLedger(cfgApp.sStateDir);
    privguard::report::LogReporter lrReporter;

    std::unique_ptr<privguard::cli::IConfirmer> upConfirmer;
    if (coOptions.bAssumeYes || cfgApp.bAssumeYes) {
      upConfirmer = std::make_unique<privguard::cli::AlwaysYesConfirmer>();
    } else {
      upConfirmer = std::make_unique<privguard::cli::ConsoleConfirmer>(std::cin, std::cout);
    }

    privguard::core::RunContext ctx{cfgApp,    ldDirectory, lposStore,   resSource,
                                    ltlLedger, *upConfirmer, lrReporter};

    // ── Step 5: Run the selected mode ────────────────────────────────────
    privguard::core::Orchestrator orc(ctx);
    orc.run(coOptions.mode);

    lrReporter.summarize();
    return EXIT_SUCCESS;
  } catch (const privguard::common::AppError& ex) {
    if (ex._bFatal) {
      privguard::common::Logger::get()->critical("Aborted [{}]: {}", ex._sErrorCode, ex.what());
    } else {
      privguard::common::Logger::get()->error("Run stopped [{}]: {}", ex._sErrorCode, ex.what());
    }
    return EXIT_FAILURE;
  } catch (const std::exception& ex) {
    std::cerr << "[fatal] " << ex.what() << "\n";
    privguard::common::Logger::get()->critical("Aborted: {}", ex.what());
    return EXIT_FAILURE;
  }
}
