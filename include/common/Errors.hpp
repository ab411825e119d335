#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace privguard::common {

/// Base error for all application-level exceptions.
/// Carries a machine-readable error code slug and whether the run must stop.
struct AppError : public std::runtime_error {
  bool _bFatal;
  std::string _sErrorCode;

  explicit AppError(bool bFatal, std::string sCode, std::string sMsg)
      : std::runtime_error(std::move(sMsg)),
        _bFatal(bFatal),
        _sErrorCode(std::move(sCode)) {}
};

/// Missing capability, insufficient privilege, wrong role or no connectivity.
/// Raised before any directory read or write.
struct PrerequisiteError : AppError {
  explicit PrerequisiteError(std::string sCode, std::string sMsg)
      : AppError(true, std::move(sCode), std::move(sMsg)) {}
};

/// Resultant-policy export or directory facts could not be collected.
struct CollectionError : AppError {
  explicit CollectionError(std::string sCode, std::string sMsg)
      : AppError(true, std::move(sCode), std::move(sMsg)) {}
};

/// An LDAP operation failed. Carries the LDAP result code.
struct DirectoryError : AppError {
  int _iResultCode;

  explicit DirectoryError(int iResultCode, std::string sCode, std::string sMsg)
      : AppError(false, std::move(sCode), std::move(sMsg)), _iResultCode(iResultCode) {}
};

/// Requested directory or policy object does not exist.
struct NotFoundError : AppError {
  explicit NotFoundError(std::string sCode, std::string sMsg)
      : AppError(false, std::move(sCode), std::move(sMsg)) {}
};

/// A single remediation action failed; the controller moves on.
struct RemediationActionError : AppError {
  explicit RemediationActionError(std::string sCode, std::string sMsg)
      : AppError(false, std::move(sCode), std::move(sMsg)) {}
};

}  // namespace privguard::common
