#pragma once

#include <string>

#include "common/Types.hpp"

namespace privguard::report {

/// Single sink for every finding and action outcome.
class IReporter {
 public:
  virtual ~IReporter() = default;

  virtual void record(common::Severity severity, const std::string& sMessage) = 0;
};

}  // namespace privguard::report
