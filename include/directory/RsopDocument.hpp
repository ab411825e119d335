#pragma once

#include <nlohmann/json.hpp>

#include "common/Types.hpp"

namespace privguard::directory {

/// Maps an exported resultant-policy document onto the snapshot's policy fields.
/// Malformed or missing settings become nullopt; parse never throws on content.
/// Class abbreviation: N/A (static interface)
class RsopDocument {
 public:
  static common::PolicyFields parse(const nlohmann::json& jDocument);
};

}  // namespace privguard::directory
