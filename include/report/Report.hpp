#pragma once

#include "runtime/Checker.hpp"

#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace sg::check {
class CheckError;
class MigrationIncompatibility;
}

namespace sg::report {

inline constexpr const char* MISSING_HEADER = "Migrations which are currently applied, but missing in the new version:";

// Header, one indented "<namespace> <name>" line per missing id, then the summary.
std::vector<std::string> incompatibilityLines(const check::MigrationIncompatibility& e);

// Writes the diagnostic for a failed gate through the matching subsystem logger.
void logFailure(const check::CheckError& e);

nlohmann::json toJson(const runtime::Report& report);

}
