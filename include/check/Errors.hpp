#pragma once

#include "migration/Reconciler.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>

namespace sg::check {

// A failed pass/fail gate. Every subclass reflects a mismatch in durable state,
// so none of them is retried.
class CheckError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ConfigurationMismatch : public CheckError {
public:
    ConfigurationMismatch(unsigned int configured, unsigned int observed);

    unsigned int configured, observed;
};

class UnsupportedEngineVersion : public CheckError {
public:
    UnsupportedEngineVersion(unsigned int observed, unsigned int minimum);

    unsigned int observed, minimum;
};

class MigrationIncompatibility : public CheckError {
public:
    MigrationIncompatibility(migration::ReconciliationResult result,
                             std::string currentVersion,
                             std::string targetVersion,
                             std::filesystem::path targetPath);

    migration::ReconciliationResult result;
    std::string currentVersion, targetVersion;
    std::filesystem::path targetPath;
};

}
