#pragma once

#include <cstdio>
#include <filesystem>
#include <optional>

namespace sg::cli {

// Exit status for malformed invocations; check failures exit with EXIT_FAILURE.
inline constexpr int EXIT_USAGE = 2;

struct Options {
    std::filesystem::path configPath;
    std::filesystem::path targetDir; // empty = working directory
    bool json = false;
    bool verbose = false;
    bool help = false;
};

// Accepts `--flag value` and `--flag=value`. nullopt on any usage error.
std::optional<Options> parseArgs(int argc, const char* const* argv);

void printUsage(std::FILE* out);

}
