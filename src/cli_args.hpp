#pragma once

#include "settings.hpp"

#include <cstdint>
#include <ostream>
#include <string>

namespace procmaps {

// Process exit codes shared by the command line tools.
constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

enum class CliAction : uint8_t {
    Generate = 0,
    Help,
    Version,
    WriteDefaultConfig,
};

struct CliOptions {
    CliAction action = CliAction::Generate;
    Settings settings;

    bool ascii = false;
    std::string ppmPath;
    std::string jsonPath;

    std::string configPath;
    std::string defaultConfigPath;
};

void printCliUsage(std::ostream& out, const char* argv0);

// Parses the procmaps_cli command line into `out`.
// --config is applied before every other flag, so flags override the file
// wherever they appear. --help, --version and --write-default-config end
// parsing as soon as they are seen.
//
// Returns kExitOk on success, kExitUsage for a missing/invalid value or an
// unknown argument, and kExitFailure when the config file cannot be opened.
int parseCliArgs(int argc, const char* const* argv, CliOptions& out, std::string* err = nullptr);

} // namespace procmaps
