#include "cli_args.hpp"

#include <fstream>

namespace procmaps {

namespace {

// Flag name -> settings key.
struct FlagKey {
    const char* flag;
    const char* key;
};

const FlagKey kFlagKeys[] = {
    {"--gen", "generator"},
    {"--seed", "seed"},
    {"--width", "width"},
    {"--height", "height"},
    {"--positive", "charge_positive"},
    {"--negative", "charge_negative"},
    {"--cutoff", "charge_cutoff_multiplier"},
    {"--intersection", "walk_intersection"},
    {"--max-steps", "walk_max_steps"},
    {"--passes", "walk_passes"},
    {"--extra-intersection", "walk_extra_intersection"},
    {"--seeds", "region_seeds"},
    {"--cell-size", "cell_size"},
};

bool argValue(int& i, int argc, const char* const* argv, std::string& out) {
    if (i + 1 >= argc) return false;
    out = argv[++i];
    return true;
}

int usageError(std::string* err, const std::string& msg) {
    if (err) *err = msg;
    return kExitUsage;
}

} // namespace

void printCliUsage(std::ostream& out, const char* argv0) {
    out << "Usage:\n"
        << "  " << argv0 << " --gen <charge|walk|regions> [options]\n\n"
        << "Options:\n"
        << "  --config <path>              Load settings from an INI file first.\n"
        << "  --write-default-config <p>   Write a commented settings file and exit.\n"
        << "  --gen <name>                 Generator: charge, walk or regions.\n"
        << "  --seed <n>                   RNG seed (decimal or 0x hex).\n"
        << "  --width <n> --height <n>     Grid size.\n"
        << "  --positive <n>               Charge field: positive charges.\n"
        << "  --negative <n>               Charge field: negative charges.\n"
        << "  --cutoff <f>                 Charge field: cutoff multiplier.\n"
        << "  --intersection <f>           Random walk: intersection allowance (0..1).\n"
        << "  --max-steps <n>              Random walk: step budget (-1 = until stuck).\n"
        << "  --passes <n>                 Random walk: number of carve passes.\n"
        << "  --extra-intersection <f>     Random walk: allowance for passes after the first.\n"
        << "  --seeds <n>                  Region growth: number of seed points.\n"
        << "  --ascii                      Print the map as text.\n"
        << "  --ppm <path>                 Write the map as a binary PPM image.\n"
        << "  --cell-size <n>              Pixels per cell for --ppm.\n"
        << "  --json-report <path>         Write a JSON summary.\n"
        << "  --version                    Print version.\n"
        << "  --help                       Show this help.\n";
}

int parseCliArgs(int argc, const char* const* argv, CliOptions& out, std::string* err) {
    out = CliOptions{};

    // Config first so that flags always win regardless of their position.
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == "--help" || a == "-h") {
            out.action = CliAction::Help;
            return kExitOk;
        }
        if (a == "--version" || a == "-v") {
            out.action = CliAction::Version;
            return kExitOk;
        }
        if (a == "--write-default-config") {
            if (!argValue(i, argc, argv, out.defaultConfigPath)) {
                return usageError(err, "Missing value for --write-default-config");
            }
            out.action = CliAction::WriteDefaultConfig;
            return kExitOk;
        }
        if (a == "--config") {
            if (!argValue(i, argc, argv, out.configPath)) {
                return usageError(err, "Missing value for --config");
            }
            std::ifstream f(out.configPath);
            if (!f) {
                if (err) *err = "Unable to open config: " + out.configPath;
                return kExitFailure;
            }
            out.settings = loadSettings(out.configPath);
        }
    }

    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];

        if (a == "--config") {
            ++i;
            continue;
        }
        if (a == "--ascii") {
            out.ascii = true;
            continue;
        }
        if (a == "--ppm") {
            if (!argValue(i, argc, argv, out.ppmPath)) return usageError(err, "Missing value for --ppm");
            continue;
        }
        if (a == "--json-report") {
            if (!argValue(i, argc, argv, out.jsonPath)) return usageError(err, "Missing value for --json-report");
            continue;
        }

        bool handled = false;
        for (const FlagKey& fk : kFlagKeys) {
            if (a != fk.flag) continue;
            std::string v;
            if (!argValue(i, argc, argv, v)) return usageError(err, "Missing value for " + a);
            if (!applySetting(out.settings, fk.key, v)) return usageError(err, "Invalid value for " + a + ": " + v);
            handled = true;
            break;
        }
        if (!handled) return usageError(err, "Unknown argument: " + a);
    }

    return kExitOk;
}

} // namespace procmaps
