#include "cli_args.hpp"
#include "map_export.hpp"
#include "map_runner.hpp"
#include "settings.hpp"
#include "version.hpp"

#include <cstdint>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

using namespace procmaps;

namespace {

std::string hex64(uint64_t v) {
    std::ostringstream ss;
    ss << "0x" << std::hex << std::setw(16) << std::setfill('0') << v;
    return ss.str();
}

} // namespace

int main(int argc, char** argv) {
    const char* exe = (argc > 0) ? argv[0] : PROCMAPS_APPNAME "_cli";

    CliOptions opts;
    std::string argErr;
    const int parsed = parseCliArgs(argc, argv, opts, &argErr);
    if (parsed == kExitUsage) {
        std::cerr << argErr << "\n\n";
        printCliUsage(std::cerr, exe);
        return parsed;
    }
    if (parsed != kExitOk) {
        std::cerr << "[ERROR] " << argErr << "\n";
        return parsed;
    }

    switch (opts.action) {
        case CliAction::Help:
            printCliUsage(std::cout, exe);
            return kExitOk;
        case CliAction::Version:
            std::cout << PROCMAPS_APPNAME << " " << PROCMAPS_VERSION << "\n";
            return kExitOk;
        case CliAction::WriteDefaultConfig: {
            std::string err;
            if (!writeDefaultSettings(opts.defaultConfigPath, &err)) {
                std::cerr << "[ERROR] " << err << "\n";
                return kExitFailure;
            }
            std::cout << "Wrote " << opts.defaultConfigPath << "\n";
            return kExitOk;
        }
        case CliAction::Generate:
            break;
    }

    const Settings& settings = opts.settings;
    GeneratedMap map;
    MapGenError genErr;
    if (!runGenerator(settings, map, &genErr)) {
        std::cerr << "[ERROR] " << errorKindName(genErr.kind) << ": " << genErr.message << "\n";
        return kExitFailure;
    }

    const uint64_t hash = mapHash(map);
    std::cout << generatorName(map.kind) << " " << map.width() << "x" << map.height()
              << " seed=" << settings.seed << " hash=" << hex64(hash) << "\n";

    if (opts.ascii) {
        std::cout << toAscii(map);
    }

    if (!opts.ppmPath.empty()) {
        std::string err;
        if (!writePpm(opts.ppmPath, rasterize(map), settings.cellSize, &err)) {
            std::cerr << "[ERROR] " << err << "\n";
            return kExitFailure;
        }
        std::cout << "Wrote " << opts.ppmPath << "\n";
    }

    if (!opts.jsonPath.empty()) {
        std::ofstream f(opts.jsonPath);
        if (!f) {
            std::cerr << "[ERROR] Unable to open JSON report: " << opts.jsonPath << "\n";
            return kExitFailure;
        }
        f << "{\n"
          << "\"version\": \"" << jsonEscape(PROCMAPS_VERSION) << "\",\n"
          << "\"seed\": " << settings.seed << ",\n"
          << "\"hash\": \"" << hex64(hash) << "\",\n"
          << "\"map\": ";
        writeJsonSummary(f, map);
        f << "}\n";
        if (!f) {
            std::cerr << "[ERROR] Failed writing JSON report: " << opts.jsonPath << "\n";
            return kExitFailure;
        }
        std::cout << "Wrote " << opts.jsonPath << "\n";
    }

    return kExitOk;
}
