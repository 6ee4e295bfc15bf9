#define SDL_MAIN_HANDLED
#include <SDL.h>

#include "map_runner.hpp"
#include "settings.hpp"
#include "version.hpp"

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>

using namespace procmaps;

static std::optional<std::string> parseStringArg(int argc, char** argv, const char* opt) {
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == opt && i + 1 < argc) {
            return std::string(argv[i + 1]);
        }
    }
    return std::nullopt;
}

static bool hasFlag(int argc, char** argv, const char* flag) {
    for (int i = 1; i < argc; ++i) {
        if (std::string(argv[i]) == flag) return true;
    }
    return false;
}

static void printUsage(const char* exe) {
    std::cout
        << PROCMAPS_APPNAME << " viewer " << PROCMAPS_VERSION << "\n"
        << "Usage: " << (exe ? exe : "procmaps_view") << " [options]\n\n"
        << "Options:\n"
        << "  --config <path>      Load settings from an INI file\n"
        << "  --gen <name>         charge | walk | regions\n"
        << "  --seed <n>           RNG seed\n"
        << "\n"
        << "Keys: 1/2/3 switch generator, R next seed, Esc quit\n";
}

// Owns the window/renderer/texture trio for the lifetime of the viewer.
class MapView {
public:
    ~MapView() { shutdown(); }

    bool init(int w, int h) {
        SDL_SetHint(SDL_HINT_RENDER_SCALE_QUALITY, "0"); // nearest-neighbor

        const std::string title = std::string(PROCMAPS_APPNAME) + " v" + PROCMAPS_VERSION;
        window = SDL_CreateWindow(title.c_str(),
                                  SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
                                  w, h,
                                  SDL_WINDOW_SHOWN | SDL_WINDOW_RESIZABLE);
        if (!window) {
            std::cerr << "SDL_CreateWindow failed: " << SDL_GetError() << "\n";
            return false;
        }

        renderer = SDL_CreateRenderer(window, -1, SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC);
        if (!renderer) {
            std::cerr << "SDL_CreateRenderer failed: " << SDL_GetError() << "\n";
            SDL_DestroyWindow(window); window = nullptr;
            return false;
        }
        return true;
    }

    void shutdown() {
        if (texture) { SDL_DestroyTexture(texture); texture = nullptr; }
        if (renderer) { SDL_DestroyRenderer(renderer); renderer = nullptr; }
        if (window) { SDL_DestroyWindow(window); window = nullptr; }
    }

    bool upload(const MapImage& img) {
        if (texture && (img.width != texW || img.height != texH)) {
            SDL_DestroyTexture(texture);
            texture = nullptr;
        }
        if (!texture) {
            texture = SDL_CreateTexture(renderer, SDL_PIXELFORMAT_RGBA32, SDL_TEXTUREACCESS_STREAMING,
                                        img.width, img.height);
            if (!texture) {
                std::cerr << "SDL_CreateTexture failed: " << SDL_GetError() << "\n";
                return false;
            }
            texW = img.width;
            texH = img.height;
            SDL_RenderSetLogicalSize(renderer, texW, texH);
        }

        // Color is laid out r,g,b,a in memory, which is what RGBA32 means.
        if (SDL_UpdateTexture(texture, nullptr, img.pixels.data(), img.width * 4) != 0) {
            std::cerr << "SDL_UpdateTexture failed: " << SDL_GetError() << "\n";
            return false;
        }
        return true;
    }

    void draw() {
        SDL_SetRenderDrawColor(renderer, 0, 0, 0, 255);
        SDL_RenderClear(renderer);
        if (texture) SDL_RenderCopy(renderer, texture, nullptr, nullptr);
        SDL_RenderPresent(renderer);
    }

    void setTitle(const std::string& s) {
        if (window) SDL_SetWindowTitle(window, s.c_str());
    }

private:
    SDL_Window* window = nullptr;
    SDL_Renderer* renderer = nullptr;
    SDL_Texture* texture = nullptr;
    int texW = 0;
    int texH = 0;
};

static bool regenerate(const Settings& s, MapView& view) {
    GeneratedMap map;
    MapGenError err;
    if (!runGenerator(s, map, &err)) {
        std::cerr << "[ERROR] " << errorKindName(err.kind) << ": " << err.message << "\n";
        return false;
    }
    if (!view.upload(rasterize(map))) return false;

    view.setTitle(std::string(PROCMAPS_APPNAME) + " - " + generatorName(s.generator) +
                  " seed " + std::to_string(s.seed));
    std::cout << generatorName(s.generator) << " seed=" << s.seed << "\n";
    return true;
}

int main(int argc, char** argv) {
    if (hasFlag(argc, argv, "--help") || hasFlag(argc, argv, "-h")) {
        printUsage(argc > 0 ? argv[0] : "procmaps_view");
        return 0;
    }

    Settings settings;
    if (const auto cfg = parseStringArg(argc, argv, "--config")) {
        settings = loadSettings(*cfg);
    }
    if (const auto gen = parseStringArg(argc, argv, "--gen")) {
        if (!applySetting(settings, "generator", *gen)) {
            std::cerr << "Unknown generator: " << *gen << "\n";
            return 2;
        }
    }
    if (const auto seed = parseStringArg(argc, argv, "--seed")) {
        if (!applySetting(settings, "seed", *seed)) {
            std::cerr << "Invalid seed: " << *seed << "\n";
            return 2;
        }
    }

    if (SDL_Init(SDL_INIT_VIDEO) != 0) {
        std::cerr << "SDL_Init failed: " << SDL_GetError() << "\n";
        return 1;
    }

    const int winW = std::clamp(settings.width * settings.cellSize, 200, 1600);
    const int winH = std::clamp(settings.height * settings.cellSize, 200, 1000);

    int exitCode = 0;
    {
        MapView view;
        if (!view.init(winW, winH) || !regenerate(settings, view)) {
            exitCode = 1;
        } else {
            bool running = true;
            while (running) {
                SDL_Event ev;
                while (SDL_PollEvent(&ev)) {
                    if (ev.type == SDL_QUIT) {
                        running = false;
                        break;
                    }
                    if (ev.type != SDL_KEYDOWN || ev.key.repeat != 0) continue;

                    bool changed = true;
                    switch (ev.key.keysym.sym) {
                        case SDLK_ESCAPE: running = false; changed = false; break;
                        case SDLK_1: settings.generator = GeneratorKind::Charge; break;
                        case SDLK_2: settings.generator = GeneratorKind::Walk; break;
                        case SDLK_3: settings.generator = GeneratorKind::Regions; break;
                        case SDLK_r: settings.seed += 1u; break;
                        default: changed = false; break;
                    }
                    if (changed && !regenerate(settings, view)) {
                        exitCode = 1;
                        running = false;
                    }
                }

                view.draw();
                SDL_Delay(16);
            }
        }
    }

    SDL_Quit();
    return exitCode;
}
