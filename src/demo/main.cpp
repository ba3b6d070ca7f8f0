/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

// gridforge_demo [life|langton] [config.json]
//
// Space pauses, N steps one generation while paused, P toggles between
// paced and unthrottled generations, Escape quits.

#include "config/SimulationConfig.hpp"
#include "core/Diagnostics.hpp"
#include "core/Logger.hpp"
#include "core/Simulation.hpp"
#include "core/ThreadSystem.hpp"
#include "rules/LangtonAnt.hpp"
#include "rules/LifeCell.hpp"
#include "rules/Patterns.hpp"
#include <SDL3/SDL.h>
#include <algorithm>
#include <cstdint>
#include <exception>
#include <string>

using namespace GridForge;

namespace {

constexpr int WINDOW_WIDTH{960};
constexpr int WINDOW_HEIGHT{640};
constexpr uint64_t PACED_FRAME_MS{100};

struct Color {
    uint8_t r, g, b;
};

Color colorFor(const EntityView& view) {
    switch (view.kind) {
    case Rules::LIFE_CELL_KIND:
        return view.state ? Color{235, 235, 220} : Color{24, 26, 32};
    case Rules::LANGTON_CELL_KIND:
        return view.state ? Color{20, 20, 20} : Color{230, 230, 230};
    case Rules::LANGTON_ANT_KIND:
        return Color{220, 40, 40};
    default:
        return Color{90, 160, 220};
    }
}

SimulationConfig defaultConfig(const std::string& rule) {
    SimulationConfig config;
    config.topology = Topology::Toroidal;
    if (rule == "langton") {
        config.width = 80;
        config.height = 80;
    } else {
        config.width = 96;
        config.height = 64;
    }
    config.parallel = true;
    return config;
}

Population<Threading::Shared> makePopulation(const std::string& rule, const SimulationConfig& config) {
    const Bounds bounds = config.bounds();
    const Position center{config.width / 2, config.height / 2};
    if (rule == "langton") {
        return Rules::langtonGrid<Threading::Shared>(bounds, center);
    }
    const Rules::Pattern pattern = Rules::acorn();
    return Rules::lifeGrid<Threading::Shared>(
        bounds, pattern, center.translated(-pattern.size.width / 2, -pattern.size.height / 2));
}

void render(SDL_Renderer* renderer, const Snapshot& snapshot) {
    const Bounds& bounds = snapshot.bounds();
    const float cell = std::min(static_cast<float>(WINDOW_WIDTH) / static_cast<float>(bounds.size.width),
                                static_cast<float>(WINDOW_HEIGHT) / static_cast<float>(bounds.size.height));

    SDL_SetRenderDrawColor(renderer, 0, 0, 0, 255);
    SDL_RenderClear(renderer);

    // Identity order: Langton ants are drawn over their floor tiles
    for (const EntityView& view : snapshot) {
        const Color color = colorFor(view);
        SDL_SetRenderDrawColor(renderer, color.r, color.g, color.b, 255);
        SDL_FRect rect;
        rect.x = static_cast<float>(view.footprint.left()) * cell;
        rect.y = static_cast<float>(view.footprint.top()) * cell;
        rect.w = static_cast<float>(view.footprint.size.width) * cell;
        rect.h = static_cast<float>(view.footprint.size.height) * cell;
        SDL_RenderFillRect(renderer, &rect);
    }

    SDL_RenderPresent(renderer);
}

int runViewer(Simulation<Threading::Shared>& simulation, const std::string& rule) {
    if (!SDL_Init(SDL_INIT_VIDEO | SDL_INIT_EVENTS)) {
        DEMO_CRITICAL(std::string("SDL could not initialize: ") + SDL_GetError());
        return 1;
    }

    SDL_Window* window = nullptr;
    SDL_Renderer* renderer = nullptr;
    const std::string title = "GridForge - " + rule;
    if (!SDL_CreateWindowAndRenderer(title.c_str(), WINDOW_WIDTH, WINDOW_HEIGHT, 0, &window, &renderer)) {
        DEMO_CRITICAL(std::string("Window could not be created: ") + SDL_GetError());
        SDL_Quit();
        return 1;
    }

    bool quit = false;
    bool paused = false;
    bool paced = true;
    bool stepOnce = false;
    uint64_t lastStep = 0;
    SDL_Event event;

    while (!quit) {
        while (SDL_PollEvent(&event)) {
            if (event.type == SDL_EVENT_QUIT) {
                quit = true;
            } else if (event.type == SDL_EVENT_KEY_DOWN) {
                switch (event.key.key) {
                case SDLK_ESCAPE:
                    quit = true;
                    break;
                case SDLK_SPACE:
                    paused = !paused;
                    DEMO_INFO(paused ? "Paused" : "Resumed");
                    break;
                case SDLK_N:
                    stepOnce = paused;
                    break;
                case SDLK_P:
                    paced = !paced;
                    DEMO_INFO(paced ? "Paced generations" : "Unthrottled generations");
                    break;
                default:
                    break;
                }
            }
        }

        const uint64_t now = SDL_GetTicks();
        const bool due = !paced || now - lastStep >= PACED_FRAME_MS;
        if ((!paused && due) || stepOnce) {
            const GenerationReport& report = simulation.advanceGeneration();
            if (report.hasDiagnostics()) {
                DEMO_DEBUG(report.summary());
            }
            lastStep = now;
            stepOnce = false;

            const std::string status = title + " - generation " +
                                       std::to_string(simulation.currentGeneration()) +
                                       (paused ? " (paused)" : "");
            SDL_SetWindowTitle(window, status.c_str());
        }

        render(renderer, simulation.snapshot());

        if (paced) {
            SDL_Delay(5);
        }
    }

    SDL_DestroyRenderer(renderer);
    SDL_DestroyWindow(window);
    SDL_Quit();
    return 0;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    const std::string rule = argc > 1 ? argv[1] : "life";
    if (rule != "life" && rule != "langton") {
        DEMO_CRITICAL("Unknown rule '" + rule + "', expected life or langton");
        return 1;
    }

    SimulationConfig config = defaultConfig(rule);
    if (argc > 2 && !config.loadFromFile(argv[2])) {
        DEMO_CRITICAL("Could not load config " + std::string(argv[2]) + ": " + config.getLastError());
        return 1;
    }

    if (config.parallel && !ThreadSystem::Instance().init(config.workerThreads)) {
        DEMO_CRITICAL("Failed to initialize thread system");
        return 1;
    }

    int result = 0;
    try {
        Simulation<Threading::Shared> simulation(config, makePopulation(rule, config));
        result = runViewer(simulation, rule);
    } catch (const ConfigurationError& e) {
        DEMO_CRITICAL(std::string("Configuration error: ") + e.what());
        result = 1;
    } catch (const std::exception& e) {
        DEMO_CRITICAL(std::string("Simulation aborted: ") + e.what());
        result = 1;
    }

    ThreadSystem::Instance().clean();
    return result;
}
