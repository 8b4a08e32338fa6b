#define SDL_MAIN_HANDLED

#include <cstring>
#include <iostream>
#include <string>

#include <nlohmann/json.hpp>

#include "inspect/scenario.hpp"
#include "layout/grid_layout_settings.hpp"
#include "layout/precondition.hpp"
#include "utils/log.hpp"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitBadScenario = 2;
constexpr int kExitPrecondition = 3;

void print_usage(const char* argv0) {
    std::cerr << "usage: " << argv0 << " <scenario.json> [--settings <file>] [--pretty]\n";
}

}

int main(int argc, char* argv[]) {
    // stdout carries the snapshot.
    rowscroll::log::set_default_level(rowscroll::log::Level::Error);

    std::string scenario_path;
    std::string settings_path;
    bool pretty = false;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--pretty") == 0) {
            pretty = true;
        } else if (std::strcmp(argv[i], "--settings") == 0) {
            if (i + 1 >= argc) {
                print_usage(argv[0]);
                return kExitUsage;
            }
            settings_path = argv[++i];
        } else if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return kExitOk;
        } else if (scenario_path.empty()) {
            scenario_path = argv[i];
        } else {
            print_usage(argv[0]);
            return kExitUsage;
        }
    }
    if (scenario_path.empty()) {
        print_usage(argv[0]);
        return kExitUsage;
    }

    rowscroll::inspect::Scenario scenario;
    std::string reason;
    if (!rowscroll::inspect::load_scenario_file(scenario_path, scenario, &reason)) {
        rowscroll::log::error("Main", "Cannot load scenario: " + reason);
        return kExitBadScenario;
    }
    if (!settings_path.empty() &&
        !rowscroll::layout::load_grid_layout_settings(settings_path, scenario.settings)) {
        rowscroll::log::error("Main", "Cannot load settings: " + settings_path);
        return kExitBadScenario;
    }
    rowscroll::log::debug("Main", "Loaded scenario with " + std::to_string(scenario.rows.size()) + " rows and " +
                                  std::to_string(scenario.steps.size()) + " steps.");

    try {
        const nlohmann::json snapshot = rowscroll::inspect::run_scenario(scenario);
        std::cout << snapshot.dump(pretty ? 2 : -1) << '\n';
    } catch (const rowscroll::layout::PreconditionViolation& e) {
        rowscroll::log::error("Main", std::string{"Scenario aborted: "} + e.what());
        return kExitPrecondition;
    }
    return kExitOk;
}
