#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "layout/grid_layout_settings.hpp"
#include "layout/layout_types.hpp"
#include "layout/update_tracker.hpp"

namespace rowscroll::inspect {

struct ScenarioStep {
    enum class Kind {
        Scroll,
        Resize,
        Batch,
        Invalidate,
    };

    Kind kind = Kind::Invalidate;
    int row = 0;
    float offset = 0.0f;
    layout::Size size{};
    // Batch only: counts after the mutation, and the mutations themselves.
    std::vector<int> rows;
    std::vector<layout::UpdateItem> updates;
};

struct Scenario {
    layout::GridLayoutSettings settings = layout::GridLayoutSettings::defaults();
    layout::Size container{};
    std::vector<int> rows;
    std::vector<ScenarioStep> steps;
};

bool parse_scenario(const nlohmann::json& data, Scenario& out, std::string* reason = nullptr);
bool load_scenario_file(const std::filesystem::path& file, Scenario& out, std::string* reason = nullptr);

// Plays the scenario against a fresh layout and returns the final snapshot plus
// a per-batch summary. Throws layout::PreconditionViolation on host misuse.
nlohmann::json run_scenario(const Scenario& scenario);

}
