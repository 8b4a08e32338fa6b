#include "inspect/scenario.hpp"

#include <fstream>
#include <utility>

#include <nlohmann/json.hpp>

#include "layout/grid_layout.hpp"
#include "layout/layout_json.hpp"
#include "layout/row_count_provider.hpp"
#include "utils/log.hpp"

namespace rowscroll::inspect {
namespace {

constexpr std::string_view kLogTag = "Scenario";

bool fail(std::string* reason, const std::string& message) {
    if (reason) {
        *reason = message;
    }
    return false;
}

bool read_size(const nlohmann::json& obj, layout::Size& out) {
    if (!obj.is_object() || !obj.contains("width") || !obj.contains("height") ||
        !obj["width"].is_number() || !obj["height"].is_number()) {
        return false;
    }
    out = layout::Size{obj["width"].get<float>(), obj["height"].get<float>()};
    return true;
}

bool read_counts(const nlohmann::json& arr, std::vector<int>& out) {
    if (!arr.is_array()) {
        return false;
    }
    std::vector<int> counts;
    counts.reserve(arr.size());
    for (const auto& value : arr) {
        if (!value.is_number_integer()) {
            return false;
        }
        counts.push_back(value.get<int>());
    }
    out = std::move(counts);
    return true;
}

bool read_update(const nlohmann::json& obj, layout::UpdateItem& out, std::string* reason) {
    if (!obj.is_object() || !obj.contains("action") || !obj["action"].is_string()) {
        return fail(reason, "update entry needs an 'action' string");
    }
    const std::string action = obj["action"].get<std::string>();
    if (action == "insert") {
        out.action = layout::UpdateAction::Insert;
    } else if (action == "delete") {
        out.action = layout::UpdateAction::Delete;
    } else {
        return fail(reason, "unknown update action '" + action + "'");
    }
    out.row.reset();
    out.column.reset();
    if (obj.contains("row") && obj["row"].is_number_integer()) {
        out.row = obj["row"].get<int>();
    }
    if (obj.contains("column") && obj["column"].is_number_integer()) {
        out.column = obj["column"].get<int>();
    }
    return true;
}

bool read_step(const nlohmann::json& obj, ScenarioStep& step, std::string* reason) {
    if (!obj.is_object() || !obj.contains("op") || !obj["op"].is_string()) {
        return fail(reason, "step needs an 'op' string");
    }
    const std::string op = obj["op"].get<std::string>();
    if (op == "scroll") {
        if (!obj.contains("row") || !obj["row"].is_number_integer() ||
            !obj.contains("offset") || !obj["offset"].is_number()) {
            return fail(reason, "scroll step needs integer 'row' and numeric 'offset'");
        }
        step.kind = ScenarioStep::Kind::Scroll;
        step.row = obj["row"].get<int>();
        step.offset = obj["offset"].get<float>();
        return true;
    }
    if (op == "resize") {
        step.kind = ScenarioStep::Kind::Resize;
        if (!read_size(obj, step.size)) {
            return fail(reason, "resize step needs numeric 'width' and 'height'");
        }
        return true;
    }
    if (op == "batch") {
        step.kind = ScenarioStep::Kind::Batch;
        if (!obj.contains("rows") || !read_counts(obj["rows"], step.rows)) {
            return fail(reason, "batch step needs a 'rows' array of integers");
        }
        if (obj.contains("updates")) {
            if (!obj["updates"].is_array()) {
                return fail(reason, "batch 'updates' must be an array");
            }
            for (const auto& entry : obj["updates"]) {
                layout::UpdateItem item;
                if (!read_update(entry, item, reason)) {
                    return false;
                }
                step.updates.push_back(item);
            }
        }
        return true;
    }
    if (op == "invalidate") {
        step.kind = ScenarioStep::Kind::Invalidate;
        return true;
    }
    return fail(reason, "unknown step op '" + op + "'");
}

nlohmann::json index_paths_to_json(const std::vector<layout::IndexPath>& paths) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& path : paths) {
        out.push_back(nlohmann::json{{"row", path.row}, {"column", path.column}});
    }
    return out;
}

}

bool parse_scenario(const nlohmann::json& data, Scenario& out, std::string* reason) {
    if (!data.is_object()) {
        return fail(reason, "scenario must be a JSON object");
    }
    Scenario scenario;
    if (data.contains("settings")) {
        const nlohmann::json& settings = data["settings"];
        scenario.settings = layout::GridLayoutSettings::from_json(&settings);
    }
    if (!data.contains("container") || !read_size(data["container"], scenario.container)) {
        return fail(reason, "scenario needs a 'container' with numeric 'width' and 'height'");
    }
    if (!data.contains("rows") || !read_counts(data["rows"], scenario.rows)) {
        return fail(reason, "scenario needs a 'rows' array of integers");
    }
    if (data.contains("steps")) {
        if (!data["steps"].is_array()) {
            return fail(reason, "'steps' must be an array");
        }
        for (const auto& entry : data["steps"]) {
            ScenarioStep step;
            if (!read_step(entry, step, reason)) {
                return false;
            }
            scenario.steps.push_back(std::move(step));
        }
    }
    out = std::move(scenario);
    return true;
}

bool load_scenario_file(const std::filesystem::path& file, Scenario& out, std::string* reason) {
    std::ifstream in(file);
    if (!in.is_open()) {
        return fail(reason, "cannot open " + file.string());
    }
    nlohmann::json data = nlohmann::json::parse(in, nullptr, false);
    if (data.is_discarded()) {
        return fail(reason, file.string() + " is not valid JSON");
    }
    return parse_scenario(data, out, reason);
}

nlohmann::json run_scenario(const Scenario& scenario) {
    layout::StaticRowCountProvider provider(scenario.rows);
    layout::GridLayout grid(scenario.settings);
    grid.set_row_count_provider(&provider);
    grid.set_container_size(scenario.container);

    int redraw_requests = 0;
    grid.set_invalidation_callback([&redraw_requests]() { ++redraw_requests; });
    grid.prepare();

    nlohmann::json batches = nlohmann::json::array();
    for (const ScenarioStep& step : scenario.steps) {
        switch (step.kind) {
            case ScenarioStep::Kind::Scroll:
                grid.set_row_scroll_offset(step.row, step.offset);
                break;
            case ScenarioStep::Kind::Resize:
                if (grid.notify_bounds_changed(step.size)) {
                    grid.on_full_invalidation(step.size);
                } else {
                    rowscroll::log::debug(kLogTag, "Resize to the current size ignored.");
                }
                break;
            case ScenarioStep::Kind::Batch: {
                provider.set_counts(step.rows);
                grid.begin_update_batch(step.updates);
                const layout::UpdateTracker& tracker = grid.tracker();
                batches.push_back(nlohmann::json{
                    {"inserted_rows", tracker.inserted_rows()},
                    {"removed_rows", tracker.removed_rows()},
                    {"inserted_items", index_paths_to_json(tracker.inserted_items())},
                    {"removed_items", index_paths_to_json(tracker.removed_items())},
                });
                grid.end_update_batch();
                grid.invalidate(layout::InvalidationContext{true});
                break;
            }
            case ScenarioStep::Kind::Invalidate:
                grid.invalidate(layout::InvalidationContext{true});
                break;
        }
    }

    nlohmann::json out = layout::layout_snapshot_to_json(grid);
    out["batches"] = std::move(batches);
    out["redraw_requests"] = redraw_requests;
    return out;
}

}
