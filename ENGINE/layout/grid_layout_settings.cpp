#include "layout/grid_layout_settings.hpp"

#include <algorithm>
#include <fstream>
#include <initializer_list>

#include <nlohmann/json.hpp>

#include "utils/log.hpp"

namespace rowscroll::layout {
namespace {

constexpr float kMinItemDimension = 1.0f;
constexpr float kMinSpacing = 0.0f;
constexpr std::string_view kLogTag = "GridLayoutSettings";

// First numeric value found under any of the keys.
bool read_number(const nlohmann::json& obj, std::initializer_list<const char*> keys, float& out) {
    for (const char* key : keys) {
        auto it = obj.find(key);
        if (it == obj.end()) {
            continue;
        }
        if (!it->is_number()) {
            rowscroll::log::warn(kLogTag, std::string{"Ignoring non-numeric '"} + key + "'.");
            continue;
        }
        out = it->get<float>();
        return true;
    }
    return false;
}

void read_item_size(const nlohmann::json& obj, Size& size) {
    auto it = obj.find("item_size");
    if (it != obj.end() && it->is_object()) {
        read_number(*it, {"width", "w"}, size.width);
        read_number(*it, {"height", "h"}, size.height);
        return;
    }
    read_number(obj, {"item_width"}, size.width);
    read_number(obj, {"item_height"}, size.height);
}

void read_insets(const nlohmann::json& obj, EdgeInsets& insets) {
    auto it = obj.find("edge_insets");
    if (it == obj.end()) {
        return;
    }
    if (it->is_number()) {
        const float all = it->get<float>();
        insets = EdgeInsets{all, all, all, all};
        return;
    }
    if (!it->is_object()) {
        rowscroll::log::warn(kLogTag, "Ignoring malformed 'edge_insets'.");
        return;
    }
    read_number(*it, {"top"}, insets.top);
    read_number(*it, {"left"}, insets.left);
    read_number(*it, {"bottom"}, insets.bottom);
    read_number(*it, {"right"}, insets.right);
}

}

GridLayoutSettings GridLayoutSettings::defaults() {
    return GridLayoutSettings{};
}

GridLayoutSettings GridLayoutSettings::from_json(const nlohmann::json* obj) {
    GridLayoutSettings settings = defaults();
    if (!obj || !obj->is_object()) {
        return settings;
    }
    read_item_size(*obj, settings.item_size);
    read_number(*obj, {"column_spacing", "item_horizontal_spacing"}, settings.column_spacing);
    read_number(*obj, {"row_spacing", "item_vertical_spacing"}, settings.row_spacing);
    read_insets(*obj, settings.insets);
    settings.clamp();
    return settings;
}

void GridLayoutSettings::clamp() {
    item_size.width = std::max(kMinItemDimension, item_size.width);
    item_size.height = std::max(kMinItemDimension, item_size.height);
    column_spacing = std::max(kMinSpacing, column_spacing);
    row_spacing = std::max(kMinSpacing, row_spacing);
    insets.top = std::max(kMinSpacing, insets.top);
    insets.left = std::max(kMinSpacing, insets.left);
    insets.bottom = std::max(kMinSpacing, insets.bottom);
    insets.right = std::max(kMinSpacing, insets.right);
}

void GridLayoutSettings::apply_to_json(nlohmann::json& obj) const {
    if (!obj.is_object()) {
        obj = nlohmann::json::object();
    }
    obj["item_size"] = nlohmann::json{{"width", item_size.width}, {"height", item_size.height}};
    obj["column_spacing"] = column_spacing;
    obj["row_spacing"] = row_spacing;
    obj["edge_insets"] = nlohmann::json{
        {"top", insets.top}, {"left", insets.left}, {"bottom", insets.bottom}, {"right", insets.right}};
}

bool operator==(const GridLayoutSettings& a, const GridLayoutSettings& b) {
    return a.item_size == b.item_size &&
           a.column_spacing == b.column_spacing &&
           a.row_spacing == b.row_spacing &&
           a.insets.top == b.insets.top && a.insets.left == b.insets.left &&
           a.insets.bottom == b.insets.bottom && a.insets.right == b.insets.right;
}

bool load_grid_layout_settings(const std::filesystem::path& file, GridLayoutSettings& out) {
    std::ifstream in(file);
    if (!in.is_open()) {
        rowscroll::log::warn(kLogTag, "Cannot open settings file: " + file.string());
        return false;
    }
    nlohmann::json data = nlohmann::json::parse(in, nullptr, false);
    if (data.is_discarded()) {
        rowscroll::log::warn(kLogTag, "Settings file is not valid JSON: " + file.string());
        return false;
    }
    out = GridLayoutSettings::from_json(&data);
    return true;
}

}
