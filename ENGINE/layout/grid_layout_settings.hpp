#pragma once

#include <filesystem>

#include <nlohmann/json_fwd.hpp>

#include "layout/layout_types.hpp"

namespace rowscroll::layout {

struct GridLayoutSettings {
    Size       item_size{200.0f, 120.0f};
    float      column_spacing = 7.0f;
    float      row_spacing = 15.0f;
    EdgeInsets insets{15.0f, 15.0f, 15.0f, 15.0f};

    static GridLayoutSettings defaults();
    static GridLayoutSettings from_json(const nlohmann::json* obj);

    void clamp();
    void apply_to_json(nlohmann::json& obj) const;

    // Distance between the tops of two consecutive rows.
    float row_stride() const { return item_size.height + row_spacing; }
    // Distance between the left edges of two consecutive items.
    float column_stride() const { return item_size.width + column_spacing; }
};

bool operator==(const GridLayoutSettings& a, const GridLayoutSettings& b);
inline bool operator!=(const GridLayoutSettings& a, const GridLayoutSettings& b) { return !(a == b); }

bool load_grid_layout_settings(const std::filesystem::path& file, GridLayoutSettings& out);

}
