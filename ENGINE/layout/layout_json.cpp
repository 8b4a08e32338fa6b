#include "layout/layout_json.hpp"

#include <string>
#include <utility>

#include <nlohmann/json.hpp>

#include "layout/grid_layout.hpp"

namespace rowscroll::layout {

nlohmann::json rect_to_json(const SDL_FRect& rect) {
    return nlohmann::json{{"x", rect.x}, {"y", rect.y}, {"w", rect.w}, {"h", rect.h}};
}

nlohmann::json size_to_json(const Size& size) {
    return nlohmann::json{{"width", size.width}, {"height", size.height}};
}

nlohmann::json item_frame_to_json(const ItemFrame& item) {
    return nlohmann::json{
        {"row", item.index.row},
        {"column", item.index.column},
        {"frame", rect_to_json(item.frame)},
        {"translation_x", item.translation_x},
        {"z_index", item.z_index},
    };
}

nlohmann::json scroll_region_to_json(const ScrollRegionDescriptor& region) {
    return nlohmann::json{
        {"kind", std::string(kScrollRegionKind)},
        {"row", region.row},
        {"frame", rect_to_json(region.frame)},
        {"content_size", size_to_json(region.content_size)},
        {"offset", region.offset},
        {"z_index", region.z_index},
    };
}

nlohmann::json layout_snapshot_to_json(const GridLayout& layout) {
    nlohmann::json out = nlohmann::json::object();
    nlohmann::json settings = nlohmann::json::object();
    layout.settings().apply_to_json(settings);
    out["settings"] = std::move(settings);
    out["container"] = size_to_json(layout.container_size());
    out["content_extent"] = size_to_json(layout.total_content_extent());

    nlohmann::json rows = nlohmann::json::array();
    const LayoutCache& cache = layout.cache();
    for (int row : cache.cached_rows()) {
        nlohmann::json entry = nlohmann::json::object();
        entry["row"] = row;
        if (auto region = cache.query_scroll_region(row)) {
            entry["scroll_region"] = scroll_region_to_json(*region);
        }
        nlohmann::json items = nlohmann::json::array();
        const int count = cache.row_item_count(row);
        for (int column = 0; column < count; ++column) {
            if (auto item = cache.query_item(row, column)) {
                items.push_back(item_frame_to_json(*item));
            }
        }
        entry["items"] = std::move(items);
        rows.push_back(std::move(entry));
    }
    out["rows"] = std::move(rows);
    return out;
}

}
