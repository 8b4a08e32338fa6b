#pragma once

#include <nlohmann/json_fwd.hpp>

#include "layout/layout_types.hpp"

namespace rowscroll::layout {

class GridLayout;

nlohmann::json rect_to_json(const SDL_FRect& rect);
nlohmann::json size_to_json(const Size& size);
nlohmann::json item_frame_to_json(const ItemFrame& item);
nlohmann::json scroll_region_to_json(const ScrollRegionDescriptor& region);

// Settings, container, content extent and every cached row.
nlohmann::json layout_snapshot_to_json(const GridLayout& layout);

}
