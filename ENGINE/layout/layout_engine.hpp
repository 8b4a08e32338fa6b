#pragma once

#include <vector>

#include "layout/grid_layout_settings.hpp"
#include "layout/layout_types.hpp"

namespace rowscroll::layout {

// Stateless geometry for rows of fixed-size items. Every result depends only on
// the settings and the arguments.
class LayoutEngine {
public:
    explicit LayoutEngine(GridLayoutSettings settings = GridLayoutSettings::defaults());

    const GridLayoutSettings& settings() const { return settings_; }

    float row_origin_y(int row) const;
    float row_content_width(int item_count) const;

    // Throws PreconditionViolation when item_count is negative.
    std::vector<ItemFrame> compute_row_item_frames(int row, int item_count, float horizontal_offset) const;

    // Throws PreconditionViolation when item_count is not positive; an empty row
    // has no scroll region.
    ScrollRegionDescriptor compute_row_scroll_region(int row, int item_count, float container_width) const;

    ItemFrame compute_single_item_frame(int row, int column, float horizontal_offset) const;

private:
    GridLayoutSettings settings_;
};

}
