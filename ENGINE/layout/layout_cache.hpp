#pragma once

#include <map>
#include <optional>
#include <vector>

#include "layout/layout_engine.hpp"
#include "layout/layout_types.hpp"

namespace rowscroll::layout {

// Row index -> item frames and scroll region. Only rows with at least one item
// have entries.
class LayoutCache {
public:
    explicit LayoutCache(LayoutEngine engine = LayoutEngine{});

    const LayoutEngine& engine() const { return engine_; }
    void set_engine(LayoutEngine engine);

    void recompute_all(const std::vector<int>& row_counts, bool preserve_offsets, float container_width);
    void clear();

    // Fresh entry with a zero offset. An empty row loses its entry.
    void materialize_row(int row, int item_count, float container_width);
    // Rebuilds frames and content size, keeping the row's current offset.
    void refresh_row(int row, int item_count, float container_width);

    // Throws PreconditionViolation when the row has no entry.
    void set_row_offset(int row, float offset);
    void resize_scroll_regions(float width);

    std::optional<ItemFrame> query_item(int row, int column) const;
    VisibleLayout query_region(const SDL_FRect& bounds) const;
    std::optional<ScrollRegionDescriptor> query_scroll_region(int row) const;

    bool empty() const { return scroll_regions_.empty() && item_frames_.empty(); }
    int row_count() const { return static_cast<int>(scroll_regions_.size()); }
    std::vector<int> cached_rows() const;
    int row_item_count(int row) const;
    // Largest band bottom edge, or nullopt when no scroll region is cached.
    std::optional<float> max_band_bottom() const;

private:
    void store_row(int row, int item_count, float offset, float container_width);
    void erase_row(int row);

    LayoutEngine engine_;
    std::map<int, std::vector<ItemFrame>> item_frames_;
    std::map<int, ScrollRegionDescriptor> scroll_regions_;
};

}
