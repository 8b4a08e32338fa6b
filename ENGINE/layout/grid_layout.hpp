#pragma once

#include <functional>
#include <optional>
#include <string_view>
#include <vector>

#include "layout/grid_layout_settings.hpp"
#include "layout/layout_cache.hpp"
#include "layout/layout_types.hpp"
#include "layout/update_tracker.hpp"

namespace rowscroll::layout {

class RowCountProvider;

struct InvalidationContext {
    bool invalidate_data_source_counts = false;
};

// Layout for a vertical stack of rows that each scroll horizontally on their
// own. The host owns the data source and the container; this class owns every
// computed frame and is driven only through the calls below, on one thread.
class GridLayout {
public:
    explicit GridLayout(GridLayoutSettings settings = GridLayoutSettings::defaults());

    GridLayout(const GridLayout&) = delete;
    GridLayout& operator=(const GridLayout&) = delete;

    const GridLayoutSettings& settings() const { return cache_.engine().settings(); }
    // Replaces the settings and rebuilds the layout, keeping row offsets.
    void set_settings(GridLayoutSettings settings);

    // Non-owning. nullptr detaches the data source and empties the layout on
    // the next full computation.
    void set_row_count_provider(const RowCountProvider* provider);
    const RowCountProvider* row_count_provider() const { return provider_; }

    void set_container_size(Size size) { container_size_ = size; }
    Size container_size() const { return container_size_; }

    void set_invalidation_callback(std::function<void()> callback);

    void prepare();
    void invalidate(const InvalidationContext& context);

    std::optional<ItemFrame> item_frame(int row, int column) const;
    VisibleLayout all_visible_frames(const SDL_FRect& region) const;
    std::optional<ScrollRegionDescriptor> scroll_region_descriptor(std::string_view kind, int row) const;

    void begin_update_batch(const std::vector<UpdateItem>& items);
    void end_update_batch();

    // True when new_size differs from the recorded container size. The new size
    // is recorded either way.
    bool notify_bounds_changed(Size new_size);
    Size total_content_extent() const;

    // Throws PreconditionViolation when the row is not laid out.
    void set_row_scroll_offset(int row, float offset, bool invalidate = true);

    void on_container_resize(float new_width);
    void on_full_invalidation(Size new_size);

    const LayoutCache& cache() const { return cache_; }
    const UpdateTracker& tracker() const { return tracker_; }

private:
    void compute_entire_layout(bool preserve_offsets);

    const RowCountProvider* provider_ = nullptr;
    Size container_size_{};
    LayoutCache cache_;
    UpdateTracker tracker_;
    std::function<void()> invalidation_callback_{};
};

}
