#include "layout/grid_layout.hpp"

#include <string>
#include <utility>

#include "layout/row_count_provider.hpp"
#include "utils/log.hpp"

namespace rowscroll::layout {
namespace {
constexpr std::string_view kLogTag = "GridLayout";

GridLayoutSettings clamped(GridLayoutSettings settings) {
    settings.clamp();
    return settings;
}
}

GridLayout::GridLayout(GridLayoutSettings settings)
: cache_(LayoutEngine{clamped(std::move(settings))}),
  tracker_(cache_) {}

void GridLayout::set_settings(GridLayoutSettings settings) {
    settings.clamp();
    if (settings == this->settings()) {
        return;
    }
    cache_.set_engine(LayoutEngine{std::move(settings)});
    compute_entire_layout(true);
}

void GridLayout::set_row_count_provider(const RowCountProvider* provider) {
    provider_ = provider;
}

void GridLayout::set_invalidation_callback(std::function<void()> callback) {
    invalidation_callback_ = std::move(callback);
}

void GridLayout::prepare() {
    compute_entire_layout(true);
}

void GridLayout::invalidate(const InvalidationContext& context) {
    if (context.invalidate_data_source_counts) {
        compute_entire_layout(true);
    }
}

std::optional<ItemFrame> GridLayout::item_frame(int row, int column) const {
    return cache_.query_item(row, column);
}

VisibleLayout GridLayout::all_visible_frames(const SDL_FRect& region) const {
    return cache_.query_region(region);
}

std::optional<ScrollRegionDescriptor> GridLayout::scroll_region_descriptor(std::string_view kind, int row) const {
    if (kind != kScrollRegionKind) {
        return std::nullopt;
    }
    return cache_.query_scroll_region(row);
}

void GridLayout::begin_update_batch(const std::vector<UpdateItem>& items) {
    tracker_.begin(items, provider_, container_size_.width);
}

void GridLayout::end_update_batch() {
    tracker_.end();
}

bool GridLayout::notify_bounds_changed(Size new_size) {
    const bool changed = new_size != container_size_;
    container_size_ = new_size;
    return changed;
}

Size GridLayout::total_content_extent() const {
    const std::optional<float> max_y = cache_.max_band_bottom();
    if (!max_y) {
        return Size{};
    }
    return Size{container_size_.width, *max_y + settings().insets.bottom};
}

void GridLayout::set_row_scroll_offset(int row, float offset, bool invalidate) {
    cache_.set_row_offset(row, offset);
    if (invalidate && invalidation_callback_) {
        invalidation_callback_();
    }
}

void GridLayout::on_container_resize(float new_width) {
    container_size_.width = new_width;
    cache_.resize_scroll_regions(new_width);
}

void GridLayout::on_full_invalidation(Size new_size) {
    container_size_ = new_size;
    compute_entire_layout(true);
    on_container_resize(new_size.width);
}

void GridLayout::compute_entire_layout(bool preserve_offsets) {
    if (!provider_) {
        rowscroll::log::debug(kLogTag, "No data source attached; clearing layout.");
        cache_.clear();
        return;
    }
    cache_.recompute_all(collect_row_counts(*provider_), preserve_offsets, container_size_.width);
}

}
