#include "layout/layout_cache.hpp"

#include <algorithm>
#include <string>
#include <utility>

#include "layout/precondition.hpp"
#include "utils/log.hpp"

namespace rowscroll::layout {
namespace {
constexpr std::string_view kLogTag = "LayoutCache";
}

LayoutCache::LayoutCache(LayoutEngine engine)
: engine_(std::move(engine)) {}

void LayoutCache::set_engine(LayoutEngine engine) {
    engine_ = std::move(engine);
}

void LayoutCache::recompute_all(const std::vector<int>& row_counts, bool preserve_offsets, float container_width) {
    const int num_rows = static_cast<int>(row_counts.size());
    for (int row = 0; row < num_rows; ++row) {
        const int count = row_counts[static_cast<std::size_t>(row)];
        require(count >= 0, kLogTag,
                "row " + std::to_string(row) + " reports negative item count " + std::to_string(count));
    }

    for (int row = 0; row < num_rows; ++row) {
        const int count = row_counts[static_cast<std::size_t>(row)];
        if (count == 0) {
            erase_row(row);
            continue;
        }
        float offset = 0.0f;
        if (preserve_offsets) {
            auto it = scroll_regions_.find(row);
            if (it != scroll_regions_.end()) {
                offset = it->second.offset;
            }
        }
        store_row(row, count, offset, container_width);
    }

    // Drop rows past the end of the data source.
    scroll_regions_.erase(scroll_regions_.lower_bound(num_rows), scroll_regions_.end());
    item_frames_.erase(item_frames_.lower_bound(num_rows), item_frames_.end());

    rowscroll::log::debug(kLogTag, "Recomputed " + std::to_string(num_rows) + " rows, " +
                                   std::to_string(scroll_regions_.size()) + " with items.");
}

void LayoutCache::clear() {
    item_frames_.clear();
    scroll_regions_.clear();
}

void LayoutCache::materialize_row(int row, int item_count, float container_width) {
    if (item_count <= 0) {
        erase_row(row);
        return;
    }
    store_row(row, item_count, 0.0f, container_width);
}

void LayoutCache::refresh_row(int row, int item_count, float container_width) {
    if (item_count <= 0) {
        erase_row(row);
        return;
    }
    float offset = 0.0f;
    auto it = scroll_regions_.find(row);
    if (it != scroll_regions_.end()) {
        offset = it->second.offset;
    }
    store_row(row, item_count, offset, container_width);
}

void LayoutCache::set_row_offset(int row, float offset) {
    auto region = scroll_regions_.find(row);
    auto frames = item_frames_.find(row);
    require(region != scroll_regions_.end() && frames != item_frames_.end(), kLogTag,
            "cannot set offset for row " + std::to_string(row) + " which is not in the layout");

    for (ItemFrame& item : frames->second) {
        item.translation_x = -offset;
    }
    region->second.offset = offset;
}

void LayoutCache::resize_scroll_regions(float width) {
    for (auto& entry : scroll_regions_) {
        entry.second.frame.w = width;
    }
}

std::optional<ItemFrame> LayoutCache::query_item(int row, int column) const {
    auto it = item_frames_.find(row);
    if (it == item_frames_.end() || column < 0 || column >= static_cast<int>(it->second.size())) {
        return std::nullopt;
    }
    return it->second[static_cast<std::size_t>(column)];
}

VisibleLayout LayoutCache::query_region(const SDL_FRect& /*bounds*/) const {
    VisibleLayout out;
    for (const auto& entry : item_frames_) {
        out.items.insert(out.items.end(), entry.second.begin(), entry.second.end());
    }
    out.scroll_regions.reserve(scroll_regions_.size());
    for (const auto& entry : scroll_regions_) {
        out.scroll_regions.push_back(entry.second);
    }
    return out;
}

std::optional<ScrollRegionDescriptor> LayoutCache::query_scroll_region(int row) const {
    auto it = scroll_regions_.find(row);
    if (it == scroll_regions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<int> LayoutCache::cached_rows() const {
    std::vector<int> rows;
    rows.reserve(scroll_regions_.size());
    for (const auto& entry : scroll_regions_) {
        rows.push_back(entry.first);
    }
    return rows;
}

int LayoutCache::row_item_count(int row) const {
    auto it = item_frames_.find(row);
    return it == item_frames_.end() ? 0 : static_cast<int>(it->second.size());
}

std::optional<float> LayoutCache::max_band_bottom() const {
    if (scroll_regions_.empty()) {
        return std::nullopt;
    }
    float max_y = 0.0f;
    for (const auto& entry : scroll_regions_) {
        max_y = std::max(max_y, rect_max_y(entry.second.frame));
    }
    return max_y;
}

void LayoutCache::store_row(int row, int item_count, float offset, float container_width) {
    ScrollRegionDescriptor region = engine_.compute_row_scroll_region(row, item_count, container_width);
    region.offset = offset;
    item_frames_[row] = engine_.compute_row_item_frames(row, item_count, offset);
    scroll_regions_[row] = region;
}

void LayoutCache::erase_row(int row) {
    item_frames_.erase(row);
    scroll_regions_.erase(row);
}

}
