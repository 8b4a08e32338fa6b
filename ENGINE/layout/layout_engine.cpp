#include "layout/layout_engine.hpp"

#include <string>
#include <utility>

#include "layout/precondition.hpp"

namespace rowscroll::layout {
namespace {
constexpr std::string_view kLogTag = "LayoutEngine";
}

LayoutEngine::LayoutEngine(GridLayoutSettings settings)
: settings_(std::move(settings)) {}

float LayoutEngine::row_origin_y(int row) const {
    return settings_.insets.top + static_cast<float>(row) * settings_.row_stride();
}

float LayoutEngine::row_content_width(int item_count) const {
    if (item_count <= 0) {
        return settings_.insets.left + settings_.insets.right;
    }
    return settings_.insets.left + settings_.insets.right +
           static_cast<float>(item_count) * settings_.item_size.width +
           static_cast<float>(item_count - 1) * settings_.column_spacing;
}

std::vector<ItemFrame> LayoutEngine::compute_row_item_frames(int row, int item_count, float horizontal_offset) const {
    require(item_count >= 0, kLogTag,
            "negative item count " + std::to_string(item_count) + " for row " + std::to_string(row));

    std::vector<ItemFrame> frames;
    frames.reserve(static_cast<std::size_t>(item_count));
    SDL_FRect rect{settings_.insets.left, row_origin_y(row), settings_.item_size.width, settings_.item_size.height};
    for (int column = 0; column < item_count; ++column) {
        ItemFrame item;
        item.index = IndexPath{row, column};
        item.frame = rect;
        item.translation_x = -horizontal_offset;
        item.z_index = kZIndexItem;
        frames.push_back(item);
        rect.x += settings_.column_stride();
    }
    return frames;
}

ScrollRegionDescriptor LayoutEngine::compute_row_scroll_region(int row, int item_count, float container_width) const {
    require(item_count > 0, kLogTag,
            "scroll region requested for row " + std::to_string(row) + " with " + std::to_string(item_count) + " items");

    ScrollRegionDescriptor region;
    region.row = row;
    region.frame = SDL_FRect{0.0f, row_origin_y(row), container_width, settings_.item_size.height};
    region.content_size = Size{row_content_width(item_count), region.frame.h};
    region.offset = 0.0f;
    region.z_index = kZIndexScrollRegion;
    return region;
}

ItemFrame LayoutEngine::compute_single_item_frame(int row, int column, float horizontal_offset) const {
    ItemFrame item;
    item.index = IndexPath{row, column};
    item.frame = SDL_FRect{settings_.insets.left + static_cast<float>(column) * settings_.column_stride(),
                           row_origin_y(row),
                           settings_.item_size.width,
                           settings_.item_size.height};
    item.translation_x = -horizontal_offset;
    item.z_index = kZIndexItem;
    return item;
}

}
