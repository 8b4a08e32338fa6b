#pragma once

#include <SDL.h>

#include <string_view>
#include <vector>

namespace rowscroll::layout {

constexpr int kZIndexItem = 0;
constexpr int kZIndexScrollRegion = 1;

// Supplementary element kind used by hosts to ask for a row's scroll region.
constexpr std::string_view kScrollRegionKind = "RowScrollRegion";

struct Size {
    float width  = 0.0f;
    float height = 0.0f;

    bool is_empty() const { return width <= 0.0f || height <= 0.0f; }
};

inline bool operator==(const Size& a, const Size& b) {
    return a.width == b.width && a.height == b.height;
}
inline bool operator!=(const Size& a, const Size& b) { return !(a == b); }

struct EdgeInsets {
    float top    = 0.0f;
    float left   = 0.0f;
    float bottom = 0.0f;
    float right  = 0.0f;
};

struct IndexPath {
    int row    = 0;
    int column = 0;
};

inline bool operator==(const IndexPath& a, const IndexPath& b) {
    return a.row == b.row && a.column == b.column;
}
inline bool operator!=(const IndexPath& a, const IndexPath& b) { return !(a == b); }

inline bool rects_equal(const SDL_FRect& a, const SDL_FRect& b) {
    return a.x == b.x && a.y == b.y && a.w == b.w && a.h == b.h;
}

inline float rect_max_x(const SDL_FRect& r) { return r.x + r.w; }
inline float rect_max_y(const SDL_FRect& r) { return r.y + r.h; }

// Placement of one cell. translation_x is the negated scroll offset of the row.
struct ItemFrame {
    IndexPath index{};
    SDL_FRect frame{0.0f, 0.0f, 0.0f, 0.0f};
    float     translation_x = 0.0f;
    int       z_index = kZIndexItem;
};

inline bool operator==(const ItemFrame& a, const ItemFrame& b) {
    return a.index == b.index && rects_equal(a.frame, b.frame) &&
           a.translation_x == b.translation_x && a.z_index == b.z_index;
}
inline bool operator!=(const ItemFrame& a, const ItemFrame& b) { return !(a == b); }

struct ScrollRegionDescriptor {
    int       row = 0;
    SDL_FRect frame{0.0f, 0.0f, 0.0f, 0.0f};
    Size      content_size{};
    float     offset = 0.0f;
    int       z_index = kZIndexScrollRegion;
};

inline bool operator==(const ScrollRegionDescriptor& a, const ScrollRegionDescriptor& b) {
    return a.row == b.row && rects_equal(a.frame, b.frame) && a.content_size == b.content_size &&
           a.offset == b.offset && a.z_index == b.z_index;
}
inline bool operator!=(const ScrollRegionDescriptor& a, const ScrollRegionDescriptor& b) { return !(a == b); }

struct VisibleLayout {
    std::vector<ItemFrame> items;
    std::vector<ScrollRegionDescriptor> scroll_regions;
};

}
