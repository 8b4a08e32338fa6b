#include "doctest/doctest.h"

#include <utility>
#include <vector>

#include "layout/grid_layout.hpp"
#include "layout/precondition.hpp"
#include "layout/row_count_provider.hpp"
#include "utils/log.hpp"

using namespace rowscroll::layout;

namespace {

struct Host {
    StaticRowCountProvider provider;
    GridLayout layout;

    explicit Host(std::vector<int> counts, Size size = Size{800.0f, 600.0f})
    : provider(std::move(counts)) {
        layout.set_row_count_provider(&provider);
        layout.set_container_size(size);
        layout.prepare();
    }
};

}

TEST_CASE("Empty layout reports a zero content extent") {
    GridLayout layout;
    layout.set_container_size(Size{800.0f, 600.0f});
    layout.prepare();
    CHECK(layout.cache().empty());
    CHECK(layout.total_content_extent() == Size{});
}

TEST_CASE("Content extent of a single row is insets plus item height") {
    Host host({3});
    const Size extent = host.layout.total_content_extent();
    CHECK(extent.width == doctest::Approx(800.0f));
    CHECK(extent.height == doctest::Approx(15.0f + 120.0f + 15.0f));
}

TEST_CASE("Content extent follows the lowest band") {
    Host host({1, 1, 1});
    CHECK(host.layout.total_content_extent().height == doctest::Approx(15.0f + 2.0f * 135.0f + 120.0f + 15.0f));
}

TEST_CASE("Detaching the data source clears the layout") {
    Host host({2, 2});
    REQUIRE_FALSE(host.layout.cache().empty());
    host.layout.set_row_count_provider(nullptr);
    host.layout.invalidate(InvalidationContext{true});
    CHECK(host.layout.cache().empty());
    CHECK_FALSE(host.layout.item_frame(0, 0).has_value());
}

TEST_CASE("A data source emptied to zero rows leaves a zero content extent") {
    Host host({2, 3, 1});
    host.layout.set_row_scroll_offset(1, 40.0f, false);
    REQUIRE(host.layout.total_content_extent().height > 0.0f);

    host.provider.set_counts({});
    host.layout.invalidate(InvalidationContext{true});
    CHECK(host.layout.cache().row_count() == 0);
    CHECK(host.layout.total_content_extent() == Size{});
    CHECK(host.layout.all_visible_frames(SDL_FRect{0.0f, 0.0f, 800.0f, 600.0f}).items.empty());
}

TEST_CASE("Scroll region lookups require the scroll region kind") {
    Host host({2});
    CHECK(host.layout.scroll_region_descriptor(kScrollRegionKind, 0).has_value());
    CHECK_FALSE(host.layout.scroll_region_descriptor("header", 0).has_value());
    CHECK_FALSE(host.layout.scroll_region_descriptor(kScrollRegionKind, 1).has_value());
}

TEST_CASE("Item lookups return cached frames or nothing") {
    Host host({2, 0, 1});
    CHECK(host.layout.item_frame(0, 1).has_value());
    CHECK_FALSE(host.layout.item_frame(0, 2).has_value());
    CHECK_FALSE(host.layout.item_frame(1, 0).has_value());
    CHECK_FALSE(host.layout.item_frame(-1, 0).has_value());
    const VisibleLayout visible = host.layout.all_visible_frames(SDL_FRect{0.0f, 0.0f, 10.0f, 10.0f});
    CHECK(visible.items.size() == 3);
    CHECK(visible.scroll_regions.size() == 2);
}

TEST_CASE("Bounds change is reported only for a different size") {
    Host host({1});
    CHECK_FALSE(host.layout.notify_bounds_changed(Size{800.0f, 600.0f}));
    CHECK(host.layout.notify_bounds_changed(Size{1024.0f, 600.0f}));
    CHECK_FALSE(host.layout.notify_bounds_changed(Size{1024.0f, 600.0f}));
    CHECK(host.layout.notify_bounds_changed(Size{1024.0f, 700.0f}));
}

TEST_CASE("Scrolling a row notifies the host unless told not to") {
    Host host({4, 4, 4});
    int redraws = 0;
    host.layout.set_invalidation_callback([&redraws]() { ++redraws; });

    host.layout.set_row_scroll_offset(2, 37.0f);
    CHECK(redraws == 1);
    host.layout.set_row_scroll_offset(2, 40.0f, false);
    CHECK(redraws == 1);
    CHECK(host.layout.scroll_region_descriptor(kScrollRegionKind, 2)->offset == doctest::Approx(40.0f));
}

TEST_CASE("Scrolling an unknown row is a precondition violation") {
    rowscroll::log::set_level(rowscroll::log::Level::Error);
    Host host({1, 0});
    int redraws = 0;
    host.layout.set_invalidation_callback([&redraws]() { ++redraws; });
    CHECK_THROWS_AS(host.layout.set_row_scroll_offset(1, 10.0f), PreconditionViolation);
    CHECK(redraws == 0);
}

TEST_CASE("Full invalidation keeps offsets and adopts the new width") {
    Host host({4, 4, 4});
    host.layout.set_row_scroll_offset(2, 37.0f);

    const Size next{1280.0f, 720.0f};
    REQUIRE(host.layout.notify_bounds_changed(next));
    host.layout.on_full_invalidation(next);

    const auto region = host.layout.scroll_region_descriptor(kScrollRegionKind, 2);
    REQUIRE(region.has_value());
    CHECK(region->offset == doctest::Approx(37.0f));
    CHECK(region->frame.w == doctest::Approx(1280.0f));
    for (int col = 0; col < 4; ++col) {
        CHECK(host.layout.item_frame(2, col)->translation_x == doctest::Approx(-37.0f));
    }
    CHECK(host.layout.total_content_extent().width == doctest::Approx(1280.0f));
}

TEST_CASE("Container resize touches band widths only") {
    Host host({2, 3});
    host.layout.set_row_scroll_offset(1, 15.0f);
    const auto item_before = host.layout.item_frame(1, 2);
    host.layout.on_container_resize(320.0f);
    CHECK(host.layout.scroll_region_descriptor(kScrollRegionKind, 0)->frame.w == doctest::Approx(320.0f));
    CHECK(host.layout.scroll_region_descriptor(kScrollRegionKind, 1)->offset == doctest::Approx(15.0f));
    CHECK(*host.layout.item_frame(1, 2) == *item_before);
}

TEST_CASE("Row inserted mid-collection shifts later rows on the next recompute") {
    Host host({2, 2, 2});
    const float stride = host.layout.settings().row_stride();
    const float row1_y = host.layout.scroll_region_descriptor(kScrollRegionKind, 1)->frame.y;
    const float row2_y = host.layout.scroll_region_descriptor(kScrollRegionKind, 2)->frame.y;

    host.provider.insert_row(1, 3);
    host.layout.begin_update_batch({UpdateItem::insert_row(1)});
    CHECK(host.layout.tracker().was_row_inserted(1));

    // The new row is laid out immediately at row 1.
    REQUIRE(host.layout.cache().row_item_count(1) == 3);
    CHECK(host.layout.item_frame(1, 0)->frame.y == doctest::Approx(row1_y));
    CHECK(host.layout.item_frame(1, 2).has_value());

    host.layout.end_update_batch();
    CHECK(host.layout.tracker().empty());
    host.layout.invalidate(InvalidationContext{true});

    CHECK(host.provider.row_count() == 4);
    CHECK(host.layout.cache().row_count() == 4);
    CHECK(host.layout.cache().row_item_count(1) == 3);
    CHECK(host.layout.scroll_region_descriptor(kScrollRegionKind, 2)->frame.y == doctest::Approx(row2_y));
    CHECK(host.layout.scroll_region_descriptor(kScrollRegionKind, 3)->frame.y == doctest::Approx(row2_y + stride));
    CHECK(host.layout.item_frame(3, 0)->frame.y == doctest::Approx(row1_y + 2.0f * stride));
}

TEST_CASE("Row deletion is pruned by the count invalidation that follows") {
    Host host({2, 2, 2});
    host.provider.remove_row(2);
    host.layout.begin_update_batch({UpdateItem::delete_row(2)});
    CHECK(host.layout.cache().row_count() == 3);
    host.layout.end_update_batch();

    // A plain invalidation does not rebuild.
    host.layout.invalidate(InvalidationContext{false});
    CHECK(host.layout.cache().row_count() == 3);

    host.layout.invalidate(InvalidationContext{true});
    CHECK(host.layout.cache().row_count() == 2);
    CHECK_FALSE(host.layout.item_frame(2, 0).has_value());
}

TEST_CASE("Changing settings relays out with offsets kept") {
    Host host({3, 3});
    host.layout.set_row_scroll_offset(1, 21.0f);

    GridLayoutSettings settings = host.layout.settings();
    settings.item_size = Size{100.0f, 50.0f};
    settings.row_spacing = 10.0f;
    host.layout.set_settings(settings);

    const auto region = host.layout.scroll_region_descriptor(kScrollRegionKind, 1);
    REQUIRE(region.has_value());
    CHECK(region->frame.y == doctest::Approx(15.0f + 60.0f));
    CHECK(region->frame.h == doctest::Approx(50.0f));
    CHECK(region->offset == doctest::Approx(21.0f));
    CHECK(host.layout.item_frame(1, 0)->frame.w == doctest::Approx(100.0f));
}
