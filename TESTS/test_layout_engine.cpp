#include "doctest/doctest.h"

#include "layout/grid_layout_settings.hpp"
#include "layout/layout_engine.hpp"
#include "layout/precondition.hpp"
#include "utils/log.hpp"

using namespace rowscroll::layout;

TEST_CASE("Row item frames run left to right from the insets") {
    LayoutEngine engine;
    const auto frames = engine.compute_row_item_frames(2, 4, 0.0f);
    REQUIRE(frames.size() == 4);

    // top inset 15 + 2 rows of (120 + 15)
    const float expected_y = 15.0f + 2.0f * 135.0f;
    for (int col = 0; col < 4; ++col) {
        const ItemFrame& item = frames[static_cast<std::size_t>(col)];
        CHECK(item.index == IndexPath{2, col});
        CHECK(item.frame.x == doctest::Approx(15.0f + 207.0f * static_cast<float>(col)));
        CHECK(item.frame.y == doctest::Approx(expected_y));
        CHECK(item.frame.w == doctest::Approx(200.0f));
        CHECK(item.frame.h == doctest::Approx(120.0f));
        CHECK(item.z_index == kZIndexItem);
    }
}

TEST_CASE("Row item frames carry the negated offset") {
    LayoutEngine engine;
    for (const ItemFrame& item : engine.compute_row_item_frames(0, 3, 42.5f)) {
        CHECK(item.translation_x == doctest::Approx(-42.5f));
    }
}

TEST_CASE("Zero items yields no frames and negative counts are rejected") {
    rowscroll::log::set_level(rowscroll::log::Level::Error);
    LayoutEngine engine;
    CHECK(engine.compute_row_item_frames(0, 0, 0.0f).empty());
    CHECK_THROWS_AS(engine.compute_row_item_frames(0, -1, 0.0f), PreconditionViolation);
}

TEST_CASE("Scroll region spans the container width and the virtual row width") {
    LayoutEngine engine;
    const ScrollRegionDescriptor region = engine.compute_row_scroll_region(1, 5, 800.0f);
    CHECK(region.row == 1);
    CHECK(region.frame.x == doctest::Approx(0.0f));
    CHECK(region.frame.y == doctest::Approx(150.0f));
    CHECK(region.frame.w == doctest::Approx(800.0f));
    CHECK(region.frame.h == doctest::Approx(120.0f));
    // 15 + 15 + 5*200 + 4*7
    CHECK(region.content_size.width == doctest::Approx(1058.0f));
    CHECK(region.content_size.height == doctest::Approx(120.0f));
    CHECK(region.offset == doctest::Approx(0.0f));
    CHECK(region.z_index == kZIndexScrollRegion);
    CHECK(region.z_index > kZIndexItem);
}

TEST_CASE("Scroll region for an empty row is a precondition violation") {
    rowscroll::log::set_level(rowscroll::log::Level::Error);
    LayoutEngine engine;
    CHECK_THROWS_AS(engine.compute_row_scroll_region(3, 0, 640.0f), PreconditionViolation);
    try {
        engine.compute_row_scroll_region(3, 0, 640.0f);
        FAIL("expected PreconditionViolation");
    } catch (const PreconditionViolation& e) {
        CHECK(e.component() == "LayoutEngine");
    }
}

TEST_CASE("Single item frame matches the frame laid out with its siblings") {
    GridLayoutSettings settings;
    settings.item_size = Size{64.0f, 48.0f};
    settings.column_spacing = 4.0f;
    settings.row_spacing = 8.0f;
    settings.insets = EdgeInsets{10.0f, 6.0f, 10.0f, 6.0f};
    LayoutEngine engine(settings);

    const auto row = engine.compute_row_item_frames(3, 6, 12.0f);
    for (int col = 0; col < 6; ++col) {
        const ItemFrame single = engine.compute_single_item_frame(3, col, 12.0f);
        CHECK(single == row[static_cast<std::size_t>(col)]);
    }
}

TEST_CASE("Custom spacing and insets feed the content width") {
    GridLayoutSettings settings;
    settings.item_size = Size{50.0f, 20.0f};
    settings.column_spacing = 10.0f;
    settings.insets = EdgeInsets{0.0f, 3.0f, 0.0f, 5.0f};
    LayoutEngine engine(settings);

    CHECK(engine.row_content_width(1) == doctest::Approx(58.0f));
    CHECK(engine.row_content_width(3) == doctest::Approx(3.0f + 5.0f + 150.0f + 20.0f));
    CHECK(engine.row_origin_y(0) == doctest::Approx(0.0f));
}
