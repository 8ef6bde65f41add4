#include <catch2/catch.hpp>

#include <labelforge/categories.hpp>
#include <labelforge/color_map.hpp>
#include "fixtures.hpp"

#define TEST_TAG "[color_map]"

TEST_CASE("Default palette interleaves the bits of id+1", TEST_TAG) {
    auto map = lf::color_map_list(256);
    REQUIRE(map.size() == 256);
    CHECK(map[0] == lf::Rgb{128, 0, 0});
    CHECK(map[1] == lf::Rgb{0, 128, 0});
    CHECK(map[2] == lf::Rgb{128, 128, 0});
    CHECK(map[6] == lf::Rgb{128, 128, 128});
    CHECK(map[7] == lf::Rgb{64, 0, 0});
    CHECK(map[255] == lf::Rgb{0, 0, 32});
}

TEST_CASE("Custom colors replace the head of the palette", TEST_TAG) {
    auto map = lf::color_map_list(256, {1, 2, 3, 4, 5, 6});
    CHECK(map[0] == lf::Rgb{1, 2, 3});
    CHECK(map[1] == lf::Rgb{4, 5, 6});
    CHECK(map[2] == lf::Rgb{128, 128, 0});

    auto cats = lf::color_map_list(256, lf::registry_custom_colors());
    for (auto& c : lf::CategoryRegistry::list()) CHECK(cats[size_t(c.id)] == c.color);

    CHECK_THROWS_AS(lf::color_map_list(256, {1, 2}), std::invalid_argument);
    CHECK_THROWS_AS(lf::color_map_list(256, {1, 2, 300}), std::invalid_argument);
    CHECK_THROWS_AS(lf::color_map_list(1, {1, 2, 3, 4, 5, 6}), std::invalid_argument);
}

TEST_CASE("Pseudo color looks up each label", TEST_TAG) {
    auto pred = label_rows({{0, 1}, {2, 300}});
    std::vector<lf::Rgb> pal = {{10, 10, 10}, {20, 20, 20}, {30, 30, 30}};
    auto im = lf::pseudo_color(pred, pal);
    CHECK(im.px(0,0)[0] == 10);
    CHECK(im.px(1,0)[1] == 20);
    CHECK(im.px(0,1)[2] == 30);
    // out-of-palette labels take the last entry
    CHECK(im.px(1,1)[0] == 30);
}

TEST_CASE("Overlay blends with the given weight", TEST_TAG) {
    auto pred = label_rows({{0, 1}});
    std::vector<lf::Rgb> pal = {{0, 0, 0}, {200, 100, 50}};
    auto im = solid_image(2, 1, 100);

    auto out = lf::overlay(im, pred, pal, 0.6);
    CHECK(out.px(0,0)[0] == 60);
    CHECK(out.px(1,0)[0] == 140);
    CHECK(out.px(1,0)[1] == 100);
    CHECK(out.px(1,0)[2] == 80);

    CHECK(lf::overlay(im, pred, pal, 1.0).rgb == im.rgb);
    CHECK_THROWS_AS(lf::overlay(solid_image(3, 1), pred, pal, 0.5), std::invalid_argument);
}
