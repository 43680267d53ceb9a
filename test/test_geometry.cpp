#include "doctest/doctest.h"
#include "geotrace/geometry.hpp"
#include <vector>

TEST_CASE("Polygon construction") {
    std::vector<gt::point> verts = { {0, 0}, {10, 0}, {10, 10}, {0, 10} };

    SUBCASE("make_polygon closes the ring") {
        auto poly = gt::make_polygon(verts);
        CHECK(poly.outer().size() == 5);
        CHECK(gt::is_closed(poly.outer()));
        CHECK(gt::is_valid_polygon(poly));
        CHECK(gt::area(poly) == doctest::Approx(100.0));
    }

    SUBCASE("make_polygon does not duplicate an existing closing vertex") {
        auto closed = verts;
        closed.push_back(closed.front());
        auto poly = gt::make_polygon(closed);
        CHECK(poly.outer().size() == 5);
    }

    SUBCASE("make_rectangle") {
        auto rect = gt::make_rectangle({ 2, 3, 7, 5 });
        CHECK(gt::area(rect) == doctest::Approx(10.0));
        CHECK(gt::bounding_rectangle(rect) == gt::rectangle{ 2, 3, 7, 5 });
    }
}

TEST_CASE("Degenerate rings are not valid polygons") {
    std::vector<gt::point> line = { {0, 0}, {5, 5}, {10, 10} };
    CHECK_FALSE(gt::is_valid_polygon(gt::make_polygon(line)));

    std::vector<gt::point> two_points = { {0, 0}, {5, 5} };
    CHECK(gt::is_degenerate_ring(gt::make_ring(two_points)));

    std::vector<gt::point> bowtie = { {0, 0}, {10, 10}, {10, 0}, {0, 10} };
    CHECK_FALSE(gt::is_valid_polygon(gt::make_polygon(bowtie)));
}

TEST_CASE("Affine matrices") {
    auto mat = gt::translation_matrix(5, -2) * gt::scale_matrix(2, 3);
    auto pt = gt::transform(gt::point{ 1, 1 }, mat);
    CHECK(pt.x == doctest::Approx(7.0));
    CHECK(pt.y == doctest::Approx(1.0));
}

TEST_CASE("Buffer and union") {
    auto square = gt::make_rectangle({ 0, 0, 20, 20 });

    SUBCASE("mitred buffer keeps square corners") {
        auto buffered = gt::buffer(square, 5.0);
        REQUIRE(buffered.size() == 1);
        CHECK(gt::area(buffered.front()) == doctest::Approx(900.0));
        auto [x1, y1, x2, y2] = gt::bounding_rectangle(buffered.front());
        CHECK(x1 == doctest::Approx(-5.0));
        CHECK(y1 == doctest::Approx(-5.0));
        CHECK(x2 == doctest::Approx(25.0));
        CHECK(y2 == doctest::Approx(25.0));
    }

    SUBCASE("overlapping polygons union into one") {
        std::vector<gt::polygon> polys = { square, gt::make_rectangle({ 10, 10, 30, 30 }) };
        auto merged = gt::union_all(polys);
        REQUIRE(merged.size() == 1);
        CHECK(gt::area(merged.front()) == doctest::Approx(700.0));
    }

    SUBCASE("disjoint polygons stay separate") {
        std::vector<gt::polygon> polys = { square, gt::make_rectangle({ 100, 100, 120, 120 }) };
        CHECK(gt::union_all(polys).size() == 2);
    }
}
