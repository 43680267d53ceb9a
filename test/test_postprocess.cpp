#include "doctest/doctest.h"
#include "geotrace/postprocess.hpp"
#include <boost/geometry.hpp>
#include <vector>

namespace {

    gt::polygon square(double x, double y, double sz) {
        return gt::make_rectangle({ x, y, x + sz, y + sz });
    }

    // a square with its corners slightly clipped: fills ~98% of its bounding box.
    gt::polygon clipped_square() {
        std::vector<gt::point> verts = {
            {1, 0}, {19, 0}, {20, 1}, {20, 19}, {19, 20}, {1, 20}, {0, 19}, {0, 1}
        };
        return gt::make_polygon(verts);
    }

    gt::polygon triangle() {
        std::vector<gt::point> verts = { {0, 0}, {20, 0}, {0, 20} };
        return gt::make_polygon(verts);
    }
}

TEST_CASE("Regularization") {
    SUBCASE("nearly rectangular polygons become their bounding box") {
        auto out = gt::regularize_polygons({ clipped_square() });
        REQUIRE(out.size() == 1);
        CHECK(gt::distinct_vert_count(out.front().outer()) == 4);
        CHECK(gt::area(out.front()) == doctest::Approx(400.0));
    }

    SUBCASE("irregular polygons are unchanged") {
        auto out = gt::regularize_polygons({ triangle() });
        REQUIRE(out.size() == 1);
        CHECK(boost::geometry::equals(out.front(), triangle()));
    }

    SUBCASE("idempotent") {
        std::vector<gt::polygon> polys = { clipped_square(), triangle(), square(50, 50, 10) };
        auto once = gt::regularize_polygons(polys);
        auto twice = gt::regularize_polygons(once);
        REQUIRE(once.size() == twice.size());
        for (size_t i = 0; i < once.size(); ++i) {
            CHECK(once[i].outer() == twice[i].outer());
        }
    }

    SUBCASE("threshold is respected") {
        auto out = gt::regularize_polygons({ clipped_square() }, 0.999);
        CHECK(gt::distinct_vert_count(out.front().outer()) == 8);
    }
}

TEST_CASE("Merging") {
    SUBCASE("far apart polygons keep their count") {
        std::vector<gt::polygon> polys = { square(0, 0, 10), square(100, 0, 10), square(0, 100, 10) };
        auto merged = gt::merge_nearby_polygons(polys, 5.0);
        CHECK(merged.size() == 3);
        for (const auto& poly : merged) {
            CHECK(gt::area(poly) == doctest::Approx(400.0));
        }
    }

    SUBCASE("diagonal neighbours beyond twice the buffer stay separate") {
        // corner to corner gap is 8 * sqrt(2), about 11.3
        std::vector<gt::polygon> polys = { square(10, 10, 20), square(38, 38, 20) };
        auto merged = gt::merge_nearby_polygons(polys, 5.0);
        REQUIRE(merged.size() == 2);
        for (const auto& poly : merged) {
            CHECK(gt::area(poly) == doctest::Approx(900.0));
        }
    }

    SUBCASE("diagonal neighbours within twice the buffer merge") {
        // corner to corner gap is 6 * sqrt(2), about 8.5
        std::vector<gt::polygon> polys = { square(10, 10, 20), square(36, 36, 20) };
        CHECK(gt::merge_nearby_polygons(polys, 5.0).size() == 1);
    }

    SUBCASE("polygons closer than twice the buffer merge") {
        std::vector<gt::polygon> polys = { square(0, 0, 10), square(14, 0, 10) };
        CHECK(gt::merge_nearby_polygons(polys, 5.0).size() == 1);
    }

    SUBCASE("empty input") {
        CHECK(gt::merge_nearby_polygons({}, 5.0).empty());
    }
}

TEST_CASE("Simplification") {
    std::vector<gt::point> verts;
    for (int x = 0; x <= 40; x += 2) {
        verts.push_back({ static_cast<double>(x), (x % 4 == 0) ? 0.0 : 0.5 });
    }
    verts.push_back({ 40, 40 });
    verts.push_back({ 0, 40 });
    auto jagged = gt::make_polygon(verts);
    REQUIRE(gt::is_valid_polygon(jagged));

    auto out = gt::simplify_polygons({ jagged }, 2.0);
    REQUIRE(out.size() == 1);
    CHECK(gt::is_valid_polygon(out.front()));
    CHECK(out.front().outer().size() < jagged.outer().size());
}

TEST_CASE("Post-processing") {
    std::vector<gt::polygon> polys = { clipped_square() };
    gt::postprocess_settings settings;
    settings.simplify_tolerance = 0.1;

    SUBCASE("buildings are regularized before merging") {
        auto out = gt::post_process(polys, gt::feature_type::buildings, settings);
        REQUIRE(out.size() == 1);
        CHECK(gt::area(out.front()) == doctest::Approx(900.0));
    }

    SUBCASE("other types are not regularized") {
        auto out = gt::post_process(polys, gt::feature_type::trees, settings);
        REQUIRE(out.size() == 1);
        CHECK(gt::area(out.front()) < 900.0);
    }
}
