#include "doctest/doctest.h"
#include "geotrace/feature_collection.hpp"
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace {

    gt::polygon square(double x, double y, double sz) {
        return gt::make_rectangle({ x, y, x + sz, y + sz });
    }

    fs::path scratch_dir() {
        auto dir = fs::temp_directory_path() / ("geotrace_fc_" + gt::unique_id());
        fs::create_directories(dir);
        return dir;
    }
}

TEST_CASE("Pixel to geographic mapping") {
    gt::geo_bounds bounds{ -75, 40, -73, 42 };
    auto mat = gt::pixel_to_geo_matrix({ 100, 100 }, bounds);

    auto origin = gt::transform(gt::point{ 0, 0 }, mat);
    CHECK(origin.x == doctest::Approx(-75.0));
    CHECK(origin.y == doctest::Approx(42.0));

    auto far_corner = gt::transform(gt::point{ 100, 100 }, mat);
    CHECK(far_corner.x == doctest::Approx(-73.0));
    CHECK(far_corner.y == doctest::Approx(40.0));

    auto center = gt::transform(gt::point{ 50, 25 }, mat);
    CHECK(center.x == doctest::Approx(-74.0));
    CHECK(center.y == doctest::Approx(41.5));

    CHECK_THROWS(gt::pixel_to_geo_matrix({ 0, 10 }, bounds));
}

TEST_CASE("Assembling a feature collection") {
    std::vector<gt::polygon> polys = { square(0, 0, 10), square(50, 50, 20) };
    auto fc = gt::assemble_feature_collection(polys, { 100, 100 }, { 0, 0, 1, 1 }, "buildings");

    REQUIRE(fc.size() == 2);
    CHECK(fc.feature_type == "buildings");
    REQUIRE(fc.bounds.has_value());
    for (size_t i = 0; i < fc.size(); ++i) {
        const auto& f = fc.features[i];
        CHECK(f.id == static_cast<int>(i) + 1);
        CHECK(f.properties["name"] == "Feature " + std::to_string(i + 1));
        REQUIRE(f.geometry.size() == 1);
        CHECK(gt::is_closed(f.geometry.front().outer()));
        for (const auto& pt : f.geometry.front().outer()) {
            CHECK(pt.x >= 0.0);
            CHECK(pt.x <= 1.0);
            CHECK(pt.y >= 0.0);
            CHECK(pt.y <= 1.0);
        }
    }

    SUBCASE("geojson layout") {
        gt::json js = fc;
        CHECK(js["type"] == "FeatureCollection");
        CHECK(js["feature_type"] == "buildings");
        CHECK(js["bbox"].size() == 4);
        CHECK(js["features"].size() == 2);

        const auto& first = js["features"][0];
        CHECK(first["type"] == "Feature");
        CHECK(first["id"] == 1);
        CHECK(first["geometry"]["type"] == "Polygon");
        const auto& ring = first["geometry"]["coordinates"][0];
        CHECK(ring.front() == ring.back());
        CHECK_FALSE(first["properties"].contains("feature_type"));
    }

    SUBCASE("degenerate rings are dropped and reported") {
        size_t dropped = 0;
        gt::callbacks cbs;
        cbs.polygons_dropped_cb = [&dropped](gt::pipeline_stage stage, size_t n) {
            CHECK(stage == gt::pipeline_stage::assemble);
            dropped += n;
        };
        gt::polygon sliver;
        sliver.outer() = { {0, 0}, {10, 0}, {0, 0} };
        auto out = gt::assemble_feature_collection({ sliver, square(0, 0, 10) }, { 100, 100 },
            { 0, 0, 1, 1 }, "water", cbs);
        CHECK(out.size() == 1);
        CHECK(out.features.front().id == 1);
        CHECK(dropped == 1);
    }
}

TEST_CASE("Empty input gives an empty collection") {
    auto fc = gt::assemble_feature_collection({}, { 100, 100 }, { 0, 0, 1, 1 }, "roads");
    CHECK(fc.empty());
    gt::json js = fc;
    CHECK(js["features"].is_array());
    CHECK(js["features"].empty());
}

TEST_CASE("GeoJSON files") {
    auto dir = scratch_dir();

    SUBCASE("written files read back") {
        auto fc = gt::assemble_feature_collection({ square(10, 10, 20) }, { 100, 100 },
            { -75, 40, -73, 42 }, "trees");
        fc.georeference_source = "tiff_tags";
        auto path = (dir / "out.geojson").string();
        gt::write_geojson(path, fc);

        auto restored = gt::read_geojson(path);
        CHECK(restored.feature_type == "trees");
        CHECK(restored.georeference_source == "tiff_tags");
        CHECK_FALSE(restored.georeference_degraded);
        REQUIRE(restored.size() == 1);
        CHECK(restored.features.front().geometry.front().outer().size() ==
            fc.features.front().geometry.front().outer().size());
    }

    SUBCASE("missing file") {
        CHECK_THROWS_AS(gt::read_geojson((dir / "missing.geojson").string()), gt::geojson_error);
    }

    SUBCASE("malformed json") {
        auto path = (dir / "bad.geojson").string();
        std::ofstream(path) << "{ \"type\": \"FeatureCollection\", ";
        CHECK_THROWS_AS(gt::read_geojson(path), gt::geojson_error);
    }

    SUBCASE("wrong structure") {
        auto path = (dir / "point.geojson").string();
        std::ofstream(path) << R"({"type": "FeatureCollection", "features": [
            {"type": "Feature", "geometry": {"type": "Point", "coordinates": [0, 0]}}
        ]})";
        CHECK_THROWS_AS(gt::read_geojson(path), gt::geojson_error);
    }

    fs::remove_all(dir);
}
