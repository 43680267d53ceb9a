#include "doctest/doctest.h"
#include "geotrace/raster.hpp"
#include "geotrace/diagnostics.hpp"
#include "geotrace/util.hpp"
#include <gdal_priv.h>
#include <ogr_spatialref.h>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace {

    fs::path scratch_dir() {
        auto dir = fs::temp_directory_path() / ("geotrace_raster_" + gt::unique_id());
        fs::create_directories(dir);
        return dir;
    }

    void write_geotiff(const std::string& path, const gt::geo_transform& xform, bool with_crs) {
        GDALAllRegister();
        auto* driver = GetGDALDriverManager()->GetDriverByName("GTiff");
        REQUIRE(driver != nullptr);
        GDALDatasetUniquePtr ds(driver->Create(path.c_str(), 40, 30, 1, GDT_Byte, nullptr));
        REQUIRE(ds);
        auto copy = xform;
        REQUIRE(ds->SetGeoTransform(copy.data()) == CE_None);
        if (with_crs) {
            OGRSpatialReference srs;
            srs.SetWellKnownGeogCS("WGS84");
            REQUIRE(ds->SetSpatialRef(&srs) == CE_None);
        }
    }
}

TEST_CASE("EXIF rational parsing") {
    auto dms = gt::parse_exif_rationals("(40) (26) (46.302)");
    REQUIRE(dms.has_value());
    CHECK((*dms)[0] == doctest::Approx(40.0));
    CHECK((*dms)[1] == doctest::Approx(26.0));
    CHECK((*dms)[2] == doctest::Approx(46.302));

    CHECK_FALSE(gt::parse_exif_rationals("").has_value());
    CHECK_FALSE(gt::parse_exif_rationals("(40) (26)").has_value());
}

TEST_CASE("EXIF GPS parsing") {
    SUBCASE("hemisphere references") {
        auto gps = gt::parse_exif_gps("(33) (51) (54)", "S", "(151) (12) (36)", "E");
        REQUIRE(gps.has_value());
        CHECK(gps->latitude_ref == 'S');
        CHECK(gps->longitude_ref == 'E');
    }

    SUBCASE("missing references default to north and east") {
        auto gps = gt::parse_exif_gps("(1) (0) (0)", "", "(2) (0) (0)", "");
        REQUIRE(gps.has_value());
        CHECK(gps->latitude_ref == 'N');
        CHECK(gps->longitude_ref == 'E');
    }

    SUBCASE("missing coordinates") {
        CHECK_FALSE(gt::parse_exif_gps("", "N", "(2) (0) (0)", "W").has_value());
    }
}

TEST_CASE("GeoTIFF model tags from a geotransform") {
    SUBCASE("north-up transform") {
        auto tags = gt::tiff_tags_from_geo_transform({ 100.0, 0.01, 0.0, 50.0, 0.0, -0.02 });
        REQUIRE(tags.has_value());
        CHECK(tags->tiepoint[3] == doctest::Approx(100.0));
        CHECK(tags->tiepoint[4] == doctest::Approx(50.0));
        CHECK(tags->pixel_scale[0] == doctest::Approx(0.01));
        CHECK(tags->pixel_scale[1] == doctest::Approx(0.02));
    }

    SUBCASE("rotated or south-up transforms have no tag form") {
        CHECK_FALSE(gt::tiff_tags_from_geo_transform({ 100.0, 0.01, 0.001, 50.0, 0.0, -0.02 }));
        CHECK_FALSE(gt::tiff_tags_from_geo_transform({ 100.0, 0.01, 0.0, 50.0, 0.0, 0.02 }));
    }
}

TEST_CASE("Reading GeoTIFF metadata") {
    auto dir = scratch_dir();
    gt::geo_transform xform = { 100.0, 0.01, 0.0, 50.0, 0.0, -0.02 };

    SUBCASE("model tags without a CRS") {
        auto path = (dir / "tags_only.tif").string();
        write_geotiff(path, xform, false);

        auto meta = gt::read_raster_metadata(path);
        CHECK_FALSE(meta.crs.has_value());
        REQUIRE(meta.tiff_tags.has_value());
        CHECK(meta.tiff_tags->tiepoint[3] == doctest::Approx(100.0));
        CHECK(meta.tiff_tags->tiepoint[4] == doctest::Approx(50.0));
        CHECK(meta.tiff_tags->pixel_scale[0] == doctest::Approx(0.01));
        CHECK(meta.tiff_tags->pixel_scale[1] == doctest::Approx(0.02));
    }

    SUBCASE("a CRS makes it an embedded transform") {
        auto path = (dir / "with_crs.tif").string();
        write_geotiff(path, xform, true);

        auto meta = gt::read_raster_metadata(path);
        CHECK(meta.crs.has_value());
        REQUIRE(meta.transform.has_value());
        CHECK((*meta.transform)[0] == doctest::Approx(100.0));
        CHECK_FALSE(meta.tiff_tags.has_value());
    }

    fs::remove_all(dir);
}

TEST_CASE("Loading rasters") {
    auto dir = scratch_dir();

    SUBCASE("missing file") {
        CHECK_THROWS_AS(gt::load_raster((dir / "nope.png").string()), gt::image_decode_error);
    }

    SUBCASE("file that is not an image") {
        auto path = (dir / "notes.png").string();
        std::ofstream(path) << "this is not a png";
        try {
            gt::load_raster(path);
            FAIL("expected image_decode_error");
        } catch (const gt::image_decode_error& e) {
            CHECK(e.path() == path);
        }
    }

    SUBCASE("plain png decodes to BGR with no georeferencing") {
        auto path = (dir / "gray.png").string();
        gt::write_image(path, cv::Mat(30, 40, CV_8UC1, cv::Scalar(128)));

        auto ras = gt::load_raster(path);
        CHECK(ras.pixels.channels() == 3);
        CHECK(ras.dims().wd == 40);
        CHECK(ras.dims().hgt == 30);
        CHECK_FALSE(ras.metadata.tiff_tags.has_value());
        CHECK_FALSE(ras.metadata.exif.has_value());
        CHECK_FALSE(ras.metadata.crs.has_value());
    }

    fs::remove_all(dir);
}
