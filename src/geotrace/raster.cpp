#include "raster.hpp"
#include "util.hpp"
#include "diagnostics.hpp"
#include <opencv2/imgcodecs.hpp>
#include <gdal_priv.h>
#include <cpl_error.h>
#include <QImage>
#include <QString>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <mutex>
#include <sstream>

/*------------------------------------------------------------------------------------------------*/

namespace {

    class quiet_gdal_errors {
    public:
        quiet_gdal_errors() {
            CPLPushErrorHandler(CPLQuietErrorHandler);
        }
        ~quiet_gdal_errors() {
            CPLPopErrorHandler();
        }
    };

    void register_gdal_drivers() {
        static std::once_flag flag;
        std::call_once(flag, []() { GDALAllRegister(); });
    }

    std::string metadata_item(GDALDataset& ds, const char* key) {
        const char* val = ds.GetMetadataItem(key);
        return val ? std::string(val) : std::string{};
    }

    std::optional<char> hemisphere(const std::string& ref) {
        auto iter = std::find_if(ref.begin(), ref.end(),
            [](unsigned char c) { return std::isalpha(c); });
        if (iter == ref.end()) {
            return {};
        }
        return static_cast<char>(std::toupper(static_cast<unsigned char>(*iter)));
    }

    cv::Mat decode_with_opencv(const std::string& path) {
        try {
            return cv::imread(path, cv::IMREAD_COLOR);
        } catch (const cv::Exception&) {
            return {};
        }
    }

    cv::Mat decode_with_qt(const std::string& path) {
        QImage img(QString::fromStdString(path));
        auto mat = gt::qimage_to_mat(img);
        if (mat.empty()) {
            return {};
        }
        return gt::convert_to_3channel_bgr(mat);
    }
}

gt::dimensions<int> gt::raster::dims() const {
    return mat_dimensions(pixels);
}

cv::Mat gt::decode_image(const std::string& path) {
    auto mat = decode_with_opencv(path);
    if (!mat.empty()) {
        return mat;
    }
    return decode_with_qt(path);
}

std::optional<gt::tiff_georef_tags> gt::tiff_tags_from_geo_transform(const geo_transform& xform) {
    if (xform[2] != 0.0 || xform[4] != 0.0 || xform[1] <= 0.0 || xform[5] >= 0.0) {
        return {};
    }
    return tiff_georef_tags{
        { 0.0, 0.0, 0.0, xform[0], xform[3], 0.0 },
        { xform[1], -xform[5], 0.0 }
    };
}

gt::raster_metadata gt::read_raster_metadata(const std::string& path) {
    raster_metadata meta;

    register_gdal_drivers();
    quiet_gdal_errors quiet;
    GDALDatasetUniquePtr ds(
        GDALDataset::Open(path.c_str(), GDAL_OF_RASTER | GDAL_OF_READONLY)
    );
    if (!ds) {
        return meta;
    }

    geo_transform xform;
    if (ds->GetGeoTransform(xform.data()) == CE_None) {
        meta.transform = xform;
    }
    const char* wkt = ds->GetProjectionRef();
    if (wkt && *wkt) {
        meta.crs = std::string(wkt);
    }
    if (meta.transform && !meta.crs) {
        meta.tiff_tags = tiff_tags_from_geo_transform(*meta.transform);
    }
    meta.exif = parse_exif_gps(
        metadata_item(*ds, "EXIF_GPSLatitude"),
        metadata_item(*ds, "EXIF_GPSLatitudeRef"),
        metadata_item(*ds, "EXIF_GPSLongitude"),
        metadata_item(*ds, "EXIF_GPSLongitudeRef")
    );

    return meta;
}

gt::raster gt::load_raster(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        throw image_decode_error(path, "file does not exist");
    }
    auto pixels = decode_image(path);
    if (pixels.empty()) {
        throw image_decode_error(path, "not a decodable raster image");
    }
    return {
        path,
        pixels,
        read_raster_metadata(path)
    };
}

// GDAL reports EXIF rationals as "(40) (26) (46.302)"
std::optional<std::array<double, 3>> gt::parse_exif_rationals(const std::string& str) {
    std::string cleaned = str;
    std::replace_if(cleaned.begin(), cleaned.end(),
        [](char c) { return c == '(' || c == ')' || c == ','; }, ' ');

    std::stringstream ss(cleaned);
    std::array<double, 3> values;
    for (auto& val : values) {
        if (!(ss >> val)) {
            return {};
        }
    }
    return values;
}

std::optional<gt::exif_gps> gt::parse_exif_gps(const std::string& lat, const std::string& lat_ref,
        const std::string& lon, const std::string& lon_ref) {
    auto latitude = parse_exif_rationals(lat);
    auto longitude = parse_exif_rationals(lon);
    if (!latitude || !longitude) {
        return {};
    }
    return exif_gps{
        *latitude,
        hemisphere(lat_ref).value_or('N'),
        *longitude,
        hemisphere(lon_ref).value_or('E')
    };
}
