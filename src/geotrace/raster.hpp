#pragma once

#include "geometry.hpp"
#include <array>
#include <optional>
#include <string>
#include <opencv2/core.hpp>

/*------------------------------------------------------------------------------------------------*/

namespace gt {

    // GDAL ordering: x = gt[0] + col*gt[1] + row*gt[2], y = gt[3] + col*gt[4] + row*gt[5]
    using geo_transform = std::array<double, 6>;

    // GeoTIFF ModelTiepointTag (I, J, K, X, Y, Z) and ModelPixelScaleTag (ScaleX, ScaleY, ScaleZ)
    struct tiff_georef_tags {
        std::array<double, 6> tiepoint;
        std::array<double, 3> pixel_scale;
    };

    // GDAL folds the tiepoint and pixel scale tags into the geotransform. Only a north-up
    // transform with no rotation terms maps back to them.
    std::optional<tiff_georef_tags> tiff_tags_from_geo_transform(const geo_transform& xform);

    struct exif_gps {
        std::array<double, 3> latitude;   // degrees, minutes, seconds
        char latitude_ref;                // 'N' or 'S'
        std::array<double, 3> longitude;
        char longitude_ref;               // 'E' or 'W'
    };

    struct raster_metadata {
        std::optional<std::string> crs;   // WKT
        std::optional<geo_transform> transform;
        std::optional<tiff_georef_tags> tiff_tags;
        std::optional<exif_gps> exif;
    };

    struct raster {
        std::string path;
        cv::Mat pixels;
        raster_metadata metadata;

        dimensions<int> dims() const;
    };

    // tries OpenCV first, then Qt. Returns an empty 3-channel BGR mat on failure of both.
    cv::Mat decode_image(const std::string& path);

    // collects whatever georeferencing information can be found. Never throws.
    raster_metadata read_raster_metadata(const std::string& path);

    raster load_raster(const std::string& path);

    std::optional<std::array<double, 3>> parse_exif_rationals(const std::string& str);
    std::optional<exif_gps> parse_exif_gps(const std::string& lat, const std::string& lat_ref,
        const std::string& lon, const std::string& lon_ref);
}
