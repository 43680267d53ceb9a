#include "georeference.hpp"
#include <ogr_spatialref.h>
#include <cpl_error.h>
#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

/*------------------------------------------------------------------------------------------------*/

namespace {

    constexpr int k_densify_points = 21;

    struct ct_deleter {
        void operator()(OGRCoordinateTransformation* ct) const {
            OGRCoordinateTransformation::DestroyCT(ct);
        }
    };

    using coord_transform_ptr = std::unique_ptr<OGRCoordinateTransformation, ct_deleter>;

    OGRSpatialReference spatial_reference(const std::string& crs) {
        OGRSpatialReference srs;
        if (srs.SetFromUserInput(crs.c_str()) != OGRERR_NONE) {
            throw std::runtime_error("unrecognized CRS: " + crs);
        }
        srs.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);
        return srs;
    }

    OGRSpatialReference wgs84() {
        OGRSpatialReference srs;
        srs.SetWellKnownGeogCS("WGS84");
        srs.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);
        return srs;
    }

    gt::geo_bounds affine_bounds(const gt::geo_transform& xform, gt::dimensions<int> dims) {
        std::array<gt::point, 4> corners = {
            gt::point{ 0.0, 0.0 },
            gt::point{ static_cast<double>(dims.wd), 0.0 },
            gt::point{ static_cast<double>(dims.wd), static_cast<double>(dims.hgt) },
            gt::point{ 0.0, static_cast<double>(dims.hgt) }
        };
        gt::matrix affine;
        affine <<
            xform[1], xform[2], xform[0],
            xform[4], xform[5], xform[3],
            0, 0, 1;
        for (auto& pt : corners) {
            pt = gt::transform(pt, affine);
        }
        auto [x1, y1, x2, y2] = gt::bounding_rectangle(corners);
        return { x1, y1, x2, y2 };
    }
}

bool gt::geo_bounds::is_valid() const {
    return std::isfinite(west) && std::isfinite(south) &&
        std::isfinite(east) && std::isfinite(north) &&
        west < east && south < north;
}

gt::geo_bounds gt::default_bounds() {
    return { -30.0, 0.0, -20.0, 10.0 };
}

void gt::to_json(json& js, const geo_bounds& b) {
    js = json::array({ b.west, b.south, b.east, b.north });
}

void gt::from_json(const json& js, geo_bounds& b) {
    if (!js.is_array() || js.size() != 4) {
        throw std::runtime_error("bounds must be [west, south, east, north]");
    }
    b = { js[0].get<double>(), js[1].get<double>(), js[2].get<double>(), js[3].get<double>() };
}

std::string gt::to_string(const geo_bounds& b) {
    std::stringstream ss;
    ss << "[" << b.west << ", " << b.south << ", " << b.east << ", " << b.north << "]";
    return ss.str();
}

/*------------------------------------------------------------------------------------------------*/

bool gt::gdal_crs_transformer::is_wgs84(const std::string& crs) const {
    auto srs = spatial_reference(crs);
    auto target = wgs84();
    return srs.IsGeographic() && srs.IsSame(&target);
}

gt::geo_bounds gt::gdal_crs_transformer::to_wgs84(const std::string& crs,
        const geo_bounds& b) const {
    auto src = spatial_reference(crs);
    auto dst = wgs84();
    coord_transform_ptr ct(OGRCreateCoordinateTransformation(&src, &dst));
    if (!ct) {
        throw std::runtime_error("no transformation from " + crs + " to WGS84");
    }
    geo_bounds out;
    if (!ct->TransformBounds(b.west, b.south, b.east, b.north,
            &out.west, &out.south, &out.east, &out.north, k_densify_points)) {
        throw std::runtime_error("unable to reproject bounds " + to_string(b));
    }
    return out;
}

/*------------------------------------------------------------------------------------------------*/

gt::bounds_source gt::embedded_transform_source(std::shared_ptr<const crs_transformer> transformer) {
    return {
        "embedded_transform",
        [transformer](const raster_metadata& meta, dimensions<int> dims)->std::optional<geo_bounds> {
            if (!meta.transform || !meta.crs || dims.empty()) {
                return {};
            }
            auto bounds = affine_bounds(*meta.transform, dims);
            if (transformer->is_wgs84(*meta.crs)) {
                return bounds;
            }
            return transformer->to_wgs84(*meta.crs, bounds);
        }
    };
}

gt::bounds_source gt::tiff_tags_source() {
    return {
        "tiff_tags",
        [](const raster_metadata& meta, dimensions<int> dims)->std::optional<geo_bounds> {
            if (!meta.tiff_tags) {
                return {};
            }
            const auto& tags = *meta.tiff_tags;
            double origin_x = tags.tiepoint[3];
            double origin_y = tags.tiepoint[4];
            double scale_x = tags.pixel_scale[0];
            double scale_y = tags.pixel_scale[1];
            return geo_bounds{
                origin_x,
                origin_y - dims.hgt * scale_y,
                origin_x + dims.wd * scale_x,
                origin_y
            };
        }
    };
}

double gt::dms_to_degrees(const std::array<double, 3>& dms, char hemisphere) {
    double degrees = dms[0] + dms[1] / 60.0 + dms[2] / 3600.0;
    return (hemisphere == 'S' || hemisphere == 'W') ? -degrees : degrees;
}

gt::bounds_source gt::exif_gps_source(double radius) {
    return {
        "exif_gps",
        [radius](const raster_metadata& meta, dimensions<int>)->std::optional<geo_bounds> {
            if (!meta.exif) {
                return {};
            }
            double lat = dms_to_degrees(meta.exif->latitude, meta.exif->latitude_ref);
            double lon = dms_to_degrees(meta.exif->longitude, meta.exif->longitude_ref);
            return geo_bounds{ lon - radius, lat - radius, lon + radius, lat + radius };
        }
    };
}

/*------------------------------------------------------------------------------------------------*/

gt::georeferencer::georeferencer(const geo_bounds& fallback) :
    georeferencer(
        {
            embedded_transform_source(std::make_shared<gdal_crs_transformer>()),
            tiff_tags_source(),
            exif_gps_source()
        },
        fallback
    )
{}

gt::georeferencer::georeferencer(std::vector<bounds_source> sources, const geo_bounds& fallback) :
    sources_(std::move(sources)),
    fallback_(fallback.is_valid() ? fallback : default_bounds())
{}

void gt::georeferencer::add_source(const bounds_source& src, size_t index) {
    index = std::min(index, sources_.size());
    sources_.insert(sources_.begin() + index, src);
}

void gt::georeferencer::add_source(const bounds_source& src) {
    add_source(src, sources_.size());
}

const std::vector<gt::bounds_source>& gt::georeferencer::sources() const {
    return sources_;
}

gt::georeference_result gt::georeferencer::georeference(const raster_metadata& meta,
        dimensions<int> dims, const std::string& path, const callbacks& cbs) const {
    diagnostics diag(cbs);
    for (const auto& src : sources_) {
        try {
            auto bounds = src.fn(meta, dims);
            if (bounds && bounds->is_valid()) {
                diag.log("georeferenced " + path + " from " + src.name + ": " + to_string(*bounds));
                return { *bounds, src.name, false };
            }
            if (bounds) {
                diag.log(src.name + " produced invalid bounds " + to_string(*bounds));
            }
        } catch (const std::exception& e) {
            diag.log(src.name + " failed for " + path + ": " + e.what());
        }
    }
    diag.georeference_degraded(path, fallback_);
    return { fallback_, "default", true };
}

gt::georeference_result gt::georeferencer::georeference(const raster& ras,
        const callbacks& cbs) const {
    return georeference(ras.metadata, ras.dims(), ras.path, cbs);
}
