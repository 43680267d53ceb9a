#pragma once

#include "geometry.hpp"
#include "raster.hpp"
#include "diagnostics.hpp"
#include "util.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

/*------------------------------------------------------------------------------------------------*/

namespace gt {

    // WGS84 longitude/latitude.
    struct geo_bounds {
        double west;
        double south;
        double east;
        double north;

        bool is_valid() const;
        bool operator==(const geo_bounds&) const = default;
    };

    // the open-Atlantic placeholder used when nothing else can be determined.
    geo_bounds default_bounds();

    void to_json(json& js, const geo_bounds& b);
    void from_json(const json& js, geo_bounds& b);

    class crs_transformer {
    public:
        virtual bool is_wgs84(const std::string& crs) const = 0;
        virtual geo_bounds to_wgs84(const std::string& crs, const geo_bounds& bounds) const = 0;
        virtual ~crs_transformer() = default;
    };

    // OGRCoordinateTransformation based. Throws std::runtime_error on unknown CRS.
    class gdal_crs_transformer : public crs_transformer {
    public:
        bool is_wgs84(const std::string& crs) const override;
        geo_bounds to_wgs84(const std::string& crs, const geo_bounds& bounds) const override;
    };

    using bounds_fn = std::function<std::optional<geo_bounds>(const raster_metadata&, dimensions<int>)>;

    struct bounds_source {
        std::string name;
        bounds_fn fn;
    };

    bounds_source embedded_transform_source(std::shared_ptr<const crs_transformer> transformer);
    bounds_source tiff_tags_source();
    bounds_source exif_gps_source(double radius = 0.001);

    double dms_to_degrees(const std::array<double, 3>& dms, char hemisphere);

    struct georeference_result {
        geo_bounds bounds;
        std::string source;
        bool degraded;
    };

    class georeferencer {
    private:
        std::vector<bounds_source> sources_;
        geo_bounds fallback_;

    public:
        // embedded transform, TIFF tags, EXIF GPS, then the fallback box.
        georeferencer(const geo_bounds& fallback = default_bounds());
        georeferencer(std::vector<bounds_source> sources, const geo_bounds& fallback = default_bounds());

        // index == sources().size() appends.
        void add_source(const bounds_source& src, size_t index);
        void add_source(const bounds_source& src);
        const std::vector<bounds_source>& sources() const;

        georeference_result georeference(const raster_metadata& meta, dimensions<int> dims,
            const std::string& path = {}, const callbacks& cbs = {}) const;
        georeference_result georeference(const raster& ras, const callbacks& cbs = {}) const;
    };

    std::string to_string(const geo_bounds& b);
}
