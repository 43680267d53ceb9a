#pragma once

#include "geometry.hpp"
#include "georeference.hpp"
#include "diagnostics.hpp"
#include "util.hpp"
#include <optional>
#include <string>
#include <vector>

/*------------------------------------------------------------------------------------------------*/

namespace gt {

    // coordinates are lon/lat. A single polygon serializes as "Polygon", several as "MultiPolygon".
    struct feature {
        int id;
        std::vector<polygon> geometry;
        json properties;
    };

    struct feature_collection {
        std::vector<feature> features;
        std::string feature_type;
        std::optional<geo_bounds> bounds;
        std::string georeference_source;
        bool georeference_degraded = false;

        bool empty() const;
        size_t size() const;
    };

    // pixel space to lon/lat: x -> west .. east, y -> north .. south.
    matrix pixel_to_geo_matrix(dimensions<int> dims, const geo_bounds& bounds);

    feature_collection assemble_feature_collection(const std::vector<polygon>& polys,
        dimensions<int> dims, const geo_bounds& bounds, const std::string& feature_type,
        const callbacks& cbs = {});

    feature_collection empty_feature_collection(const std::string& feature_type);

    json geometry_to_json(const std::vector<polygon>& geometry);
    std::vector<polygon> json_to_geometry(const json& js);

    void to_json(json& js, const feature& f);
    void from_json(const json& js, feature& f);
    void to_json(json& js, const feature_collection& fc);
    void from_json(const json& js, feature_collection& fc);

    void write_geojson(const std::string& path, const feature_collection& fc);
    feature_collection read_geojson(const std::string& path);
}
