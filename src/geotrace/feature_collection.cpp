#include "feature_collection.hpp"
#include <range/v3/all.hpp>
#include <cmath>
#include <fstream>

/*------------------------------------------------------------------------------------------------*/

namespace r = ranges;
namespace rv = ranges::views;

namespace {

    bool is_finite(const gt::ring& rng) {
        return r::all_of(rng,
            [](const gt::point& pt) { return std::isfinite(pt.x) && std::isfinite(pt.y); }
        );
    }

    gt::json polygon_coordinates(const gt::polygon& poly) {
        gt::json rings = gt::json::array();
        rings.push_back(gt::ring_to_json(poly.outer()));
        for (const auto& hole : poly.inners()) {
            rings.push_back(gt::ring_to_json(hole));
        }
        return rings;
    }

    gt::polygon coordinates_to_polygon(const gt::json& js) {
        if (!js.is_array() || js.empty()) {
            throw gt::geojson_error("polygon coordinates must be a non-empty array of rings");
        }
        gt::polygon poly;
        poly.outer() = gt::json_to_ring(js[0]);
        for (size_t i = 1; i < js.size(); ++i) {
            auto hole = gt::json_to_ring(js[i]);
            poly.inners().emplace_back(hole.begin(), hole.end());
        }
        return poly;
    }
}

gt::json gt::geometry_to_json(const std::vector<polygon>& geometry) {
    if (geometry.size() == 1) {
        return {
            {"type", "Polygon"},
            {"coordinates", polygon_coordinates(geometry.front())}
        };
    }
    return {
        {"type", "MultiPolygon"},
        {"coordinates", geometry | rv::transform(polygon_coordinates) | r::to<std::vector<gt::json>>()}
    };
}

std::vector<gt::polygon> gt::json_to_geometry(const json& js) {
    if (!js.is_object() || !js.contains("type") || !js.contains("coordinates")) {
        throw gt::geojson_error("geometry requires type and coordinates");
    }
    auto type = js.at("type").get<std::string>();
    const auto& coords = js.at("coordinates");
    if (type == "Polygon") {
        return { coordinates_to_polygon(coords) };
    } else if (type == "MultiPolygon") {
        if (!coords.is_array()) {
            throw gt::geojson_error("MultiPolygon coordinates must be an array");
        }
        std::vector<gt::polygon> polys;
        for (const auto& poly : coords) {
            polys.push_back(coordinates_to_polygon(poly));
        }
        return polys;
    }
    throw gt::geojson_error("unsupported geometry type: " + type);
}

bool gt::feature_collection::empty() const {
    return features.empty();
}

size_t gt::feature_collection::size() const {
    return features.size();
}

gt::matrix gt::pixel_to_geo_matrix(dimensions<int> dims, const geo_bounds& b) {
    if (dims.empty()) {
        throw std::runtime_error("raster dimensions must be positive");
    }
    double x_scale = (b.east - b.west) / dims.wd;
    double y_scale = (b.north - b.south) / dims.hgt;
    return translation_matrix(b.west, b.north) * scale_matrix(x_scale, -y_scale);
}

gt::feature_collection gt::assemble_feature_collection(const std::vector<polygon>& polys,
        dimensions<int> dims, const geo_bounds& bounds, const std::string& feature_type,
        const callbacks& cbs) {
    auto fc = empty_feature_collection(feature_type);
    fc.bounds = bounds;
    if (polys.empty()) {
        return fc;
    }

    auto mat = pixel_to_geo_matrix(dims, bounds);
    size_t dropped = 0;
    for (const auto& poly : polys) {
        auto outer = transform(poly.outer(), mat);
        if (is_degenerate_ring(outer) || !is_closed(outer) || !is_finite(outer)) {
            ++dropped;
            continue;
        }
        int id = static_cast<int>(fc.features.size()) + 1;
        polygon geo_poly;
        geo_poly.outer() = std::move(outer);
        fc.features.push_back({
            id,
            { std::move(geo_poly) },
            { {"name", "Feature " + std::to_string(id)} }
        });
    }
    diagnostics(cbs).polygons_dropped(pipeline_stage::assemble, dropped);
    return fc;
}

gt::feature_collection gt::empty_feature_collection(const std::string& feature_type) {
    feature_collection fc;
    fc.feature_type = feature_type;
    return fc;
}

/*------------------------------------------------------------------------------------------------*/

void gt::to_json(json& js, const feature& f) {
    js = json{
        {"type", "Feature"},
        {"id", f.id},
        {"properties", f.properties.is_null() ? json::object() : f.properties},
        {"geometry", geometry_to_json(f.geometry)}
    };
}

void gt::from_json(const json& js, feature& f) {
    if (!js.is_object() || js.value("type", "") != "Feature") {
        throw geojson_error("expected a Feature object");
    }
    if (!js.contains("geometry")) {
        throw geojson_error("feature has no geometry");
    }
    f.id = js.contains("id") && js["id"].is_number_integer() ? js["id"].get<int>() : 0;
    f.properties = js.contains("properties") && js["properties"].is_object() ?
        js["properties"] : json::object();
    f.geometry = json_to_geometry(js["geometry"]);
}

void gt::to_json(json& js, const feature_collection& fc) {
    js = json{
        {"type", "FeatureCollection"},
        {"feature_type", fc.feature_type},
        {"features", fc.features}
    };
    if (fc.bounds) {
        js["bbox"] = *fc.bounds;
    }
    if (!fc.georeference_source.empty()) {
        js["georeference_source"] = fc.georeference_source;
        js["georeference_degraded"] = fc.georeference_degraded;
    }
}

void gt::from_json(const json& js, feature_collection& fc) {
    if (!js.is_object() || js.value("type", "") != "FeatureCollection") {
        throw geojson_error("expected a FeatureCollection object");
    }
    if (!js.contains("features") || !js["features"].is_array()) {
        throw geojson_error("FeatureCollection has no features array");
    }
    fc.feature_type = js.value("feature_type", "");
    fc.features.clear();
    for (const auto& f : js["features"]) {
        fc.features.push_back(f.get<feature>());
    }
    fc.bounds = {};
    if (js.contains("bbox")) {
        try {
            fc.bounds = js["bbox"].get<geo_bounds>();
        } catch (const std::exception& e) {
            throw geojson_error(std::string("malformed bbox: ") + e.what());
        }
    }
    fc.georeference_source = js.value("georeference_source", "");
    fc.georeference_degraded = js.value("georeference_degraded", false);
}

void gt::write_geojson(const std::string& path, const feature_collection& fc) {
    std::ofstream outfile(path);
    if (!outfile) {
        throw artifact_write_error("unable to write " + path);
    }
    json js = fc;
    outfile << js.dump(4);
    if (!outfile) {
        throw artifact_write_error("error writing " + path);
    }
}

gt::feature_collection gt::read_geojson(const std::string& path) {
    std::ifstream infile(path);
    if (!infile) {
        throw geojson_error("unable to open " + path);
    }
    try {
        json js;
        infile >> js;
        return js.get<feature_collection>();
    } catch (const json::exception& e) {
        throw geojson_error("malformed GeoJSON in " + path + ": " + e.what());
    } catch (const geojson_error&) {
        throw;
    } catch (const std::runtime_error& e) {
        throw geojson_error("malformed GeoJSON in " + path + ": " + e.what());
    }
}
