#include "detector.hpp"
#include <range/v3/all.hpp>

/*------------------------------------------------------------------------------------------------*/

namespace r = ranges;
namespace rv = ranges::views;

namespace {

    const gt::json& features_array(const gt::json& js) {
        if (js.is_array()) {
            return js;
        }
        if (js.is_object() && js.contains("features") && js["features"].is_array()) {
            return js["features"];
        }
        throw gt::geojson_error("detector output is neither a FeatureCollection nor a feature array");
    }

    std::optional<gt::feature> adapt_feature(const gt::json& js, int index) {
        if (!js.is_object() || !js.contains("geometry")) {
            return {};
        }
        gt::feature f;
        try {
            f.geometry = gt::json_to_geometry(js["geometry"]);
        } catch (const std::runtime_error&) {
            return {};
        }
        if (f.geometry.empty() || r::any_of(f.geometry,
                [](const auto& poly) { return gt::is_degenerate_ring(poly.outer()); })) {
            return {};
        }
        f.id = (js.contains("id") && js["id"].is_number_integer()) ? js["id"].get<int>() : index + 1;
        f.properties = (js.contains("properties") && js["properties"].is_object()) ?
            js["properties"] : gt::json{ {"id", index} };
        return f;
    }
}

void gt::to_json(json& js, const detector_params& p) {
    js = json{
        {"confidence_threshold", p.confidence_threshold},
        {"mask_threshold", p.mask_threshold},
        {"min_area", p.min_area}
    };
}

void gt::from_json(const json& js, detector_params& p) {
    p.confidence_threshold = js.value("confidence_threshold", p.confidence_threshold);
    p.mask_threshold = js.value("mask_threshold", p.mask_threshold);
    p.min_area = js.value("min_area", p.min_area);
}

gt::feature_collection gt::detections_to_feature_collection(
        const std::vector<detection>& detections, const detector_params& params,
        const std::string& feature_type, const callbacks& cbs) {
    auto fc = empty_feature_collection(feature_type);
    fc.georeference_source = "detector";

    auto confident = detections |
        rv::filter([&params](const auto& d) { return d.confidence >= params.confidence_threshold; }) |
        r::to_vector;

    for (const auto& d : confident) {
        if (!is_valid_polygon(d.outline)) {
            continue;
        }
        int id = static_cast<int>(fc.features.size()) + 1;
        fc.features.push_back({
            id,
            { d.outline },
            {
                {"name", "Feature " + std::to_string(id)},
                {"confidence", d.confidence}
            }
        });
    }
    diagnostics(cbs).polygons_dropped(pipeline_stage::detector, confident.size() - fc.features.size());
    return fc;
}

gt::feature_collection gt::adapt_detector_geojson(const json& js, const std::string& feature_type,
        const callbacks& cbs) {
    const auto& features = features_array(js);
    auto fc = empty_feature_collection(feature_type);
    fc.georeference_source = "detector";

    int index = 0;
    for (const auto& item : features) {
        auto f = adapt_feature(item, index++);
        if (f) {
            fc.features.push_back(std::move(*f));
        }
    }
    diagnostics(cbs).polygons_dropped(pipeline_stage::detector, features.size() - fc.features.size());
    return fc;
}
