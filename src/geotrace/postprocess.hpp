#pragma once

#include "geometry.hpp"
#include "diagnostics.hpp"
#include "segmenter.hpp"
#include "util.hpp"
#include <vector>

/*------------------------------------------------------------------------------------------------*/

namespace gt {

    struct postprocess_settings {
        double simplify_tolerance = 2.0;
        double regularize_ratio = 0.8;
        double merge_distance = 5.0;
    };

    void to_json(json& js, const postprocess_settings& s);
    void from_json(const json& js, postprocess_settings& s);

    std::vector<polygon> simplify_polygons(const std::vector<polygon>& polys,
        double tolerance = 2.0, const callbacks& cbs = {});

    // polygons that nearly fill their bounding box are replaced by the box.
    std::vector<polygon> regularize_polygons(const std::vector<polygon>& polys,
        double ratio_threshold = 0.8);

    std::vector<polygon> merge_nearby_polygons(const std::vector<polygon>& polys,
        double distance = 5.0, const callbacks& cbs = {});

    // simplify, regularize (buildings only), merge.
    std::vector<polygon> post_process(const std::vector<polygon>& polys, feature_type type,
        const postprocess_settings& settings = {}, const callbacks& cbs = {});
}
