#pragma once

#include "config.hpp"
#include "detector.hpp"
#include "feature_collection.hpp"
#include "georeference.hpp"
#include "segmenter.hpp"
#include "diagnostics.hpp"
#include <string>
#include <opencv2/core.hpp>

/*------------------------------------------------------------------------------------------------*/

namespace gt {

    // <output_dir>/<raster basename>_<feature type>.geojson
    std::string geojson_output_path(const std::string& raster_path, const std::string& output_dir,
        feature_type type);

    // loads, preprocesses, segments, vectorizes, post-processes, georeferences and writes the
    // result to geojson_output_path(...). Throws image_decode_error if the raster is unreadable.
    feature_collection extract_features(const std::string& raster_path, const std::string& output_dir,
        feature_type type, const pipeline_config& cfg = {}, const callbacks& cbs = {},
        const detector_registry& detectors = {});

    feature_collection extract_features_from_mask(const cv::Mat& mask, feature_type type,
        const geo_bounds& bounds, const pipeline_config& cfg = {}, const callbacks& cbs = {});
}
