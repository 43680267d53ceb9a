#pragma once

#include "preprocess.hpp"
#include "segmenter.hpp"
#include "vectorizer.hpp"
#include "postprocess.hpp"
#include "georeference.hpp"
#include "detector.hpp"
#include "util.hpp"
#include <string>

/*------------------------------------------------------------------------------------------------*/

namespace gt {

    // which image the segmenter thresholds.
    enum class segment_source {
        preprocessed,
        original
    };

    struct pipeline_config {
        preprocess_settings preprocess;
        segmentation_settings segmentation;
        vectorizer_settings vectorizer;
        postprocess_settings postprocess;
        detector_params detector;
        geo_bounds fallback_bounds = default_bounds();
        segment_source source = segment_source::preprocessed;
    };

    void to_json(json& js, const pipeline_config& cfg);
    void from_json(const json& js, pipeline_config& cfg);

    // missing keys keep their defaults. Throws config_error.
    pipeline_config parse_config(const std::string& text);
    pipeline_config load_config(const std::string& path);
    void save_config(const std::string& path, const pipeline_config& cfg);
}
