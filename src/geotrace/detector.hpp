#pragma once

#include "geometry.hpp"
#include "feature_collection.hpp"
#include "segmenter.hpp"
#include "diagnostics.hpp"
#include "util.hpp"
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

/*------------------------------------------------------------------------------------------------*/

namespace gt {

    struct detector_params {
        double confidence_threshold = 0.5;
        double mask_threshold = 0.5;
        double min_area = 100.0;   // square pixels
    };

    void to_json(json& js, const detector_params& p);
    void from_json(const json& js, detector_params& p);

    // outline is in lon/lat.
    struct detection {
        polygon outline;
        double confidence;
    };

    class feature_detector {
    public:
        virtual std::string name() const = 0;
        virtual std::vector<detection> detect(const std::string& raster_path,
            const detector_params& params) = 0;
        virtual ~feature_detector() = default;
    };

    using detector_registry = std::unordered_map<feature_type, std::shared_ptr<feature_detector>>;

    feature_collection detections_to_feature_collection(const std::vector<detection>& detections,
        const detector_params& params, const std::string& feature_type, const callbacks& cbs = {});

    // accepts a FeatureCollection or a bare array of features. Throws geojson_error otherwise.
    feature_collection adapt_detector_geojson(const json& js, const std::string& feature_type,
        const callbacks& cbs = {});
}
