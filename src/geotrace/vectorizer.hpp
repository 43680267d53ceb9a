#pragma once

#include "geometry.hpp"
#include "diagnostics.hpp"
#include "util.hpp"
#include <vector>
#include <opencv2/core.hpp>

/*------------------------------------------------------------------------------------------------*/

namespace gt {

    struct vectorizer_settings {
        double min_area = 50.0;          // square pixels
        double epsilon_factor = 0.002;   // Douglas-Peucker epsilon as a fraction of the perimeter
        int binarize_threshold = 127;
    };

    void to_json(json& js, const vectorizer_settings& s);
    void from_json(const json& js, vectorizer_settings& s);

    // outer contours of the foreground of a binary mask as closed, valid polygons in pixel space.
    std::vector<polygon> vectorize(const cv::Mat& mask, const vectorizer_settings& settings = {},
        const callbacks& cbs = {});
}
