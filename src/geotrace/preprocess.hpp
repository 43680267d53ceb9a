#pragma once

#include "raster.hpp"
#include "util.hpp"
#include <string>
#include <opencv2/core.hpp>

/*------------------------------------------------------------------------------------------------*/

namespace gt {

    struct preprocess_settings {
        int blur_kernel = 5;
        int adaptive_block_size = 11;
        double adaptive_c = 2.0;
        double canny_low = 50.0;
        double canny_high = 150.0;
        int close_kernel = 3;
    };

    void to_json(json& js, const preprocess_settings& s);
    void from_json(const json& js, preprocess_settings& s);

    struct preprocessed_raster {
        std::string path;
        cv::Mat image;
    };

    // gray -> blur -> adaptive threshold -> canny -> closing. Single channel output.
    cv::Mat enhance_structure(const cv::Mat& img, const preprocess_settings& settings = {});

    // writes <invocation_id>_processed.png into output_dir.
    preprocessed_raster preprocess_raster(const raster& src, const std::string& output_dir,
        const std::string& invocation_id, const preprocess_settings& settings = {});
}
