#include "preprocess.hpp"
#include "diagnostics.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <filesystem>

/*------------------------------------------------------------------------------------------------*/

namespace {

    int odd_at_least(int val, int min_val) {
        val = std::max(val, min_val);
        return (val % 2 == 0) ? val + 1 : val;
    }

}

void gt::to_json(json& js, const preprocess_settings& s) {
    js = json{
        {"blur_kernel", s.blur_kernel},
        {"adaptive_block_size", s.adaptive_block_size},
        {"adaptive_c", s.adaptive_c},
        {"canny_low", s.canny_low},
        {"canny_high", s.canny_high},
        {"close_kernel", s.close_kernel}
    };
}

void gt::from_json(const json& js, preprocess_settings& s) {
    s.blur_kernel = js.value("blur_kernel", s.blur_kernel);
    s.adaptive_block_size = js.value("adaptive_block_size", s.adaptive_block_size);
    s.adaptive_c = js.value("adaptive_c", s.adaptive_c);
    s.canny_low = js.value("canny_low", s.canny_low);
    s.canny_high = js.value("canny_high", s.canny_high);
    s.close_kernel = js.value("close_kernel", s.close_kernel);
}

cv::Mat gt::enhance_structure(const cv::Mat& img, const preprocess_settings& settings) {
    auto gray = convert_to_1channel_gray(img);

    cv::Mat blurred;
    int ksz = odd_at_least(settings.blur_kernel, 1);
    cv::GaussianBlur(gray, blurred, { ksz, ksz }, 0);

    cv::Mat thresh;
    cv::adaptiveThreshold(blurred, thresh, 255, cv::ADAPTIVE_THRESH_GAUSSIAN_C,
        cv::THRESH_BINARY_INV, odd_at_least(settings.adaptive_block_size, 3), settings.adaptive_c);

    cv::Mat edges;
    cv::Canny(thresh, edges, settings.canny_low, settings.canny_high);

    int close_sz = std::max(settings.close_kernel, 1);
    cv::Mat kernel = cv::Mat::ones(close_sz, close_sz, CV_8U);
    cv::Mat closed;
    cv::morphologyEx(edges, closed, cv::MORPH_CLOSE, kernel);

    return closed;
}

gt::preprocessed_raster gt::preprocess_raster(const raster& src, const std::string& output_dir,
        const std::string& invocation_id, const preprocess_settings& settings) {
    if (src.pixels.empty()) {
        throw image_decode_error(src.path, "raster has no pixel data");
    }
    auto enhanced = enhance_structure(src.pixels, settings);
    auto path = (std::filesystem::path(output_dir) / (invocation_id + "_processed.png")).string();
    write_image(path, enhanced);
    return { path, enhanced };
}
