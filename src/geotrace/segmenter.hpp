#pragma once

#include "geometry.hpp"
#include "diagnostics.hpp"
#include "util.hpp"
#include <array>
#include <optional>
#include <string>
#include <variant>
#include <opencv2/core.hpp>

/*------------------------------------------------------------------------------------------------*/

namespace gt {

    enum class feature_type {
        buildings,
        trees,
        water,
        roads,
        other
    };

    constexpr size_t k_num_feature_types = 5;

    feature_type parse_feature_type(const std::string& str);
    std::string to_string(feature_type type);

    // local Gaussian-weighted threshold; robust to uneven illumination.
    struct adaptive_threshold {
        int block_size;
        double c;
    };

    // channel: 0 = red, 1 = green, 2 = blue. Anything else thresholds the gray image.
    struct channel_threshold {
        int channel;
        double threshold;
    };

    // Otsu's method, no parameters.
    struct otsu_threshold {};

    using threshold_kind = std::variant<adaptive_threshold, channel_threshold, otsu_threshold>;

    struct segmentation_strategy {
        threshold_kind threshold;
        double smoothing_sigma;
    };

    segmentation_strategy default_strategy(feature_type type);

    class segmentation_settings {
    private:
        std::array<segmentation_strategy, k_num_feature_types> strategies_;
    public:
        segmentation_settings();
        const segmentation_strategy& strategy(feature_type type) const;
        void set_strategy(feature_type type, const segmentation_strategy& strat);
    };

    void to_json(json& js, const segmentation_strategy& s);
    void from_json(const json& js, segmentation_strategy& s);
    void to_json(json& js, const segmentation_settings& s);
    void from_json(const json& js, segmentation_settings& s);

    struct segmentation_result {
        cv::Mat mask;   // CV_8UC1, every value 0 or 255
        dimensions<int> dims;
    };

    segmentation_result segment(const cv::Mat& image, const segmentation_strategy& strategy);
    segmentation_result segment(const cv::Mat& image, feature_type type,
        const segmentation_settings& settings = {});

    // std::nullopt when the file cannot be decoded; callers treat that as "nothing to extract".
    std::optional<segmentation_result> segment_raster_file(const std::string& path,
        feature_type type, const segmentation_settings& settings = {},
        const std::string& mask_output_path = {}, const callbacks& cbs = {});
}
