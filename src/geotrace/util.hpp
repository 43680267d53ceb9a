#pragma once

#include "geometry.hpp"
#include <string>
#include <vector>
#include <QImage>
#include <opencv2/core.hpp>
#include <nlohmann/json.hpp>

template<typename ... Ts>
struct overload : Ts ... {
    using Ts::operator() ...;
};
template<class... Ts> overload(Ts...)->overload<Ts...>;

/*------------------------------------------------------------------------------------------------*/

namespace gt {

    using json = nlohmann::json;

    // image processing
    cv::Mat convert_to_1channel_gray(const cv::Mat& img, bool invert = false);
    cv::Mat convert_to_3channel_bgr(const cv::Mat& img);
    cv::Mat qimage_to_mat(QImage img, bool copy = true);
    dimensions<int> mat_dimensions(const cv::Mat& mat);
    std::vector<uchar> unique_gray_values(const cv::Mat& input);
    bool is_binary_mask(const cv::Mat& mat);
    void write_image(const std::string& path, const cv::Mat& mat);

    // json
    json point_to_json(const point& pt);
    json ring_to_json(const ring& r);
    point json_to_point(const json& js);
    ring json_to_ring(const json& js);

    // etc.
    std::string to_lower(const std::string& str);
    std::string unique_id();
}
