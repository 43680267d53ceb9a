#include "vectorizer.hpp"
#include <opencv2/imgproc.hpp>
#include <range/v3/all.hpp>
#include <stdexcept>

/*------------------------------------------------------------------------------------------------*/

namespace r = ranges;
namespace rv = ranges::views;

namespace {

    using int_polyline = std::vector<cv::Point>;

    cv::Mat binarize(const cv::Mat& mask, int threshold) {
        if (gt::is_binary_mask(mask)) {
            return mask;
        }
        auto gray = gt::convert_to_1channel_gray(mask);
        if (gray.depth() != CV_8U) {
            gray.convertTo(gray, CV_8U);
        }
        cv::Mat binary;
        cv::threshold(gray, binary, threshold, 255, cv::THRESH_BINARY);
        return binary;
    }

    std::vector<int_polyline> find_outer_contours(const cv::Mat& binary) {
        std::vector<int_polyline> contours;
        cv::Mat input = binary.clone();
        cv::findContours(input, contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_SIMPLE);
        return contours;
    }

    int_polyline apply_douglas_peucker(const int_polyline& contour, double epsilon_factor) {
        int_polyline output;
        double epsilon = cv::arcLength(contour, true) * epsilon_factor;
        cv::approxPolyDP(contour, output, epsilon, true);
        return output;
    }

    std::vector<gt::point> to_points(const int_polyline& poly) {
        return poly |
            rv::transform([](const cv::Point& pt) { return gt::point(pt.x, pt.y); }) |
            r::to_vector;
    }
}

void gt::to_json(json& js, const vectorizer_settings& s) {
    js = json{
        {"min_area", s.min_area},
        {"epsilon_factor", s.epsilon_factor},
        {"binarize_threshold", s.binarize_threshold}
    };
}

void gt::from_json(const json& js, vectorizer_settings& s) {
    s.min_area = js.value("min_area", s.min_area);
    s.epsilon_factor = js.value("epsilon_factor", s.epsilon_factor);
    s.binarize_threshold = js.value("binarize_threshold", s.binarize_threshold);
}

std::vector<gt::polygon> gt::vectorize(const cv::Mat& mask, const vectorizer_settings& settings,
        const callbacks& cbs) {
    diagnostics diag(cbs);
    if (mask.empty()) {
        return {};
    }

    auto contours = find_outer_contours(binarize(mask, settings.binarize_threshold));

    std::vector<polygon> polys;
    size_t dropped = 0;
    for (const auto& contour : contours) {
        if (cv::contourArea(contour) < settings.min_area) {
            continue;
        }
        auto simplified = apply_douglas_peucker(contour, settings.epsilon_factor);
        if (simplified.size() < 3) {
            ++dropped;
            continue;
        }
        auto verts = to_points(simplified);
        auto poly = make_polygon(verts);
        if (!is_valid_polygon(poly)) {
            ++dropped;
            continue;
        }
        polys.push_back(std::move(poly));
    }

    diag.polygons_dropped(pipeline_stage::vectorize, dropped);
    diag.log("vectorized " + std::to_string(polys.size()) + " polygons from " +
        std::to_string(contours.size()) + " contours");
    return polys;
}
