#include "util.hpp"
#include "diagnostics.hpp"
#include <opencv2/imgproc.hpp>
#include <opencv2/imgcodecs.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <range/v3/all.hpp>
#include <algorithm>
#include <array>
#include <cctype>

/*------------------------------------------------------------------------------------------------*/

namespace r = ranges;
namespace rv = ranges::views;

cv::Mat gt::convert_to_1channel_gray(const cv::Mat& img, bool invert) {
    cv::Mat gray;
    switch (img.channels()) {
        case 1:
            gray = img.clone();
            break;
        case 3:
            cv::cvtColor(img, gray, cv::COLOR_BGR2GRAY);
            break;
        case 4:
            cv::cvtColor(img, gray, cv::COLOR_BGRA2GRAY);
            break;
        default:
            throw std::runtime_error("unsupported channel count: " + std::to_string(img.channels()));
    }
    if (invert) {
        gray = cv::Scalar::all(255) - gray;
    }
    return gray;
}

cv::Mat gt::convert_to_3channel_bgr(const cv::Mat& img) {
    cv::Mat bgr;
    switch (img.channels()) {
        case 1:
            cv::cvtColor(img, bgr, cv::COLOR_GRAY2BGR);
            break;
        case 3:
            bgr = img.clone();
            break;
        case 4:
            cv::cvtColor(img, bgr, cv::COLOR_BGRA2BGR);
            break;
        default:
            throw std::runtime_error("unsupported channel count: " + std::to_string(img.channels()));
    }
    return bgr;
}

cv::Mat gt::qimage_to_mat(QImage image, bool copy) {
    if (image.isNull()) {
        return {};
    }
    if (image.isGrayscale() && image.format() != QImage::Format::Format_Grayscale8) {
        image = image.convertToFormat(QImage::Format::Format_Grayscale8);
    } else if (!image.isGrayscale() && image.format() != QImage::Format::Format_BGR888) {
        image = image.convertToFormat(QImage::Format::Format_BGR888);
    }

    if (image.format() == QImage::Format::Format_BGR888) {
        cv::Mat mat(image.height(), image.width(), CV_8UC3,
            image.bits(), static_cast<size_t>(image.bytesPerLine()));
        return copy ? mat.clone() : mat;
    } else if (image.format() == QImage::Format::Format_Grayscale8) {
        cv::Mat mat(image.height(), image.width(), CV_8UC1,
            image.bits(), static_cast<size_t>(image.bytesPerLine()));
        return copy ? mat.clone() : mat;
    }
    return {};
}

gt::dimensions<int> gt::mat_dimensions(const cv::Mat& mat) {
    return { mat.cols, mat.rows };
}

std::vector<uchar> gt::unique_gray_values(const cv::Mat& input) {
    if (input.channels() != 1) {
        throw std::runtime_error("called unique_gray_values on color image");
    }
    std::array<bool, 256> grays = {};
    for (int y = 0; y < input.rows; ++y) {
        const uchar* row = input.ptr<uchar>(y);
        for (int x = 0; x < input.cols; ++x) {
            grays[row[x]] = true;
        }
    }
    return rv::iota(0) |
        rv::take(256) |
        rv::filter([&grays](int g) {return grays[g]; }) |
        r::to<std::vector<uchar>>();
}

bool gt::is_binary_mask(const cv::Mat& mat) {
    if (mat.empty() || mat.type() != CV_8UC1) {
        return false;
    }
    auto values = unique_gray_values(mat);
    return r::all_of(values, [](uchar v) { return v == 0 || v == 255; });
}

void gt::write_image(const std::string& path, const cv::Mat& mat) {
    bool success = false;
    try {
        success = cv::imwrite(path, mat);
    } catch (const cv::Exception& e) {
        throw artifact_write_error("unable to write " + path + ": " + e.what());
    }
    if (!success) {
        throw artifact_write_error("unable to write " + path);
    }
}

gt::json gt::point_to_json(const point& pt) {
    return json::array({ pt.x, pt.y });
}

gt::json gt::ring_to_json(const ring& rng) {
    json js = json::array();
    for (const auto& pt : rng) {
        js.push_back(point_to_json(pt));
    }
    return js;
}

gt::point gt::json_to_point(const json& js) {
    if (!js.is_array() || js.size() < 2) {
        throw std::runtime_error("expected a coordinate pair");
    }
    return { js[0].get<double>(), js[1].get<double>() };
}

gt::ring gt::json_to_ring(const json& js) {
    if (!js.is_array()) {
        throw std::runtime_error("expected an array of coordinates");
    }
    gt::ring rng;
    for (const auto& pt : js) {
        rng.push_back(json_to_point(pt));
    }
    return rng;
}

std::string gt::to_lower(const std::string& str) {
    std::string output = str;
    std::transform(output.begin(), output.end(), output.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return output;
}

std::string gt::unique_id() {
    thread_local boost::uuids::random_generator gen;
    auto id = boost::uuids::to_string(gen());
    id.erase(std::remove(id.begin(), id.end(), '-'), id.end());
    return id;
}
