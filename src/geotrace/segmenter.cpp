#include "segmenter.hpp"
#include "raster.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <stdexcept>
#include <unordered_map>

/*------------------------------------------------------------------------------------------------*/

namespace {

    constexpr size_t index_of(gt::feature_type type) {
        return static_cast<size_t>(type);
    }

    constexpr std::array<gt::feature_type, gt::k_num_feature_types> k_all_types = {
        gt::feature_type::buildings,
        gt::feature_type::trees,
        gt::feature_type::water,
        gt::feature_type::roads,
        gt::feature_type::other
    };

    // returns the requested RGB channel of a BGR image, or gray if the channel doesn't exist.
    cv::Mat select_channel(const cv::Mat& img, int rgb_channel) {
        if (img.channels() < 3 || rgb_channel < 0 || rgb_channel > 2) {
            return gt::convert_to_1channel_gray(img);
        }
        cv::Mat channel;
        cv::extractChannel(img, channel, 2 - rgb_channel);
        return channel;
    }

    cv::Mat smooth(const cv::Mat& img, double sigma) {
        if (sigma <= 0.0) {
            return img.clone();
        }
        cv::Mat blurred;
        cv::GaussianBlur(img, blurred, { 0, 0 }, sigma);
        return blurred;
    }

    cv::Mat apply_threshold(const cv::Mat& img, const gt::segmentation_strategy& strategy) {
        cv::Mat mask;
        std::visit(
            overload{
                [&](const gt::adaptive_threshold& t) {
                    auto gray = smooth(gt::convert_to_1channel_gray(img), strategy.smoothing_sigma);
                    int block = std::max(t.block_size, 3);
                    if (block % 2 == 0) {
                        ++block;
                    }
                    cv::adaptiveThreshold(gray, mask, 255, cv::ADAPTIVE_THRESH_GAUSSIAN_C,
                        cv::THRESH_BINARY, block, t.c);
                },
                [&](const gt::channel_threshold& t) {
                    auto channel = smooth(select_channel(img, t.channel), strategy.smoothing_sigma);
                    cv::threshold(channel, mask, t.threshold, 255, cv::THRESH_BINARY);
                },
                [&](const gt::otsu_threshold&) {
                    auto gray = smooth(gt::convert_to_1channel_gray(img), strategy.smoothing_sigma);
                    cv::threshold(gray, mask, 0, 255, cv::THRESH_BINARY | cv::THRESH_OTSU);
                }
            },
            strategy.threshold
        );
        return mask;
    }

    std::string threshold_kind_name(const gt::threshold_kind& kind) {
        return std::visit(
            overload{
                [](const gt::adaptive_threshold&) { return std::string("adaptive"); },
                [](const gt::channel_threshold&) { return std::string("channel"); },
                [](const gt::otsu_threshold&) { return std::string("otsu"); }
            },
            kind
        );
    }
}

gt::feature_type gt::parse_feature_type(const std::string& str) {
    static const std::unordered_map<std::string, feature_type> names = {
        {"buildings", feature_type::buildings},
        {"trees", feature_type::trees},
        {"vegetation", feature_type::trees},
        {"water", feature_type::water},
        {"roads", feature_type::roads}
    };
    auto iter = names.find(to_lower(str));
    return (iter != names.end()) ? iter->second : feature_type::other;
}

std::string gt::to_string(feature_type type) {
    switch (type) {
        case feature_type::buildings: return "buildings";
        case feature_type::trees: return "trees";
        case feature_type::water: return "water";
        case feature_type::roads: return "roads";
        case feature_type::other: return "other";
    }
    return "other";
}

gt::segmentation_strategy gt::default_strategy(feature_type type) {
    switch (type) {
        case feature_type::buildings:
            return { adaptive_threshold{ 15, 2.0 }, 1.0 };
        case feature_type::trees:
            return { channel_threshold{ 1, 140.0 }, 1.5 };
        case feature_type::water:
            return { channel_threshold{ 0, 120.0 }, 2.0 };
        default:
            return { otsu_threshold{}, 1.0 };
    }
}

/*------------------------------------------------------------------------------------------------*/

gt::segmentation_settings::segmentation_settings() {
    for (auto type : k_all_types) {
        strategies_[index_of(type)] = default_strategy(type);
    }
}

const gt::segmentation_strategy& gt::segmentation_settings::strategy(feature_type type) const {
    return strategies_.at(index_of(type));
}

void gt::segmentation_settings::set_strategy(feature_type type, const segmentation_strategy& strat) {
    strategies_.at(index_of(type)) = strat;
}

void gt::to_json(json& js, const segmentation_strategy& s) {
    js = json{
        {"method", threshold_kind_name(s.threshold)},
        {"sigma", s.smoothing_sigma}
    };
    std::visit(
        overload{
            [&js](const adaptive_threshold& t) {
                js["block_size"] = t.block_size;
                js["c"] = t.c;
            },
            [&js](const channel_threshold& t) {
                js["channel"] = t.channel;
                js["threshold"] = t.threshold;
            },
            [](const otsu_threshold&) {}
        },
        s.threshold
    );
}

void gt::from_json(const json& js, segmentation_strategy& s) {
    auto method = js.value("method", threshold_kind_name(s.threshold));
    s.smoothing_sigma = js.value("sigma", s.smoothing_sigma);
    if (method == "adaptive") {
        auto prev = std::holds_alternative<adaptive_threshold>(s.threshold) ?
            std::get<adaptive_threshold>(s.threshold) : adaptive_threshold{ 15, 2.0 };
        s.threshold = adaptive_threshold{
            js.value("block_size", prev.block_size),
            js.value("c", prev.c)
        };
    } else if (method == "channel") {
        auto prev = std::holds_alternative<channel_threshold>(s.threshold) ?
            std::get<channel_threshold>(s.threshold) : channel_threshold{ -1, 127.0 };
        s.threshold = channel_threshold{
            js.value("channel", prev.channel),
            js.value("threshold", prev.threshold)
        };
    } else if (method == "otsu") {
        s.threshold = otsu_threshold{};
    } else {
        throw std::runtime_error("unknown segmentation method: " + method);
    }
}

void gt::to_json(json& js, const segmentation_settings& s) {
    js = json::object();
    for (auto type : k_all_types) {
        js[to_string(type)] = s.strategy(type);
    }
}

void gt::from_json(const json& js, segmentation_settings& s) {
    for (auto type : k_all_types) {
        auto key = to_string(type);
        if (js.contains(key)) {
            auto strat = s.strategy(type);
            from_json(js.at(key), strat);
            s.set_strategy(type, strat);
        }
    }
}

/*------------------------------------------------------------------------------------------------*/

gt::segmentation_result gt::segment(const cv::Mat& image, const segmentation_strategy& strategy) {
    if (image.empty()) {
        throw std::runtime_error("cannot segment an empty image");
    }
    auto mask = apply_threshold(image, strategy);
    return { mask, mat_dimensions(mask) };
}

gt::segmentation_result gt::segment(const cv::Mat& image, feature_type type,
        const segmentation_settings& settings) {
    return segment(image, settings.strategy(type));
}

std::optional<gt::segmentation_result> gt::segment_raster_file(const std::string& path,
        feature_type type, const segmentation_settings& settings,
        const std::string& mask_output_path, const callbacks& cbs) {
    diagnostics diag(cbs);
    auto image = decode_image(path);
    if (image.empty()) {
        diag.decode_failure(path, "neither OpenCV nor Qt could decode the image");
        return {};
    }
    auto result = segment(image, type, settings);
    if (!mask_output_path.empty()) {
        write_image(mask_output_path, result.mask);
    }
    diag.log("segmented " + path + " as " + to_string(type));
    return result;
}
