#include "postprocess.hpp"
#include <boost/geometry.hpp>
#include <boost/pending/disjoint_sets.hpp>
#include <map>
#include <range/v3/all.hpp>

/*------------------------------------------------------------------------------------------------*/

namespace r = ranges;
namespace rv = ranges::views;
namespace bg = boost::geometry;

namespace {

    bool is_usable(const gt::polygon& poly) {
        return !poly.outer().empty() && gt::is_valid_polygon(poly);
    }

    gt::polygon regularize(const gt::polygon& poly, double ratio_threshold) {
        auto bbox = gt::bounding_rectangle(poly);
        auto bbox_area = gt::rectangle_area(bbox);
        if (bbox_area <= 0.0) {
            return poly;
        }
        if (gt::area(poly) / bbox_area > ratio_threshold) {
            return gt::make_rectangle(bbox);
        }
        return poly;
    }

    // polygons belong together when their separation is under twice the buffer distance.
    // mitred buffers overreach at corners, so they only shape the output, not the grouping.
    std::vector<std::vector<gt::polygon>> proximity_groups(const std::vector<gt::polygon>& polys,
            double distance) {
        auto n = static_cast<int>(polys.size());
        boost::disjoint_sets_with_storage<> sets(n);
        for (int i = 0; i < n; ++i) {
            for (int j = i + 1; j < n; ++j) {
                if (bg::distance(polys[i], polys[j]) < 2.0 * distance) {
                    sets.union_set(i, j);
                }
            }
        }
        std::map<int, std::vector<gt::polygon>> groups;
        for (int i = 0; i < n; ++i) {
            groups[sets.find_set(i)].push_back(polys[i]);
        }
        return groups | rv::values | r::to_vector;
    }
}

void gt::to_json(json& js, const postprocess_settings& s) {
    js = json{
        {"simplify_tolerance", s.simplify_tolerance},
        {"regularize_ratio", s.regularize_ratio},
        {"merge_distance", s.merge_distance}
    };
}

void gt::from_json(const json& js, postprocess_settings& s) {
    s.simplify_tolerance = js.value("simplify_tolerance", s.simplify_tolerance);
    s.regularize_ratio = js.value("regularize_ratio", s.regularize_ratio);
    s.merge_distance = js.value("merge_distance", s.merge_distance);
}

std::vector<gt::polygon> gt::simplify_polygons(const std::vector<polygon>& polys,
        double tolerance, const callbacks& cbs) {
    std::vector<polygon> output;
    output.reserve(polys.size());
    for (const auto& poly : polys) {
        auto simplified = simplify(poly, tolerance);
        if (is_usable(simplified)) {
            output.push_back(std::move(simplified));
        } else if (is_usable(poly)) {
            // simplification broke the topology; keep the input shape.
            output.push_back(poly);
        }
    }
    diagnostics(cbs).polygons_dropped(pipeline_stage::simplify, polys.size() - output.size());
    return output;
}

std::vector<gt::polygon> gt::regularize_polygons(const std::vector<polygon>& polys,
        double ratio_threshold) {
    return polys |
        rv::transform(
            [ratio_threshold](const auto& poly) {
                return regularize(poly, ratio_threshold);
            }
        ) | r::to_vector;
}

std::vector<gt::polygon> gt::merge_nearby_polygons(const std::vector<polygon>& polys,
        double distance, const callbacks& cbs) {
    if (polys.empty()) {
        return {};
    }
    std::vector<polygon> merged;
    for (const auto& group : proximity_groups(polys, distance)) {
        std::vector<polygon> expanded;
        for (const auto& poly : group) {
            auto buffered = buffer(poly, distance);
            expanded.insert(expanded.end(), buffered.begin(), buffered.end());
        }
        auto unioned = union_all(expanded);
        merged.insert(merged.end(), unioned.begin(), unioned.end());
    }
    auto output = merged |
        rv::filter(is_usable) |
        r::to_vector;
    diagnostics(cbs).polygons_dropped(pipeline_stage::merge, merged.size() - output.size());
    return output;
}

std::vector<gt::polygon> gt::post_process(const std::vector<polygon>& polys, feature_type type,
        const postprocess_settings& settings, const callbacks& cbs) {
    auto output = simplify_polygons(polys, settings.simplify_tolerance, cbs);
    if (type == feature_type::buildings) {
        output = regularize_polygons(output, settings.regularize_ratio);
    }
    return merge_nearby_polygons(output, settings.merge_distance, cbs);
}
