#include "geometry.hpp"
#include <range/v3/all.hpp>
#include <cmath>
#include <algorithm>
#include <set>
#include <array>

/*------------------------------------------------------------------------------------------------*/

namespace r = ranges;
namespace rv = ranges::views;
namespace bg = boost::geometry;

namespace {

    using vec = Eigen::Matrix<double, 3, 1>;
    using box = bg::model::box<gt::point>;

    template<typename T>
    gt::rectangle bounding_rect_of_geometry(const T& geom) {
        box b;
        bg::envelope(geom, b);
        return {
            b.min_corner().x,
            b.min_corner().y,
            b.max_corner().x,
            b.max_corner().y
        };
    }

    struct point_less {
        bool operator()(const gt::point& lhs, const gt::point& rhs) const {
            return (lhs.x < rhs.x) || (lhs.x == rhs.x && lhs.y < rhs.y);
        }
    };
}

gt::ring gt::make_ring(std::span<const gt::point> verts) {
    auto output = verts | r::to<gt::ring>();
    if (!output.empty() && output.front() != output.back()) {
        output.push_back(output.front());
    }
    return output;
}

gt::polygon gt::make_polygon(const gt::ring& outer) {
    gt::polygon poly;
    poly.outer() = outer;
    bg::correct(poly);
    return poly;
}

gt::polygon gt::make_polygon(std::span<const gt::point> verts) {
    return make_polygon(make_ring(verts));
}

gt::polygon gt::make_rectangle(const gt::rectangle& rect) {
    const auto& [x1, y1, x2, y2] = rect;
    std::array<point, 4> corners = {
        point{ x1, y1 },
        point{ x2, y1 },
        point{ x2, y2 },
        point{ x1, y2 }
    };
    return make_polygon(corners);
}

gt::matrix gt::translation_matrix(double x, double y) {
    gt::matrix translation;
    translation <<
        1, 0, x,
        0, 1, y,
        0, 0, 1;
    return translation;
}

gt::matrix gt::scale_matrix(double x_scale, double y_scale) {
    gt::matrix scale;
    scale <<
        x_scale, 0, 0,
        0, y_scale, 0,
        0, 0, 1;
    return scale;
}

gt::point gt::transform(const point& pt, const matrix& mat) {
    vec v;
    v << pt.x, pt.y, 1.0;
    v = mat * v;
    return { v[0], v[1] };
}

gt::ring gt::transform(const ring& rng, const matrix& mat) {
    return rng |
        rv::transform([&mat](const auto& p) { return gt::transform(p, mat); }) |
        r::to<gt::ring>();
}

gt::rectangle gt::bounding_rectangle(std::span<const gt::point> pts) {
    auto xs = std::minmax_element(pts.begin(), pts.end(),
        [](const auto& lhs, const auto& rhs) { return lhs.x < rhs.x; });
    auto ys = std::minmax_element(pts.begin(), pts.end(),
        [](const auto& lhs, const auto& rhs) { return lhs.y < rhs.y; });
    return { xs.first->x, ys.first->y, xs.second->x, ys.second->y };
}

gt::rectangle gt::bounding_rectangle(const gt::polygon& poly) {
    return bounding_rect_of_geometry(poly.outer());
}

double gt::rectangle_area(const gt::rectangle& rect) {
    const auto& [x1, y1, x2, y2] = rect;
    return (x2 - x1) * (y2 - y1);
}

double gt::area(const gt::polygon& poly) {
    return std::abs(bg::area(poly));
}

size_t gt::distinct_vert_count(const gt::ring& rng) {
    return std::set<point, point_less>(rng.begin(), rng.end()).size();
}

bool gt::is_closed(const gt::ring& rng) {
    return rng.size() > 1 && rng.front() == rng.back();
}

bool gt::is_degenerate_ring(const gt::ring& rng) {
    return rng.size() < 4 || distinct_vert_count(rng) < 3;
}

bool gt::is_valid_polygon(const gt::polygon& poly) {
    if (is_degenerate_ring(poly.outer()) || !is_closed(poly.outer())) {
        return false;
    }
    return bg::is_valid(poly);
}

std::vector<gt::polygon> gt::buffer(const gt::polygon& poly, double amt) {
    namespace bs = bg::strategy::buffer;
    using dist = bs::distance_symmetric<double>;
    bs::side_straight side_strategy;
    bs::join_miter join_strategy(8);
    bs::end_flat end_strategy;
    bs::point_square point_strategy;

    gt::polygons out;
    bg::buffer(poly, out, dist(amt), side_strategy, join_strategy, end_strategy, point_strategy);

    return out | r::to_vector;
}

std::vector<gt::polygon> gt::union_all(std::span<const gt::polygon> polys) {
    gt::polygons accum;
    for (const auto& poly : polys) {
        gt::polygons merged;
        bg::union_(accum, poly, merged);
        accum = std::move(merged);
    }
    return accum | r::to_vector;
}

gt::polygon gt::simplify(const gt::polygon& poly, double tolerance) {
    gt::polygon out;
    bg::simplify(poly, out, tolerance);
    bg::correct(out);
    return out;
}
