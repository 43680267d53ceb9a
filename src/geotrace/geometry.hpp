#pragma once

#include <vector>
#include <tuple>
#include <span>
#include <opencv2/core.hpp>
#include <Eigen/Dense>
#include <boost/geometry.hpp>
#include <boost/geometry/geometries/polygon.hpp>
#include <boost/geometry/geometries/multi_polygon.hpp>
#include <boost/geometry/geometries/register/point.hpp>

/*------------------------------------------------------------------------------------------------------*/

namespace gt { using point = cv::Point2d; }
BOOST_GEOMETRY_REGISTER_POINT_2D(gt::point, double, boost::geometry::cs::cartesian, x, y);

namespace gt {

    // clockwise, closed: the first vertex is repeated as the last.
    using polygon = boost::geometry::model::polygon<point, true, true>;
    using polygons = boost::geometry::model::multi_polygon<polygon>;
    using ring = boost::geometry::model::ring<point, true, true>;
    using rectangle = std::tuple<double, double, double, double>;
    using matrix = Eigen::Matrix<double, 3, 3>;
    using int_point = cv::Point;

    template <typename T>
    struct dimensions {
        T wd;
        T hgt;

        dimensions(T d = {}) : wd(d), hgt(d) {}
        dimensions(T w, T h) : wd(w), hgt(h) {}

        template<typename U>
        dimensions(const dimensions<U>& d) :
            wd(static_cast<T>(d.wd)), hgt(static_cast<T>(d.hgt))
        {}

        T area() const {
            return wd * hgt;
        }

        bool empty() const {
            return wd <= 0 || hgt <= 0;
        }
    };

    ring make_ring(std::span<const point> verts);
    polygon make_polygon(const ring& outer);
    polygon make_polygon(std::span<const point> verts);
    polygon make_rectangle(const rectangle& rect);

    matrix translation_matrix(double x, double y);
    matrix scale_matrix(double x_scale, double y_scale);
    point transform(const point& pt, const matrix& mat);
    ring transform(const ring& r, const matrix& mat);

    rectangle bounding_rectangle(std::span<const point> pts);
    rectangle bounding_rectangle(const polygon& poly);
    double rectangle_area(const rectangle& rect);

    double area(const polygon& poly);
    size_t distinct_vert_count(const ring& r);
    bool is_closed(const ring& r);
    bool is_degenerate_ring(const ring& r);
    bool is_valid_polygon(const polygon& poly);

    std::vector<polygon> buffer(const polygon& poly, double amt);
    std::vector<polygon> union_all(std::span<const polygon> polys);
    polygon simplify(const polygon& poly, double tolerance);
}
