#include "geometry.hpp"

#include <cmath>

#include "utilities.hpp"

using namespace cv;

double Geometry::distance(const Point2f& p1, const Point2f& p2) {
    double dx = static_cast<double>(p2.x) - p1.x;
    double dy = static_cast<double>(p2.y) - p1.y;
    return std::sqrt(dx * dx + dy * dy);
}

std::optional<Point2f> Geometry::lineIntersection(const Point2f& p1, double angle1,
                                                  const Point2f& p2, double angle2,
                                                  double epsilon) {
    double d1x = std::cos(angle1), d1y = std::sin(angle1);
    double d2x = std::cos(angle2), d2y = std::sin(angle2);

    // Cross product of the unit directions is sin of the angle between them.
    double cross = d1x * d2y - d1y * d2x;
    if (std::abs(cross) < epsilon) {
        LOGI("[Geometry] lineIntersection: parallel lines, cross=%.6f", cross);
        return std::nullopt;
    }

    double wx = static_cast<double>(p2.x) - p1.x;
    double wy = static_cast<double>(p2.y) - p1.y;
    double t = (wx * d2y - wy * d2x) / cross;

    return Point2f(static_cast<float>(p1.x + t * d1x), static_cast<float>(p1.y + t * d1y));
}
