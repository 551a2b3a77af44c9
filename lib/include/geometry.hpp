#ifndef GEOMETRY_HPP
#define GEOMETRY_HPP

#include <opencv2/core.hpp>
#include <optional>

class Geometry {
   public:
    static double distance(const cv::Point2f& p1, const cv::Point2f& p2);

    /**
     * Intersection of two lines, each given by a point and a direction angle.
     * @param p1 Point on the first line
     * @param angle1 Direction of the first line in radians
     * @param p2 Point on the second line
     * @param angle2 Direction of the second line in radians
     * @param epsilon Minimum |sin| between the directions below which the lines count as
     * parallel
     * @return The intersection, or empty for parallel or coincident lines
     */
    static std::optional<cv::Point2f> lineIntersection(const cv::Point2f& p1, double angle1,
                                                       const cv::Point2f& p2, double angle2,
                                                       double epsilon = 1e-4);
};

#endif  // GEOMETRY_HPP
