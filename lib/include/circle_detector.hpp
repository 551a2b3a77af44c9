#ifndef CIRCLE_DETECTOR_HPP
#define CIRCLE_DETECTOR_HPP

#include <opencv2/core.hpp>
#include <optional>
#include <vector>

#include "detector_config.hpp"

// Provisional ball hypothesis in working-resolution pixels.
struct CircleCandidate {
    int x;
    int y;
    int radius;
    double score;  // [0, 1]
};

struct RadiusBounds {
    int minRadius;
    int maxRadius;
};

/**
 * Grid-search circle finder over an RGBA image and its edge map.
 *
 * With two-phase search enabled the cue ball is located first (near-white seeds, all
 * radii) and the remaining balls are searched only within a tolerance of its radius.
 * When no cue ball is found the full radius range is searched instead.
 */
class CircleDetector {
   public:
    explicit CircleDetector(const DetectorConfig& config);

    // Candidates after suppression, score-descending, at most config.maxDetections.
    std::vector<CircleCandidate> findCircles(const cv::Mat& rgba, const cv::Mat& edges) const;

    /**
     * Score how ball-like the circle (cx, cy, r) is.
     * @return 0 for rejected centers (transparent, pocket, felt, non-ball color) or too few
     * perimeter edges; otherwise the weighted edge/color-consistency score in [0, 1]
     */
    double scoreCircle(const cv::Mat& rgba, const cv::Mat& edges, int cx, int cy, int r) const;

    // Phase 1. Best-scoring circle centered on a near-white pixel.
    std::optional<CircleCandidate> findCueBall(const cv::Mat& rgba, const cv::Mat& edges,
                                               const RadiusBounds& bounds) const;

    // Phase 2. Grid search restricted to radii around the reference ball.
    std::vector<CircleCandidate> searchNearReference(const cv::Mat& rgba, const cv::Mat& edges,
                                                     const CircleCandidate& reference) const;

    // Single-phase search over the whole radius range.
    std::vector<CircleCandidate> searchFullRange(const cv::Mat& rgba, const cv::Mat& edges,
                                                 const RadiusBounds& bounds) const;

    RadiusBounds radiusBounds(const cv::Size& imageSize) const;

    // Radii from min to max, denser for small radii.
    std::vector<int> radiusSchedule(int minRadius, int maxRadius) const;

    /**
     * Greedy non-maximum suppression. Keeps a candidate only if its center is at least
     * (r1 + r2) * overlapFactor away from every candidate kept before it.
     * @param candidates Unordered candidates
     * @param overlapFactor Fraction of the summed radii below which two centers are the
     * same ball
     * @return Kept candidates sorted by descending score
     */
    static std::vector<CircleCandidate> nonMaximumSuppression(
        std::vector<CircleCandidate> candidates, double overlapFactor);

   private:
    std::vector<CircleCandidate> gridSearch(const cv::Mat& rgba, const cv::Mat& edges,
                                            int border, int step,
                                            const std::vector<int>& radii, double threshold,
                                            const CircleCandidate* exclude) const;

    DetectorConfig config;
    std::vector<cv::Point2d> perimeterDirections;  // unit vectors, one per sample
};

#endif  // CIRCLE_DETECTOR_HPP
