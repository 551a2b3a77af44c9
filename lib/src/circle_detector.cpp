#include "circle_detector.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>

#include "colors.hpp"
#include "geometry.hpp"
#include "table_heuristics.hpp"
#include "utilities.hpp"

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

using namespace cv;
using namespace std;

CircleDetector::CircleDetector(const DetectorConfig& config) : config(config) {
    perimeterDirections.reserve(config.perimeterSamples);
    for (int i = 0; i < config.perimeterSamples; ++i) {
        double angle = 2.0 * M_PI * i / config.perimeterSamples;
        perimeterDirections.emplace_back(std::cos(angle), std::sin(angle));
    }
}

RadiusBounds CircleDetector::radiusBounds(const Size& imageSize) const {
    int shortSide = std::min(imageSize.width, imageSize.height);
    int minRadius = std::max(2, static_cast<int>(std::floor(shortSide * config.minRadiusFraction)));
    int maxRadius =
        std::max(minRadius, static_cast<int>(std::floor(shortSide * config.maxRadiusFraction)));
    return {minRadius, maxRadius};
}

vector<int> CircleDetector::radiusSchedule(int minRadius, int maxRadius) const {
    vector<int> radii;
    for (int r = minRadius; r <= maxRadius;) {
        radii.push_back(r);
        r += std::max(1, static_cast<int>(std::lround(r * config.radiusStepFraction)));
    }
    return radii;
}

double CircleDetector::scoreCircle(const Mat& rgba, const Mat& edges, int cx, int cy,
                                   int r) const {
    const int width = rgba.cols;
    const int height = rgba.rows;
    if (r <= 0 || cx < 0 || cy < 0 || cx >= width || cy >= height) return 0.0;

    const Vec4b& center = rgba.at<Vec4b>(cy, cx);
    if (center[3] < 200) return 0.0;

    RGBColor centerColor{center[0], center[1], center[2]};

    int margin = r * 2;
    bool nearBorder = cx < margin || cx > width - margin || cy < margin || cy > height - margin;
    if (TableHeuristics::isPocketOrShadow(centerColor, nearBorder)) return 0.0;
    if (TableHeuristics::isTableFelt(centerColor)) return 0.0;
    if (!TableHeuristics::isBallColor(centerColor)) return 0.0;

    int edgeVotes = 0;
    int inFrame = 0;
    double totalColorDiff = 0.0;

    for (const Point2d& dir : perimeterDirections) {
        int px = static_cast<int>(std::lround(cx + dir.x * r));
        int py = static_cast<int>(std::lround(cy + dir.y * r));
        if (px < 0 || px >= width || py < 0 || py >= height) continue;

        ++inFrame;
        if (edges.at<uchar>(py, px) > config.edgeThreshold) ++edgeVotes;

        const Vec4b& p = rgba.at<Vec4b>(py, px);
        totalColorDiff += std::abs(p[0] - centerColor.r) + std::abs(p[1] - centerColor.g) +
                          std::abs(p[2] - centerColor.b);
    }

    double edgeScore = static_cast<double>(edgeVotes) / config.perimeterSamples;
    if (edgeScore < config.minEdgeRatio || inFrame == 0) return 0.0;

    double avgColorDiff = totalColorDiff / inFrame;
    double colorConsistency = std::max(0.0, 1.0 - avgColorDiff / config.colorDiffDivisor);

    double score = (edgeScore * config.edgeWeight + colorConsistency * config.colorWeight) /
                   (config.edgeWeight + config.colorWeight);
    return std::clamp(score, 0.0, 1.0);
}

optional<CircleCandidate> CircleDetector::findCueBall(const Mat& rgba, const Mat& edges,
                                                      const RadiusBounds& bounds) const {
    const int step = std::max(1, static_cast<int>(std::floor(bounds.minRadius * config.gridStepFactor)));
    const int border = bounds.maxRadius;
    const vector<int> radii = radiusSchedule(bounds.minRadius, bounds.maxRadius);

    optional<CircleCandidate> best;
    int seeds = 0;

    for (int y = border; y < rgba.rows - border; y += step) {
        for (int x = border; x < rgba.cols - border; x += step) {
            if (!TableHeuristics::isCueBallPixel(pixelColor(rgba, x, y))) continue;
            ++seeds;

            for (int r : radii) {
                double score = scoreCircle(rgba, edges, x, y, r);
                if (score > config.acceptanceThreshold && (!best || score > best->score)) {
                    best = CircleCandidate{x, y, r, score};
                }
            }
        }
    }

    LOGI("[CircleDetector] Phase 1: %d white seeds, cue ball %s", seeds,
         best ? "found" : "not found");
    return best;
}

vector<CircleCandidate> CircleDetector::searchNearReference(
    const Mat& rgba, const Mat& edges, const CircleCandidate& reference) const {
    const int target = reference.radius;
    const int radiusMin =
        std::max(2, static_cast<int>(std::floor(target * (1.0 - config.referenceRadiusTolerance))));
    const int radiusMax =
        static_cast<int>(std::ceil(target * (1.0 + config.referenceRadiusTolerance)));
    const int step = std::max(1, static_cast<int>(std::floor(target * config.phaseTwoStepFactor)));

    LOGI("[CircleDetector] Phase 2: reference (%d, %d) r=%d, radii %d-%d, step %d", reference.x,
         reference.y, target, radiusMin, radiusMax, step);

    return gridSearch(rgba, edges, radiusMax, step, radiusSchedule(radiusMin, radiusMax),
                      config.referenceAcceptanceThreshold, &reference);
}

vector<CircleCandidate> CircleDetector::searchFullRange(const Mat& rgba, const Mat& edges,
                                                        const RadiusBounds& bounds) const {
    const int step = std::max(1, static_cast<int>(std::floor(bounds.minRadius * config.gridStepFactor)));
    return gridSearch(rgba, edges, bounds.maxRadius, step,
                      radiusSchedule(bounds.minRadius, bounds.maxRadius),
                      config.acceptanceThreshold, nullptr);
}

vector<CircleCandidate> CircleDetector::gridSearch(const Mat& rgba, const Mat& edges, int border,
                                                   int step, const vector<int>& radii,
                                                   double threshold,
                                                   const CircleCandidate* exclude) const {
    vector<CircleCandidate> candidates;
    const double exclusionRadius = exclude ? exclude->radius * config.cueExclusionFactor : 0.0;

    for (int y = border; y < rgba.rows - border; y += step) {
        for (int x = border; x < rgba.cols - border; x += step) {
            if (exclude && Geometry::distance(Point2f(x, y), Point2f(exclude->x, exclude->y)) <
                               exclusionRadius) {
                continue;
            }

            for (int r : radii) {
                double score = scoreCircle(rgba, edges, x, y, r);
                if (score > threshold) {
                    candidates.push_back({x, y, r, score});
                }
            }
        }
    }
    return candidates;
}

vector<CircleCandidate> CircleDetector::nonMaximumSuppression(vector<CircleCandidate> candidates,
                                                              double overlapFactor) {
    stable_sort(candidates.begin(), candidates.end(),
                [](const CircleCandidate& a, const CircleCandidate& b) { return a.score > b.score; });

    vector<CircleCandidate> kept;
    for (const auto& candidate : candidates) {
        bool overlaps = any_of(kept.begin(), kept.end(), [&](const CircleCandidate& k) {
            double dist = Geometry::distance(Point2f(candidate.x, candidate.y), Point2f(k.x, k.y));
            return dist < (candidate.radius + k.radius) * overlapFactor;
        });
        if (!overlaps) kept.push_back(candidate);
    }
    return kept;
}

vector<CircleCandidate> CircleDetector::findCircles(const Mat& rgba, const Mat& edges) const {
    CV_Assert(rgba.type() == CV_8UC4 && edges.type() == CV_8UC1 && rgba.size() == edges.size());

    RadiusBounds bounds = radiusBounds(rgba.size());
    LOGI("[CircleDetector] %dx%d, radius %d-%d", rgba.cols, rgba.rows, bounds.minRadius,
         bounds.maxRadius);

    vector<CircleCandidate> candidates;
    optional<CircleCandidate> cueBall;
    if (config.twoPhaseSearch) {
        cueBall = findCueBall(rgba, edges, bounds);
    }

    if (cueBall) {
        candidates = searchNearReference(rgba, edges, *cueBall);
        candidates.push_back(*cueBall);
    } else {
        LOGI("[CircleDetector] Running full-range search");
        candidates = searchFullRange(rgba, edges, bounds);
    }

    LOGI("[CircleDetector] Candidates before NMS: %zu", candidates.size());
    vector<CircleCandidate> kept = nonMaximumSuppression(move(candidates), config.nmsOverlapFactor);
    if (kept.size() > config.maxDetections) {
        kept.resize(config.maxDetections);
    }
    LOGI("[CircleDetector] Circles after NMS: %zu", kept.size());
    return kept;
}
