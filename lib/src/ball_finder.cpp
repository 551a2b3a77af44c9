#include <algorithm>
#include <chrono>
#include <cmath>

#include "ballscan.hpp"
#include "circle_detector.hpp"
#include "color_classifier.hpp"
#include "color_ranges.hpp"
#include "edge_detection.hpp"
#include "image_loader.hpp"
#include "utilities.hpp"

using namespace cv;
using namespace std;

namespace {

void report(const ProgressCallback& progress, double percent, const string& stage) {
    if (progress) progress(percent, stage);
}

}  // namespace

struct BallFinder::Impl {
    explicit Impl(const DetectorConfig& config)
        : config(config), circleDetector(config), classifier(config), refiner(config) {}

    DetectionResult run(const Mat& rgba, GameMode mode, const ProgressCallback& progress,
                        chrono::steady_clock::time_point start) const;

    DetectorConfig config;
    CircleDetector circleDetector;
    ColorClassifier classifier;
    PatternRefiner refiner;
};

DetectionResult BallFinder::Impl::run(const Mat& rgba, GameMode mode,
                                      const ProgressCallback& progress,
                                      chrono::steady_clock::time_point start) const {
    if (rgba.empty() || rgba.type() != CV_8UC4) {
        throw ImageDecodeError("Expected a non-empty 4-channel RGBA image");
    }

    report(progress, 20, "Preprocessing image");
    WorkingImage working = ImageLoader::downscale(rgba, config.maxWorkingDimension);
    Mat edges = EdgeDetection::computeEdgeMap(working.rgba, config);

    report(progress, 40, "Detecting circles");
    vector<CircleCandidate> circles = circleDetector.findCircles(working.rgba, edges);
    LOGI("[BallFinder] %zu circles in %dx%d working image (%s)", circles.size(),
         working.rgba.cols, working.rgba.rows, gameModeToString(mode).c_str());

    report(progress, 60, "Classifying balls");
    DetectionResult result;
    result.imageWidth = rgba.cols;
    result.imageHeight = rgba.rows;
    result.balls.reserve(circles.size());

    for (size_t i = 0; i < circles.size(); ++i) {
        const CircleCandidate& circle = circles[i];
        Point2f center(static_cast<float>(circle.x), static_cast<float>(circle.y));
        float radius = static_cast<float>(circle.radius);

        ClassificationResult classification =
            classifier.classify(working.rgba, center, radius, mode);
        classification = refiner.refine(working.rgba, center, radius, mode, classification);

        BallDetection ball;
        ball.id = "ball-" + to_string(i);
        ball.position = Point2f(static_cast<float>(circle.x / working.scale),
                                static_cast<float>(circle.y / working.scale));
        ball.radius = static_cast<float>(circle.radius / working.scale);
        ball.confidence =
            static_cast<float>(std::clamp(classification.confidence * circle.score, 0.0, 1.0));
        ball.ballType = classification.ballType;
        ball.color = classification.hexColor;
        if (mode == GameMode::SNOOKER) {
            ball.number = snookerPoints(classification.ballType);
        }

        LOGI("[BallFinder] %s at (%.1f, %.1f) r=%.1f: %s (%s), confidence %.3f", ball.id.c_str(),
             ball.position.x, ball.position.y, ball.radius,
             ballTypeToString(ball.ballType).c_str(), classification.colorName.c_str(),
             ball.confidence);
        result.balls.push_back(ball);

        report(progress, 60.0 + 30.0 * (i + 1) / circles.size(), "Classifying balls");
    }

    auto end = chrono::steady_clock::now();
    result.processingTimeMs = chrono::duration<double, milli>(end - start).count();
    result.timestamp = chrono::duration_cast<chrono::milliseconds>(
                           chrono::system_clock::now().time_since_epoch())
                           .count();

    report(progress, 100, "Complete");
    LOGI("[BallFinder] Detected %zu balls in %.1f ms", result.balls.size(),
         result.processingTimeMs);
    return result;
}

BallFinder::BallFinder(const DetectorConfig& config) {
    config.validate();
    pimpl = make_unique<Impl>(config);
}

BallFinder::~BallFinder() = default;

const DetectorConfig& BallFinder::getConfig() const { return pimpl->config; }

DetectionResult BallFinder::detect(const vector<unsigned char>& encodedBytes, GameMode mode,
                                   const ProgressCallback& progress) const {
    auto start = chrono::steady_clock::now();
    report(progress, 10, "Loading image");
    Mat rgba = ImageLoader::decode(encodedBytes);
    return pimpl->run(rgba, mode, progress, start);
}

DetectionResult BallFinder::detectFile(const string& path, GameMode mode,
                                       const ProgressCallback& progress) const {
    auto start = chrono::steady_clock::now();
    report(progress, 10, "Loading image");
    Mat rgba = ImageLoader::loadFile(path);
    return pimpl->run(rgba, mode, progress, start);
}

DetectionResult BallFinder::detectDataUrl(const string& dataUrl, GameMode mode,
                                          const ProgressCallback& progress) const {
    auto start = chrono::steady_clock::now();
    report(progress, 10, "Loading image");
    Mat rgba = ImageLoader::decodeDataUrl(dataUrl);
    return pimpl->run(rgba, mode, progress, start);
}

DetectionResult BallFinder::detectPixels(const Mat& rgba, GameMode mode,
                                         const ProgressCallback& progress) const {
    auto start = chrono::steady_clock::now();
    report(progress, 10, "Loading image");
    return pimpl->run(rgba, mode, progress, start);
}
