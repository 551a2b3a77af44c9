#include "color_classifier.hpp"

#include <algorithm>
#include <cmath>

#include "utilities.hpp"

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

using namespace cv;
using namespace std;

ColorClassifier::ColorClassifier(const DetectorConfig& config) : config(config) {}

double ColorClassifier::calculateConfidence(const HSVColor& color, const ColorRange& range) {
    const HSVColor& lo = range.hsvMin;
    const HSVColor& hi = range.hsvMax;

    double hueSpan = lo.h <= hi.h ? hi.h - lo.h : 360.0 - lo.h + hi.h;
    double hueDist = 0.0;
    if (hueSpan < 360.0) {
        double hueCenter = std::fmod(lo.h + hueSpan / 2.0, 360.0);
        hueDist = hueDifference(color.h, hueCenter) / (hueSpan > 0.0 ? hueSpan : 1.0);
    }

    double satSpan = hi.s - lo.s;
    double valSpan = hi.v - lo.v;
    double satDist = std::abs(color.s - (lo.s + hi.s) / 2.0) / (satSpan > 0.0 ? satSpan : 1.0);
    double valDist = std::abs(color.v - (lo.v + hi.v) / 2.0) / (valSpan > 0.0 ? valSpan : 1.0);

    double distance =
        std::sqrt((hueDist * 2.0) * (hueDist * 2.0) + satDist * satDist + valDist * valDist);

    return std::max(0.0, 1.0 - distance / 2.0) * range.confidence;
}

ClassificationResult ColorClassifier::classifyColor(const RGBColor& color, GameMode mode) const {
    RGBColor sample = config.applyWhiteBalance ? autoWhiteBalance(color) : color;
    HSVColor hsv = rgbToHsv(sample);

    const ColorRange* bestMatch = nullptr;
    double bestConfidence = 0.0;

    for (const auto& range : getColorRanges(mode)) {
        if (!isColorInRange(hsv, range.hsvMin, range.hsvMax)) continue;

        double confidence = calculateConfidence(hsv, range);
        if (confidence > bestConfidence) {
            bestConfidence = confidence;
            bestMatch = &range;
        }
    }

    if (!bestMatch || bestConfidence < config.minClassificationConfidence) {
        return {BallType::CUE, config.fallbackConfidence, "Unknown (likely Cue Ball)", "#FFFFFF"};
    }

    return {bestMatch->ballType, bestConfidence, bestMatch->name,
            ballHexColor(bestMatch->ballType)};
}

ClassificationResult ColorClassifier::classify(const Mat& rgba, Point2f center, float radius,
                                               GameMode mode) const {
    int sampleRadius = static_cast<int>(std::floor(radius * config.dominantColorRadiusFactor));
    RGBColor dominant = getDominantColor(rgba, center, sampleRadius);
    return classifyColor(dominant, mode);
}

PatternRefiner::PatternRefiner(const DetectorConfig& config) : config(config) {}

vector<HSVColor> PatternRefiner::samplePerimeter(const Mat& rgba, Point2f center,
                                                 float radius) const {
    vector<HSVColor> samples;
    samples.reserve(config.stripeSamples);

    const double sampleRadius = radius * config.stripeRadiusFactor;
    for (int i = 0; i < config.stripeSamples; ++i) {
        double angle = 2.0 * M_PI * i / config.stripeSamples;
        int x = static_cast<int>(std::lround(center.x + std::cos(angle) * sampleRadius));
        int y = static_cast<int>(std::lround(center.y + std::sin(angle) * sampleRadius));
        if (x < 0 || x >= rgba.cols || y < 0 || y >= rgba.rows) continue;
        samples.push_back(rgbToHsv(pixelColor(rgba, x, y)));
    }
    return samples;
}

int PatternRefiner::countValueTransitions(const vector<HSVColor>& samples) const {
    int transitions = 0;
    for (size_t i = 0; i + 1 < samples.size(); ++i) {
        if (std::abs(samples[i].v - samples[i + 1].v) > config.stripeValueThreshold) {
            ++transitions;
        }
    }
    return transitions;
}

bool PatternRefiner::isStriped(const vector<HSVColor>& samples) const {
    if (static_cast<int>(samples.size()) < config.stripeSamples / 2) return false;
    return countValueTransitions(samples) >= config.stripeMinTransitions;
}

ClassificationResult PatternRefiner::refine(const Mat& rgba, Point2f center, float radius,
                                            GameMode mode,
                                            const ClassificationResult& base) const {
    if (mode != GameMode::POOL || base.ballType == BallType::CUE ||
        base.ballType == BallType::EIGHT) {
        return base;
    }

    ClassificationResult refined = base;
    if (isStriped(samplePerimeter(rgba, center, radius))) {
        refined.ballType = BallType::STRIPES;
        refined.confidence = base.confidence * config.stripeConfidencePenalty;
        size_t pos = refined.colorName.find("Ball");
        if (pos != string::npos && refined.colorName.find("Striped") == string::npos) {
            refined.colorName.replace(pos, 4, "Striped Ball");
        }
    } else {
        refined.ballType = BallType::SOLIDS;
    }
    refined.hexColor = ballHexColor(refined.ballType);
    return refined;
}
