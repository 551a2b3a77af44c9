#ifndef COLOR_CLASSIFIER_HPP
#define COLOR_CLASSIFIER_HPP

#include <opencv2/core.hpp>
#include <string>

#include "ball_types.hpp"
#include "color_ranges.hpp"
#include "colors.hpp"
#include "detector_config.hpp"

struct ClassificationResult {
    BallType ballType;
    double confidence;
    std::string colorName;
    std::string hexColor;
};

class ColorClassifier {
   public:
    explicit ColorClassifier(const DetectorConfig& config);

    /**
     * Classify the ball at (center, radius) by its dominant color.
     * The dominant color is averaged over an inner disk (dominantColorRadiusFactor of the
     * radius) to stay clear of rim highlights and shadows. Falls back to the cue ball with
     * fallbackConfidence when no range matches well enough.
     */
    ClassificationResult classify(const cv::Mat& rgba, cv::Point2f center, float radius,
                                  GameMode mode) const;

    // Classify an already sampled color against a game mode's table.
    ClassificationResult classifyColor(const RGBColor& color, GameMode mode) const;

    /**
     * Confidence that a color belongs to a range: the hue-weighted distance from the range
     * midpoint, each axis normalized by the range span (a zero span counts as 1), mapped to
     * max(0, 1 - d / 2) and scaled by the range prior. A range covering the whole hue
     * circle puts no weight on hue.
     */
    static double calculateConfidence(const HSVColor& color, const ColorRange& range);

   private:
    DetectorConfig config;
};

class PatternRefiner {
   public:
    explicit PatternRefiner(const DetectorConfig& config);

    // Pool only: turns a colored classification into solids or stripes.
    ClassificationResult refine(const cv::Mat& rgba, cv::Point2f center, float radius,
                                GameMode mode, const ClassificationResult& base) const;

    // HSV samples on a circle of stripeRadiusFactor * radius. Out-of-frame points skipped.
    std::vector<HSVColor> samplePerimeter(const cv::Mat& rgba, cv::Point2f center,
                                          float radius) const;

    // Consecutive pairs (no wraparound) whose value differs by more than the threshold.
    int countValueTransitions(const std::vector<HSVColor>& samples) const;

    // Fewer than half the expected samples is never striped.
    bool isStriped(const std::vector<HSVColor>& samples) const;

   private:
    DetectorConfig config;
};

#endif  // COLOR_CLASSIFIER_HPP
