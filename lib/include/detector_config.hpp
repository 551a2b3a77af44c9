#ifndef DETECTOR_CONFIG_HPP
#define DETECTOR_CONFIG_HPP

#include <cstddef>

enum class EdgeOperator { SOBEL, FORWARD_DIFFERENCE };

// Snooker: 15 reds + 6 colors + cue.
constexpr std::size_t kMaxBallsOnTable = 22;

/**
 * Tunable parameters of the detection pipeline. Fractions are relative to the shorter
 * side of the working image; brightness and value thresholds use 0-255 channels and
 * 0-100 HSV respectively.
 */
struct DetectorConfig {
    // Loader
    int maxWorkingDimension = 800;

    // Preprocessing
    bool useBlur = true;
    int blurRadius = 2;
    EdgeOperator edgeOperator = EdgeOperator::SOBEL;

    // Radius bounds as fractions of min(width, height)
    double minRadiusFraction = 0.015;
    double maxRadiusFraction = 0.15;
    double radiusStepFraction = 0.05;
    double gridStepFactor = 0.8;

    // Circle scoring
    int perimeterSamples = 24;
    int edgeThreshold = 40;
    double minEdgeRatio = 0.50;
    double colorDiffDivisor = 120.0;
    double edgeWeight = 0.5;
    double colorWeight = 0.5;
    double acceptanceThreshold = 0.30;

    // Two-phase search
    bool twoPhaseSearch = true;
    double referenceAcceptanceThreshold = 0.25;
    double referenceRadiusTolerance = 0.2;
    double phaseTwoStepFactor = 0.6;
    double cueExclusionFactor = 1.5;

    // Suppression
    double nmsOverlapFactor = 0.6;
    std::size_t maxDetections = kMaxBallsOnTable;

    // Classification
    double dominantColorRadiusFactor = 0.6;
    double minClassificationConfidence = 0.3;
    double fallbackConfidence = 0.5;
    bool applyWhiteBalance = false;

    // Stripe refiner
    int stripeSamples = 16;
    double stripeRadiusFactor = 0.7;
    double stripeValueThreshold = 30.0;
    int stripeMinTransitions = 4;
    double stripeConfidencePenalty = 0.9;

    // Throws std::invalid_argument naming the first offending field.
    void validate() const;
};

#endif  // DETECTOR_CONFIG_HPP
