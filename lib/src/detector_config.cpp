#include "detector_config.hpp"

#include <stdexcept>
#include <string>

static void require(bool condition, const char* field) {
    if (!condition) {
        throw std::invalid_argument(std::string("Invalid detector config: ") + field);
    }
}

void DetectorConfig::validate() const {
    require(maxWorkingDimension >= 32, "max_working_dimension");
    require(blurRadius >= 0, "blur_radius");
    require(minRadiusFraction > 0.0 && minRadiusFraction < maxRadiusFraction,
            "min_radius_fraction");
    require(maxRadiusFraction <= 0.5, "max_radius_fraction");
    require(radiusStepFraction >= 0.0, "radius_step_fraction");
    require(gridStepFactor > 0.0, "grid_step_factor");
    require(perimeterSamples >= 4, "perimeter_samples");
    require(edgeThreshold >= 0 && edgeThreshold < 255, "edge_threshold");
    require(minEdgeRatio >= 0.0 && minEdgeRatio <= 1.0, "min_edge_ratio");
    require(colorDiffDivisor > 0.0, "color_diff_divisor");
    require(edgeWeight >= 0.0 && colorWeight >= 0.0 && edgeWeight + colorWeight > 0.0,
            "edge_weight");
    require(acceptanceThreshold >= 0.0 && acceptanceThreshold < 1.0, "acceptance_threshold");
    require(referenceAcceptanceThreshold >= 0.0 && referenceAcceptanceThreshold < 1.0,
            "reference_acceptance_threshold");
    require(referenceRadiusTolerance > 0.0 && referenceRadiusTolerance < 1.0,
            "reference_radius_tolerance");
    require(phaseTwoStepFactor > 0.0, "phase_two_step_factor");
    require(cueExclusionFactor >= 0.0, "cue_exclusion_factor");
    require(nmsOverlapFactor > 0.0, "nms_overlap_factor");
    require(maxDetections >= 1 && maxDetections <= kMaxBallsOnTable, "max_detections");
    require(dominantColorRadiusFactor > 0.0 && dominantColorRadiusFactor <= 1.0,
            "dominant_color_radius_factor");
    require(stripeSamples >= 4, "stripe_samples");
    require(stripeRadiusFactor > 0.0 && stripeRadiusFactor <= 1.0, "stripe_radius_factor");
    require(stripeValueThreshold >= 0.0, "stripe_value_threshold");
    require(stripeMinTransitions >= 1, "stripe_min_transitions");
    require(stripeConfidencePenalty > 0.0 && stripeConfidencePenalty <= 1.0,
            "stripe_confidence_penalty");
}
