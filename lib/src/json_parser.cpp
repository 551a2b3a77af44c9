#include "json_parser.hpp"

#include <cctype>
#include <stdexcept>

#include "utilities.hpp"

namespace {

std::invalid_argument malformed(const std::string& key, const std::string& value) {
    return std::invalid_argument("Malformed value for \"" + key + "\": " + value);
}

void readDouble(const std::string& jsonStr, const std::string& key, double& target) {
    std::optional<std::string> value = findJsonValue(jsonStr, key);
    if (!value) return;
    size_t used = 0;
    try {
        target = std::stod(*value, &used);
    } catch (const std::logic_error&) {
        throw malformed(key, *value);
    }
    if (used != value->size()) throw malformed(key, *value);
}

void readInt(const std::string& jsonStr, const std::string& key, int& target) {
    std::optional<std::string> value = findJsonValue(jsonStr, key);
    if (!value) return;
    size_t used = 0;
    try {
        target = std::stoi(*value, &used);
    } catch (const std::logic_error&) {
        throw malformed(key, *value);
    }
    if (used != value->size()) throw malformed(key, *value);
}

void readBool(const std::string& jsonStr, const std::string& key, bool& target) {
    std::optional<std::string> value = findJsonValue(jsonStr, key);
    if (!value) return;
    if (*value == "true") {
        target = true;
    } else if (*value == "false") {
        target = false;
    } else {
        throw malformed(key, *value);
    }
}

}  // namespace

std::optional<std::string> findJsonValue(const std::string& jsonStr, const std::string& key) {
    size_t keyStart = jsonStr.find("\"" + key + "\"");
    if (keyStart == std::string::npos) {
        return std::nullopt;
    }

    size_t colon = jsonStr.find(":", keyStart + key.size() + 2);
    if (colon == std::string::npos) {
        throw std::invalid_argument("Missing ':' after \"" + key + "\"");
    }

    size_t valueStart = colon + 1;
    while (valueStart < jsonStr.length() && std::isspace(static_cast<unsigned char>(jsonStr[valueStart]))) {
        valueStart++;
    }
    if (valueStart >= jsonStr.length()) {
        throw malformed(key, "");
    }

    if (jsonStr[valueStart] == '"') {
        size_t valueEnd = jsonStr.find("\"", valueStart + 1);
        if (valueEnd == std::string::npos) {
            throw malformed(key, jsonStr.substr(valueStart));
        }
        return jsonStr.substr(valueStart + 1, valueEnd - valueStart - 1);
    }

    size_t valueEnd = jsonStr.find_first_of(",}", valueStart);
    if (valueEnd == std::string::npos) {
        valueEnd = jsonStr.length();
    }
    while (valueEnd > valueStart && std::isspace(static_cast<unsigned char>(jsonStr[valueEnd - 1]))) {
        valueEnd--;
    }
    return jsonStr.substr(valueStart, valueEnd - valueStart);
}

DetectorConfig parseDetectorConfigJson(const std::string& jsonStr) {
    DetectorConfig config;

    readInt(jsonStr, "max_working_dimension", config.maxWorkingDimension);
    readBool(jsonStr, "use_blur", config.useBlur);
    readInt(jsonStr, "blur_radius", config.blurRadius);

    if (std::optional<std::string> op = findJsonValue(jsonStr, "edge_operator")) {
        if (*op == "sobel") {
            config.edgeOperator = EdgeOperator::SOBEL;
        } else if (*op == "forward_difference") {
            config.edgeOperator = EdgeOperator::FORWARD_DIFFERENCE;
        } else {
            throw malformed("edge_operator", *op);
        }
    }

    readDouble(jsonStr, "min_radius_fraction", config.minRadiusFraction);
    readDouble(jsonStr, "max_radius_fraction", config.maxRadiusFraction);
    readDouble(jsonStr, "radius_step_fraction", config.radiusStepFraction);
    readDouble(jsonStr, "grid_step_factor", config.gridStepFactor);

    readInt(jsonStr, "perimeter_samples", config.perimeterSamples);
    readInt(jsonStr, "edge_threshold", config.edgeThreshold);
    readDouble(jsonStr, "min_edge_ratio", config.minEdgeRatio);
    readDouble(jsonStr, "color_diff_divisor", config.colorDiffDivisor);
    readDouble(jsonStr, "edge_weight", config.edgeWeight);
    readDouble(jsonStr, "color_weight", config.colorWeight);
    readDouble(jsonStr, "acceptance_threshold", config.acceptanceThreshold);

    readBool(jsonStr, "two_phase_search", config.twoPhaseSearch);
    readDouble(jsonStr, "reference_acceptance_threshold", config.referenceAcceptanceThreshold);
    readDouble(jsonStr, "reference_radius_tolerance", config.referenceRadiusTolerance);
    readDouble(jsonStr, "phase_two_step_factor", config.phaseTwoStepFactor);
    readDouble(jsonStr, "cue_exclusion_factor", config.cueExclusionFactor);

    readDouble(jsonStr, "nms_overlap_factor", config.nmsOverlapFactor);
    int maxDetections = static_cast<int>(config.maxDetections);
    readInt(jsonStr, "max_detections", maxDetections);
    if (maxDetections < 0) {
        throw malformed("max_detections", std::to_string(maxDetections));
    }
    config.maxDetections = static_cast<size_t>(maxDetections);

    readDouble(jsonStr, "dominant_color_radius_factor", config.dominantColorRadiusFactor);
    readDouble(jsonStr, "min_classification_confidence", config.minClassificationConfidence);
    readDouble(jsonStr, "fallback_confidence", config.fallbackConfidence);
    readBool(jsonStr, "apply_white_balance", config.applyWhiteBalance);

    readInt(jsonStr, "stripe_samples", config.stripeSamples);
    readDouble(jsonStr, "stripe_radius_factor", config.stripeRadiusFactor);
    readDouble(jsonStr, "stripe_value_threshold", config.stripeValueThreshold);
    readInt(jsonStr, "stripe_min_transitions", config.stripeMinTransitions);
    readDouble(jsonStr, "stripe_confidence_penalty", config.stripeConfidencePenalty);

    LOGI("[parseDetectorConfigJson] max_working_dimension=%d, two_phase_search=%d",
         config.maxWorkingDimension, config.twoPhaseSearch ? 1 : 0);
    return config;
}
