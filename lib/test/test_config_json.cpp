#include <stdexcept>
#include <string>

#include "ball_detection.hpp"
#include "ballscan.hpp"
#include "detector_config.hpp"
#include "json_parser.hpp"
#include "test_support.hpp"

static void testDefaultsValidate() {
    DetectorConfig config;
    bool valid = true;
    try {
        config.validate();
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << std::endl;
        valid = false;
    }
    CHECK(valid);
    CHECK(config.maxDetections == kMaxBallsOnTable);
}

static void testValidateRejects() {
    DetectorConfig config;
    config.maxDetections = 0;
    CHECK_THROWS(config.validate(), std::invalid_argument);
    config.maxDetections = 23;
    CHECK_THROWS(config.validate(), std::invalid_argument);

    DetectorConfig weights;
    weights.edgeWeight = 0.0;
    weights.colorWeight = 0.0;
    CHECK_THROWS(weights.validate(), std::invalid_argument);

    DetectorConfig radii;
    radii.minRadiusFraction = 0.2;
    radii.maxRadiusFraction = 0.1;
    CHECK_THROWS(radii.validate(), std::invalid_argument);

    DetectorConfig samples;
    samples.perimeterSamples = 0;
    CHECK_THROWS(BallFinder finder(samples), std::invalid_argument);

    try {
        DetectorConfig blur;
        blur.blurRadius = -1;
        blur.validate();
        CHECK(false);
    } catch (const std::invalid_argument& e) {
        CHECK(std::string(e.what()).find("blur_radius") != std::string::npos);
    }
}

static void testParseConfig() {
    DetectorConfig config = parseDetectorConfigJson(
        "{\n"
        "  \"max_working_dimension\": 640,\n"
        "  \"use_blur\": false,\n"
        "  \"edge_operator\": \"forward_difference\",\n"
        "  \"min_edge_ratio\": 0.35,\n"
        "  \"two_phase_search\": false,\n"
        "  \"max_detections\": 16,\n"
        "  \"stripe_min_transitions\": 6,\n"
        "  \"some_future_key\": [1, 2, 3]\n"
        "}");

    CHECK(config.maxWorkingDimension == 640);
    CHECK(!config.useBlur);
    CHECK(config.edgeOperator == EdgeOperator::FORWARD_DIFFERENCE);
    CHECK_NEAR(config.minEdgeRatio, 0.35, 1e-12);
    CHECK(!config.twoPhaseSearch);
    CHECK(config.maxDetections == 16);
    CHECK(config.stripeMinTransitions == 6);
    // Untouched keys keep their defaults.
    CHECK(config.blurRadius == 2);
    CHECK_NEAR(config.acceptanceThreshold, 0.30, 1e-12);
    CHECK_NEAR(config.nmsOverlapFactor, 0.6, 1e-12);

    DetectorConfig empty = parseDetectorConfigJson("{}");
    CHECK(empty.maxWorkingDimension == 800);
    CHECK(empty.edgeOperator == EdgeOperator::SOBEL);

    CHECK_THROWS(parseDetectorConfigJson("{\"max_detections\": \"many\"}"), std::invalid_argument);
    CHECK_THROWS(parseDetectorConfigJson("{\"use_blur\": 1}"), std::invalid_argument);
    CHECK_THROWS(parseDetectorConfigJson("{\"edge_threshold\": 4x}"), std::invalid_argument);
    CHECK_THROWS(parseDetectorConfigJson("{\"edge_operator\": \"canny\"}"), std::invalid_argument);

    std::optional<std::string> value = findJsonValue("{\"a\": 1, \"b\": \"two\"}", "b");
    CHECK(value && *value == "two");
    CHECK(!findJsonValue("{\"a\": 1}", "b"));
}

static void testResultJson() {
    DetectionResult result;
    result.imageWidth = 640;
    result.imageHeight = 480;
    result.timestamp = 1700000000000;
    result.processingTimeMs = 12.5;

    BallDetection red;
    red.id = "ball-0";
    red.position = cv::Point2f(100.5f, 200.0f);
    red.radius = 12.0f;
    red.confidence = 0.75f;
    red.ballType = BallType::RED;
    red.color = "#DC143C";
    red.number = 1;
    result.balls.push_back(red);

    BallDetection cue = red;
    cue.id = "ball-1";
    cue.ballType = BallType::CUE;
    cue.color = "#FFFFFF";
    cue.number.reset();
    result.balls.push_back(cue);

    std::string json = formatDetectionResultJson(result);
    CHECK(json.find("\"id\": \"ball-0\"") != std::string::npos);
    CHECK(json.find("\"x\": 100.500000") != std::string::npos);
    CHECK(json.find("\"ball_type\": \"red\"") != std::string::npos);
    CHECK(json.find("\"number\": 1") != std::string::npos);
    CHECK(json.find("\"number\": null") != std::string::npos);
    CHECK(json.find("\"image_width\": 640") != std::string::npos);
    CHECK(json.find("\"timestamp\": 1700000000000") != std::string::npos);
    CHECK(json.front() == '{' && json.back() == '}');

    DetectionResult none;
    CHECK(formatDetectionResultJson(none).find("\"balls\": []") != std::string::npos);

    CHECK(formatErrorJson("bad \"quote\"\n") == "{\"error\": \"bad \\\"quote\\\"\\n\"}");
}

int main() {
    testDefaultsValidate();
    testValidateRejects();
    testParseConfig();
    testResultJson();
    return finishTest("config_json");
}
