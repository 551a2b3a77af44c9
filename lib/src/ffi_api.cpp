#include <opencv2/core.hpp>
#include <stdexcept>
#include <string>
#include <vector>

#include "ball_detection.hpp"
#include "ballscan.hpp"
#include "image_loader.hpp"
#include "json_parser.hpp"
#include "utilities.hpp"

namespace {

ProgressCallback wrapProgress(ballscan_progress_fn progress) {
    if (!progress) return nullptr;
    return [progress](double percent, const std::string& stage) {
        progress(percent, stage.c_str());
    };
}

GameMode modeOrDefault(const char* gameMode) {
    if (!gameMode || !*gameMode) return GameMode::POOL;
    return parseGameMode(gameMode);
}

}  // namespace

extern "C" {

void* initialize_ball_finder(const char* configJson) {
    try {
        LOGI("initialize_ball_finder called with config: %s",
             configJson && *configJson ? configJson : "(defaults)");
        DetectorConfig config;
        if (configJson && *configJson) {
            config = parseDetectorConfigJson(configJson);
        }
        BallFinder* finder = new BallFinder(config);
        LOGI("BallFinder created successfully");
        return static_cast<void*>(finder);
    } catch (const std::exception& e) {
        LOGE("Error initializing ball finder: %s", e.what());
        return nullptr;
    }
}

const char* detect_balls_rgba(void* finderPtr, const unsigned char* imageBytes, int width,
                              int height, int stride, int channelFormat, const char* gameMode,
                              ballscan_progress_fn progress) {
    static thread_local std::string resultStr;
    if (!finderPtr) {
        resultStr = formatErrorJson("Invalid ball finder instance");
        return resultStr.c_str();
    }
    try {
        LOGI("[detect_balls_rgba] Input: %dx%d, stride: %d, channelFormat: %d", width, height,
             stride, channelFormat);
        cv::Mat rgba = ImageLoader::fromPixels(imageBytes, width, height, stride, channelFormat);
        DetectionResult result = static_cast<BallFinder*>(finderPtr)->detectPixels(
            rgba, modeOrDefault(gameMode), wrapProgress(progress));

        LOGI("[detect_balls_rgba] Detection complete: %zu balls found", result.balls.size());
        resultStr = formatDetectionResultJson(result);
        return resultStr.c_str();
    } catch (const std::exception& e) {
        LOGE("[detect_balls_rgba] Exception: %s", e.what());
        resultStr = formatErrorJson(e.what());
        return resultStr.c_str();
    }
}

const char* detect_balls_encoded(void* finderPtr, const unsigned char* encodedBytes, int length,
                                 const char* gameMode, ballscan_progress_fn progress) {
    static thread_local std::string resultStr;
    if (!finderPtr) {
        resultStr = formatErrorJson("Invalid ball finder instance");
        return resultStr.c_str();
    }
    try {
        if (!encodedBytes || length <= 0) {
            throw ImageDecodeError("Failed to load image: no data");
        }
        LOGI("[detect_balls_encoded] Input: %d bytes", length);
        std::vector<unsigned char> bytes(encodedBytes, encodedBytes + length);
        DetectionResult result = static_cast<BallFinder*>(finderPtr)->detect(
            bytes, modeOrDefault(gameMode), wrapProgress(progress));

        LOGI("[detect_balls_encoded] Detection complete: %zu balls found", result.balls.size());
        resultStr = formatDetectionResultJson(result);
        return resultStr.c_str();
    } catch (const std::exception& e) {
        LOGE("[detect_balls_encoded] Exception: %s", e.what());
        resultStr = formatErrorJson(e.what());
        return resultStr.c_str();
    }
}

void release_ball_finder(void* finderPtr) {
    if (finderPtr) {
        delete static_cast<BallFinder*>(finderPtr);
    }
}
}
