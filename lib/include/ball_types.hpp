#ifndef BALL_TYPES_HPP
#define BALL_TYPES_HPP

#include <cstdint>
#include <functional>
#include <optional>
#include <opencv2/core.hpp>
#include <string>
#include <vector>

enum class GameMode { POOL, SNOOKER };

enum class BallType {
    CUE,
    EIGHT,
    SOLIDS,
    STRIPES,
    RED,
    YELLOW,
    GREEN,
    BROWN,
    BLUE,
    PINK,
    BLACK
};

std::string gameModeToString(GameMode mode);

// Accepts "pool" or "snooker" (case-insensitive), throws std::invalid_argument otherwise.
GameMode parseGameMode(const std::string& text);

std::string ballTypeToString(BallType type);

struct BallDetection {
    std::string id;
    cv::Point2f position;  // original image coordinates
    float radius;
    float confidence;
    BallType ballType;
    std::string color;  // "#rrggbb"
    std::optional<int> number;
};

struct DetectionResult {
    std::vector<BallDetection> balls;
    int imageWidth = 0;
    int imageHeight = 0;
    int64_t timestamp = 0;  // ms since epoch
    double processingTimeMs = 0.0;
};

// (percent, stageLabel). Informational only.
using ProgressCallback = std::function<void(double, const std::string&)>;

#endif  // BALL_TYPES_HPP
