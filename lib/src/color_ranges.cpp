#include "color_ranges.hpp"

// HSV boxes are {h, s, v} with h in degrees and s, v in percent.
static const std::vector<ColorRange> kPoolColorRanges = {
    {"Cue Ball", BallType::CUE, {0, 0, 80}, {360, 15, 100}, 0.9},
    {"8-Ball", BallType::EIGHT, {0, 0, 0}, {360, 25, 25}, 0.85},
    {"Ball 1 (Yellow)", BallType::SOLIDS, {45, 60, 70}, {65, 100, 100}, 0.8},
    {"Ball 2 (Blue)", BallType::SOLIDS, {200, 50, 40}, {240, 100, 90}, 0.8},
    {"Ball 3 (Red)", BallType::SOLIDS, {0, 60, 40}, {15, 100, 90}, 0.8},
    {"Ball 4 (Purple)", BallType::SOLIDS, {270, 40, 30}, {300, 80, 70}, 0.75},
    {"Ball 5 (Orange)", BallType::SOLIDS, {15, 60, 60}, {35, 100, 100}, 0.8},
    {"Ball 6 (Green)", BallType::SOLIDS, {90, 40, 30}, {150, 80, 70}, 0.75},
    {"Ball 7 (Maroon)", BallType::SOLIDS, {340, 50, 25}, {360, 90, 50}, 0.7},
    // Stripes cannot be told apart by color alone; catch-all for the pattern refiner.
    {"Striped Ball", BallType::STRIPES, {0, 20, 30}, {360, 100, 100}, 0.6},
};

static const std::vector<ColorRange> kSnookerColorRanges = {
    {"Cue Ball", BallType::CUE, {0, 0, 80}, {360, 15, 100}, 0.9},
    {"Red Ball", BallType::RED, {0, 70, 30}, {15, 100, 70}, 0.85},
    {"Yellow Ball", BallType::YELLOW, {50, 70, 80}, {70, 100, 100}, 0.85},
    {"Green Ball", BallType::GREEN, {100, 50, 35}, {160, 90, 75}, 0.8},
    {"Brown Ball", BallType::BROWN, {20, 40, 25}, {40, 80, 55}, 0.75},
    {"Blue Ball", BallType::BLUE, {200, 60, 45}, {240, 100, 85}, 0.85},
    {"Pink Ball", BallType::PINK, {320, 30, 70}, {350, 70, 95}, 0.8},
    {"Black Ball", BallType::BLACK, {0, 0, 0}, {360, 25, 20}, 0.85},
};

const std::vector<ColorRange>& getColorRanges(GameMode mode) {
    return mode == GameMode::POOL ? kPoolColorRanges : kSnookerColorRanges;
}

std::string ballHexColor(BallType type) {
    switch (type) {
        case BallType::CUE:
            return "#FFFFFF";
        case BallType::EIGHT:
            return "#000000";
        case BallType::SOLIDS:
            return "#FF6B35";
        case BallType::STRIPES:
            return "#F7B801";
        case BallType::RED:
            return "#DC143C";
        case BallType::YELLOW:
            return "#FFD700";
        case BallType::GREEN:
            return "#228B22";
        case BallType::BROWN:
            return "#8B4513";
        case BallType::BLUE:
            return "#4169E1";
        case BallType::PINK:
            return "#FF69B4";
        case BallType::BLACK:
            return "#000000";
    }
    return "#888888";
}

std::optional<int> snookerPoints(BallType type) {
    switch (type) {
        case BallType::RED:
            return 1;
        case BallType::YELLOW:
            return 2;
        case BallType::GREEN:
            return 3;
        case BallType::BROWN:
            return 4;
        case BallType::BLUE:
            return 5;
        case BallType::PINK:
            return 6;
        case BallType::BLACK:
            return 7;
        default:
            return std::nullopt;
    }
}
