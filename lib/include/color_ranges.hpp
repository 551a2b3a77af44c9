#ifndef COLOR_RANGES_HPP
#define COLOR_RANGES_HPP

#include <optional>
#include <string>
#include <vector>

#include "ball_types.hpp"
#include "colors.hpp"

struct ColorRange {
    std::string name;
    BallType ballType;
    HSVColor hsvMin;
    HSVColor hsvMax;
    double confidence;  // static prior weight
};

// Classification table for a game mode. Ranges may overlap.
const std::vector<ColorRange>& getColorRanges(GameMode mode);

// Display color for a ball type, "#rrggbb".
std::string ballHexColor(BallType type);

// Snooker point value (red 1 .. black 7), empty for the cue ball and pool types.
std::optional<int> snookerPoints(BallType type);

#endif  // COLOR_RANGES_HPP
