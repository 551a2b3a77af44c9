#include "ball_types.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

std::string gameModeToString(GameMode mode) { return mode == GameMode::POOL ? "pool" : "snooker"; }

GameMode parseGameMode(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "pool") return GameMode::POOL;
    if (lower == "snooker") return GameMode::SNOOKER;
    throw std::invalid_argument("Unknown game mode: " + text);
}

std::string ballTypeToString(BallType type) {
    switch (type) {
        case BallType::CUE:
            return "cue";
        case BallType::EIGHT:
            return "eight";
        case BallType::SOLIDS:
            return "solids";
        case BallType::STRIPES:
            return "stripes";
        case BallType::RED:
            return "red";
        case BallType::YELLOW:
            return "yellow";
        case BallType::GREEN:
            return "green";
        case BallType::BROWN:
            return "brown";
        case BallType::BLUE:
            return "blue";
        case BallType::PINK:
            return "pink";
        case BallType::BLACK:
            return "black";
    }
    return "unknown";
}
