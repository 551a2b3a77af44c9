#include "table_heuristics.hpp"

#include <algorithm>
#include <cstdlib>

#include "utilities.hpp"

bool TableHeuristics::isTableFelt(const RGBColor& c) {
    double brightness = channelMean(c.r, c.g, c.b);

    if (c.g > 100 && c.b > 100 && c.r < 100 && brightness > 100) {
        return true;
    }

    if (c.g > 120 && c.g > c.r * 1.5 && c.g > c.b * 1.2 && brightness > 80) {
        return true;
    }

    return false;
}

bool TableHeuristics::isPocketOrShadow(const RGBColor& c, bool nearBorder) {
    double brightness = channelMean(c.r, c.g, c.b);
    if (brightness < 15) return true;
    return nearBorder && brightness < 25;
}

bool TableHeuristics::isBallColor(const RGBColor& c) {
    double brightness = channelMean(c.r, c.g, c.b);

    if (brightness > 180 && std::abs(c.r - c.g) < 40 && std::abs(c.g - c.b) < 40) {
        return true;
    }

    int chroma = std::max({c.r, c.g, c.b}) - std::min({c.r, c.g, c.b});
    if (chroma > 30 && brightness > 40 && brightness < 230 && !isTableFelt(c)) {
        return true;
    }

    if (brightness < 70 && brightness > 10 && std::abs(c.r - c.g) < 25 &&
        std::abs(c.g - c.b) < 25) {
        return true;
    }

    return false;
}

bool TableHeuristics::isCueBallPixel(const RGBColor& c) {
    return channelMean(c.r, c.g, c.b) > 180 && std::abs(c.r - c.g) < 30 &&
           std::abs(c.g - c.b) < 30;
}
