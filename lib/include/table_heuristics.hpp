#ifndef TABLE_HEURISTICS_HPP
#define TABLE_HEURISTICS_HPP

#include "colors.hpp"

// Per-pixel classifiers applied at candidate centers.
class TableHeuristics {
   public:
    // Cyan/turquoise cloth (pool) or green baize (snooker).
    static bool isTableFelt(const RGBColor& color);

    // Pocket or deep shadow. Near the border the darkness cut-off is relaxed because
    // pockets sit on the rails and corners.
    static bool isPocketOrShadow(const RGBColor& color, bool nearBorder);

    // Bright neutral (cue), saturated non-felt color, or dark neutral (8-ball, black).
    static bool isBallColor(const RGBColor& color);

    // Seed pixel for the cue ball search.
    static bool isCueBallPixel(const RGBColor& color);
};

#endif  // TABLE_HEURISTICS_HPP
