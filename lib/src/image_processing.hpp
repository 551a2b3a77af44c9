#pragma once

#include <opencv2/core.hpp>

#include "ball_types.hpp"

// Outline every ball in its display color and label it with its type (and number).
// Coordinates are taken as original-image pixels; image is BGR or BGRA.
void drawDetections(cv::Mat& image, const DetectionResult& result);
