#include "image_processing.hpp"

#include <algorithm>
#include <cmath>
#include <opencv2/imgproc.hpp>
#include <stdexcept>

#include "colors.hpp"
#include "utilities.hpp"

void drawDetections(cv::Mat& image, const DetectionResult& result) {
    if (result.balls.empty()) {
        LOGI("No balls detected.");
        return;
    }

    int longEdgePx = std::max(image.cols, image.rows);
    int thickness = std::max(2, static_cast<int>(std::round(longEdgePx / 400.0)));
    double textSize = std::max(0.4, longEdgePx / 1600.0);
    const cv::Scalar outlineColor(0, 0, 0, 255);
    const cv::Scalar textColor(255, 255, 255, 255);

    for (const auto& ball : result.balls) {
        cv::Scalar ballColor(128, 128, 128, 255);
        try {
            RGBColor rgb = hexToRgb(ball.color);
            ballColor = cv::Scalar(rgb.b, rgb.g, rgb.r, 255);
        } catch (const std::invalid_argument& e) {
            LOGE("Bad display color for %s: %s", ball.id.c_str(), e.what());
        }

        cv::Point center(cvRound(ball.position.x), cvRound(ball.position.y));
        int radius = std::max(1, cvRound(ball.radius));

        cv::circle(image, center, radius + thickness, outlineColor, thickness, cv::LINE_AA);
        cv::circle(image, center, radius, ballColor, thickness, cv::LINE_AA);

        std::string label = ballTypeToString(ball.ballType);
        if (ball.number) {
            label += " " + std::to_string(*ball.number);
        }
        cv::putText(image, label, center + cv::Point(radius + thickness + 2, 0),
                    cv::FONT_HERSHEY_SIMPLEX, textSize, outlineColor, thickness + 1, cv::LINE_AA);
        cv::putText(image, label, center + cv::Point(radius + thickness + 2, 0),
                    cv::FONT_HERSHEY_SIMPLEX, textSize, textColor, 1, cv::LINE_AA);
    }
}
