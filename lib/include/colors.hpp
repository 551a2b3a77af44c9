#ifndef COLORS_HPP
#define COLORS_HPP

#include <opencv2/core.hpp>
#include <string>

struct RGBColor {
    int r;
    int g;
    int b;
};

struct HSVColor {
    double h;  // [0, 360)
    double s;  // [0, 100]
    double v;  // [0, 100]
};

HSVColor rgbToHsv(const RGBColor& rgb);

RGBColor hsvToRgb(const HSVColor& hsv);

/**
 * Check whether an HSV color lies inside the box [min, max].
 * Saturation and value are closed intervals. When min.h > max.h the hue interval wraps
 * through 360 (e.g. 340..10 for red).
 */
bool isColorInRange(const HSVColor& color, const HSVColor& min, const HSVColor& max);

/**
 * Weighted HSV distance. Hue difference is circular and normalized by 180 and counts
 * double; saturation and value differences are normalized by 100.
 */
double colorDistance(const HSVColor& color1, const HSVColor& color2);

// Shortest angular distance between two hues, in degrees [0, 180].
double hueDifference(double h1, double h2);

std::string rgbToHex(const RGBColor& rgb);

// Accepts "#rrggbb" or "rrggbb". Throws std::invalid_argument on anything else.
RGBColor hexToRgb(const std::string& hex);

// Gray-world correction of a single color: each channel scaled by 128 / channel mean.
RGBColor autoWhiteBalance(const RGBColor& rgb);

/**
 * Average color of the pixels of an RGBA image inside a disk.
 * @param rgba CV_8UC4 image in R, G, B, A order
 * @param center Disk center in pixel coordinates
 * @param radius Disk radius in pixels; pixels outside the frame are skipped
 * @return Rounded channel means, or black when no pixel was sampled
 */
RGBColor getDominantColor(const cv::Mat& rgba, cv::Point2f center, int radius);

inline RGBColor pixelColor(const cv::Mat& rgba, int x, int y) {
    const cv::Vec4b& px = rgba.at<cv::Vec4b>(y, x);
    return {px[0], px[1], px[2]};
}

#endif  // COLORS_HPP
