#include "colors.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <stdexcept>

HSVColor rgbToHsv(const RGBColor& rgb) {
    double r = rgb.r / 255.0;
    double g = rgb.g / 255.0;
    double b = rgb.b / 255.0;

    double maxC = std::max({r, g, b});
    double minC = std::min({r, g, b});
    double delta = maxC - minC;

    double h = 0.0;
    double s = 0.0;

    if (delta > 0.0) {
        s = delta / maxC;
        if (maxC == r) {
            h = ((g - b) / delta + (g < b ? 6.0 : 0.0)) / 6.0;
        } else if (maxC == g) {
            h = ((b - r) / delta + 2.0) / 6.0;
        } else {
            h = ((r - g) / delta + 4.0) / 6.0;
        }
    }

    double hue = h * 360.0;
    if (hue >= 360.0) hue -= 360.0;
    return {hue, s * 100.0, maxC * 100.0};
}

RGBColor hsvToRgb(const HSVColor& hsv) {
    double h = hsv.h / 360.0;
    double s = hsv.s / 100.0;
    double v = hsv.v / 100.0;

    int i = static_cast<int>(std::floor(h * 6.0));
    double f = h * 6.0 - i;
    double p = v * (1.0 - s);
    double q = v * (1.0 - f * s);
    double t = v * (1.0 - (1.0 - f) * s);

    double r = 0.0, g = 0.0, b = 0.0;
    switch (((i % 6) + 6) % 6) {
        case 0:
            r = v, g = t, b = p;
            break;
        case 1:
            r = q, g = v, b = p;
            break;
        case 2:
            r = p, g = v, b = t;
            break;
        case 3:
            r = p, g = q, b = v;
            break;
        case 4:
            r = t, g = p, b = v;
            break;
        default:
            r = v, g = p, b = q;
            break;
    }

    return {static_cast<int>(std::lround(r * 255.0)), static_cast<int>(std::lround(g * 255.0)),
            static_cast<int>(std::lround(b * 255.0))};
}

bool isColorInRange(const HSVColor& color, const HSVColor& min, const HSVColor& max) {
    bool hueInRange;
    if (min.h <= max.h) {
        hueInRange = color.h >= min.h && color.h <= max.h;
    } else {
        hueInRange = color.h >= min.h || color.h <= max.h;
    }

    bool saturationInRange = color.s >= min.s && color.s <= max.s;
    bool valueInRange = color.v >= min.v && color.v <= max.v;

    return hueInRange && saturationInRange && valueInRange;
}

double hueDifference(double h1, double h2) {
    double diff = std::fmod(std::abs(h1 - h2), 360.0);
    return diff > 180.0 ? 360.0 - diff : diff;
}

double colorDistance(const HSVColor& color1, const HSVColor& color2) {
    double hueDiff = hueDifference(color1.h, color2.h) / 180.0;
    double satDiff = std::abs(color1.s - color2.s) / 100.0;
    double valDiff = std::abs(color1.v - color2.v) / 100.0;

    return std::sqrt((hueDiff * 2.0) * (hueDiff * 2.0) + satDiff * satDiff + valDiff * valDiff);
}

std::string rgbToHex(const RGBColor& rgb) {
    char buffer[8];
    std::snprintf(buffer, sizeof(buffer), "#%02x%02x%02x", std::clamp(rgb.r, 0, 255),
                  std::clamp(rgb.g, 0, 255), std::clamp(rgb.b, 0, 255));
    return buffer;
}

RGBColor hexToRgb(const std::string& hex) {
    std::string digits = (!hex.empty() && hex[0] == '#') ? hex.substr(1) : hex;
    if (digits.size() != 6 ||
        !std::all_of(digits.begin(), digits.end(),
                     [](unsigned char c) { return std::isxdigit(c) != 0; })) {
        throw std::invalid_argument("Invalid hex color: " + hex);
    }

    return {std::stoi(digits.substr(0, 2), nullptr, 16), std::stoi(digits.substr(2, 2), nullptr, 16),
            std::stoi(digits.substr(4, 2), nullptr, 16)};
}

RGBColor autoWhiteBalance(const RGBColor& rgb) {
    double avg = (rgb.r + rgb.g + rgb.b) / 3.0;
    if (avg == 0.0) return rgb;

    auto scale = [avg](int channel) {
        return std::min(255, static_cast<int>(std::lround(channel / avg * 128.0)));
    };
    return {scale(rgb.r), scale(rgb.g), scale(rgb.b)};
}

RGBColor getDominantColor(const cv::Mat& rgba, cv::Point2f center, int radius) {
    CV_Assert(rgba.type() == CV_8UC4);

    int cx = static_cast<int>(std::lround(center.x));
    int cy = static_cast<int>(std::lround(center.y));
    int r2 = radius * radius;

    long sumR = 0, sumG = 0, sumB = 0, count = 0;
    for (int dy = -radius; dy <= radius; ++dy) {
        int y = cy + dy;
        if (y < 0 || y >= rgba.rows) continue;
        const cv::Vec4b* row = rgba.ptr<cv::Vec4b>(y);
        for (int dx = -radius; dx <= radius; ++dx) {
            int x = cx + dx;
            if (dx * dx + dy * dy > r2 || x < 0 || x >= rgba.cols) continue;
            sumR += row[x][0];
            sumG += row[x][1];
            sumB += row[x][2];
            ++count;
        }
    }

    if (count == 0) return {0, 0, 0};

    return {static_cast<int>(std::lround(static_cast<double>(sumR) / count)),
            static_cast<int>(std::lround(static_cast<double>(sumG) / count)),
            static_cast<int>(std::lround(static_cast<double>(sumB) / count))};
}
