#ifndef TEST_SUPPORT_HPP
#define TEST_SUPPORT_HPP

#include <cmath>
#include <iostream>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <string>
#include <vector>

#include "colors.hpp"

static int testFailures = 0;

#define CHECK(cond)                                                                    \
    do {                                                                               \
        if (!(cond)) {                                                                 \
            std::cerr << "Check failed: " #cond " (" << __FILE__ << ":" << __LINE__ << ")" \
                      << std::endl;                                                    \
            ++testFailures;                                                            \
        }                                                                              \
    } while (0)

#define CHECK_NEAR(a, b, tol)                                                                \
    do {                                                                                     \
        double checkA = (a), checkB = (b);                                                   \
        if (std::abs(checkA - checkB) > (tol)) {                                             \
            std::cerr << "Check failed: " #a " = " << checkA << ", expected " << checkB      \
                      << " +/- " << (tol) << " (" << __FILE__ << ":" << __LINE__ << ")"      \
                      << std::endl;                                                          \
            ++testFailures;                                                                  \
        }                                                                                    \
    } while (0)

#define CHECK_THROWS(expr, type)                                                       \
    do {                                                                               \
        bool checkThrew = false;                                                       \
        try {                                                                          \
            expr;                                                                      \
        } catch (const type&) {                                                        \
            checkThrew = true;                                                         \
        }                                                                              \
        if (!checkThrew) {                                                             \
            std::cerr << "Check failed: " #expr " did not throw " #type " (" << __FILE__ \
                      << ":" << __LINE__ << ")" << std::endl;                          \
            ++testFailures;                                                            \
        }                                                                              \
    } while (0)

inline int finishTest(const std::string& name) {
    if (testFailures > 0) {
        std::cerr << name << ": " << testFailures << " check(s) failed." << std::endl;
        return -1;
    }
    std::cout << "Test passed: " << name << std::endl;
    return 0;
}

// Uniform opaque RGBA canvas.
inline cv::Mat makeTable(int width, int height, const RGBColor& felt) {
    return cv::Mat(height, width, CV_8UC4, cv::Scalar(felt.r, felt.g, felt.b, 255));
}

inline void drawBall(cv::Mat& rgba, cv::Point center, int radius, const RGBColor& color) {
    cv::circle(rgba, center, radius, cv::Scalar(color.r, color.g, color.b, 255), cv::FILLED,
               cv::LINE_8);
}

inline std::vector<unsigned char> encodePng(const cv::Mat& rgba) {
    cv::Mat bgra;
    cv::cvtColor(rgba, bgra, cv::COLOR_RGBA2BGRA);
    std::vector<unsigned char> bytes;
    cv::imencode(".png", bgra, bytes);
    return bytes;
}

#endif  // TEST_SUPPORT_HPP
