#include "edge_detection.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

#include "utilities.hpp"

using namespace cv;
using namespace std;

Mat EdgeDetection::toGrayscale(const Mat& rgba) {
    CV_Assert(rgba.type() == CV_8UC4);

    Mat gray(rgba.size(), CV_8UC1);
    for (int y = 0; y < rgba.rows; ++y) {
        const Vec4b* src = rgba.ptr<Vec4b>(y);
        uchar* dst = gray.ptr<uchar>(y);
        for (int x = 0; x < rgba.cols; ++x) {
            double luminance = 0.299 * src[x][0] + 0.587 * src[x][1] + 0.114 * src[x][2];
            dst[x] = saturate_cast<uchar>(std::floor(luminance));
        }
    }
    return gray;
}

Mat EdgeDetection::gaussianBlur(const Mat& gray, int radius) {
    CV_Assert(gray.type() == CV_8UC1);
    if (radius <= 0) return gray.clone();

    const int size = radius * 2 + 1;
    const double sigma = radius / 3.0;
    vector<double> kernel(size * size);
    for (int ky = -radius; ky <= radius; ++ky) {
        for (int kx = -radius; kx <= radius; ++kx) {
            kernel[(ky + radius) * size + (kx + radius)] =
                std::exp(-(kx * kx + ky * ky) / (2.0 * sigma * sigma));
        }
    }

    Mat blurred(gray.size(), CV_8UC1);
    for (int y = 0; y < gray.rows; ++y) {
        uchar* dst = blurred.ptr<uchar>(y);
        for (int x = 0; x < gray.cols; ++x) {
            double sum = 0.0;
            double weight = 0.0;
            for (int ky = -radius; ky <= radius; ++ky) {
                int py = y + ky;
                if (py < 0 || py >= gray.rows) continue;
                const uchar* src = gray.ptr<uchar>(py);
                for (int kx = -radius; kx <= radius; ++kx) {
                    int px = x + kx;
                    if (px < 0 || px >= gray.cols) continue;
                    double w = kernel[(ky + radius) * size + (kx + radius)];
                    sum += src[px] * w;
                    weight += w;
                }
            }
            dst[x] = saturate_cast<uchar>(std::floor(sum / weight));
        }
    }
    return blurred;
}

Mat EdgeDetection::sobelEdges(const Mat& gray) {
    CV_Assert(gray.type() == CV_8UC1);

    Mat edges = Mat::zeros(gray.size(), CV_8UC1);
    for (int y = 1; y < gray.rows - 1; ++y) {
        const uchar* above = gray.ptr<uchar>(y - 1);
        const uchar* row = gray.ptr<uchar>(y);
        const uchar* below = gray.ptr<uchar>(y + 1);
        uchar* dst = edges.ptr<uchar>(y);
        for (int x = 1; x < gray.cols - 1; ++x) {
            int gx = (above[x + 1] + 2 * row[x + 1] + below[x + 1]) -
                     (above[x - 1] + 2 * row[x - 1] + below[x - 1]);
            int gy = (below[x - 1] + 2 * below[x] + below[x + 1]) -
                     (above[x - 1] + 2 * above[x] + above[x + 1]);
            double magnitude = std::sqrt(static_cast<double>(gx * gx + gy * gy));
            dst[x] = static_cast<uchar>(std::min(255.0, magnitude));
        }
    }
    return edges;
}

Mat EdgeDetection::forwardDifferenceEdges(const Mat& gray) {
    CV_Assert(gray.type() == CV_8UC1);

    Mat edges = Mat::zeros(gray.size(), CV_8UC1);
    for (int y = 1; y < gray.rows - 1; ++y) {
        const uchar* row = gray.ptr<uchar>(y);
        const uchar* below = gray.ptr<uchar>(y + 1);
        uchar* dst = edges.ptr<uchar>(y);
        for (int x = 1; x < gray.cols - 1; ++x) {
            int gx = std::abs(row[x + 1] - row[x]);
            int gy = std::abs(below[x] - row[x]);
            double magnitude = std::sqrt(static_cast<double>(gx * gx + gy * gy));
            dst[x] = static_cast<uchar>(std::min(255.0, magnitude));
        }
    }
    return edges;
}

Mat EdgeDetection::computeEdgeMap(const Mat& rgba, const DetectorConfig& config) {
    Mat gray = toGrayscale(rgba);
    if (config.useBlur && config.blurRadius > 0) {
        gray = gaussianBlur(gray, config.blurRadius);
    }

    LOGI("[EdgeDetection] %dx%d, blur=%d, operator=%s", rgba.cols, rgba.rows,
         config.useBlur ? config.blurRadius : 0,
         config.edgeOperator == EdgeOperator::SOBEL ? "sobel" : "forward_difference");

    return config.edgeOperator == EdgeOperator::SOBEL ? sobelEdges(gray)
                                                      : forwardDifferenceEdges(gray);
}
