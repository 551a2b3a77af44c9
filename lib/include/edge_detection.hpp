#ifndef EDGE_DETECTION_HPP
#define EDGE_DETECTION_HPP

#include <opencv2/core.hpp>

#include "detector_config.hpp"

class EdgeDetection {
   public:
    /**
     * Luminance of an RGBA image, floor(0.299 R + 0.587 G + 0.114 B).
     * @param rgba CV_8UC4 image in R, G, B, A order
     * @return New CV_8UC1 image of the same size
     */
    static cv::Mat toGrayscale(const cv::Mat& rgba);

    /**
     * Direct 2D Gaussian blur with sigma = radius / 3. Each output pixel is divided by the
     * weights actually sampled, so the kernel is truncated and renormalized at the border
     * instead of reading zeros.
     * @param gray CV_8UC1 input
     * @param radius Kernel radius in pixels; 0 returns a copy
     */
    static cv::Mat gaussianBlur(const cv::Mat& gray, int radius);

    // 3x3 Sobel magnitude, min(255, sqrt(gx^2 + gy^2)). Border rows and columns are 0.
    static cv::Mat sobelEdges(const cv::Mat& gray);

    // One-pixel forward differences, cheaper and noisier than Sobel. Border left at 0.
    static cv::Mat forwardDifferenceEdges(const cv::Mat& gray);

    // Grayscale, optional blur and the configured edge operator in one call.
    static cv::Mat computeEdgeMap(const cv::Mat& rgba, const DetectorConfig& config);
};

#endif  // EDGE_DETECTION_HPP
