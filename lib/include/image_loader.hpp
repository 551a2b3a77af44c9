#ifndef IMAGE_LOADER_HPP
#define IMAGE_LOADER_HPP

#include <opencv2/core.hpp>
#include <stdexcept>
#include <string>
#include <vector>

class ImageDecodeError : public std::runtime_error {
   public:
    explicit ImageDecodeError(const std::string& message) : std::runtime_error(message) {}
};

struct WorkingImage {
    cv::Mat rgba;         // CV_8UC4, R G B A
    double scale = 1.0;   // working / original, <= 1
};

class ImageLoader {
   public:
    /**
     * Decode an encoded image (PNG, JPEG, anything imdecode understands) to RGBA.
     * Grayscale and 3-channel inputs get an opaque alpha channel; 16-bit inputs are
     * reduced to 8 bits. The EXIF orientation tag is applied, except to PNG and WebP
     * input, which is decoded as stored so its alpha channel survives.
     * @throws ImageDecodeError when the bytes are empty or cannot be decoded
     */
    static cv::Mat decode(const std::vector<unsigned char>& bytes);

    static cv::Mat loadFile(const std::string& path);

    // "data:image/...;base64,<payload>" or a bare base64 payload.
    static cv::Mat decodeDataUrl(const std::string& dataUrl);

    /**
     * Copy a 4-channel pixel buffer handed over by a camera layer.
     * @param bytes Start of the first row
     * @param stride Bytes per row, at least width * 4
     * @param channelFormat 0 = BGRA, 1 = RGBA
     */
    static cv::Mat fromPixels(const unsigned char* bytes, int width, int height, int stride,
                              int channelFormat);

    // Any 1/3/4 channel BGR(A) image as imdecode returns it.
    static cv::Mat toRgba(const cv::Mat& decoded);

    /**
     * Scale the image so its longer side is at most maxDimension. Images already within
     * bounds are returned as is with scale 1.
     */
    static WorkingImage downscale(const cv::Mat& rgba, int maxDimension);
};

#endif  // IMAGE_LOADER_HPP
