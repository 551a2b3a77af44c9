#ifndef BALLSCAN_HPP
#define BALLSCAN_HPP

#include <memory>
#include <opencv2/core.hpp>
#include <string>
#include <vector>

#include "ball_types.hpp"
#include "detector_config.hpp"

/**
 * Detects and classifies billiard balls in a single still image.
 *
 * The image is downscaled to config.maxWorkingDimension, searched for circles, and every
 * surviving circle is classified by color (and, for pool, by stripe pattern). Returned
 * coordinates are in the original image's pixel space.
 *
 * Holds only its configuration, so one instance can serve concurrent calls.
 */
class BallFinder {
   public:
    // Validates the config; throws std::invalid_argument on bad values.
    explicit BallFinder(const DetectorConfig& config = DetectorConfig());
    ~BallFinder();  // Required for std::unique_ptr with forward-declared type

    /**
     * @param encodedBytes PNG/JPEG/... file contents
     * @param progress Optional; called with (percent, stage) at fixed milestones
     * @throws ImageDecodeError when the bytes cannot be decoded
     */
    DetectionResult detect(const std::vector<unsigned char>& encodedBytes, GameMode mode,
                           const ProgressCallback& progress = nullptr) const;

    DetectionResult detectFile(const std::string& path, GameMode mode,
                               const ProgressCallback& progress = nullptr) const;

    DetectionResult detectDataUrl(const std::string& dataUrl, GameMode mode,
                                  const ProgressCallback& progress = nullptr) const;

    // Already decoded CV_8UC4 image in R, G, B, A order.
    DetectionResult detectPixels(const cv::Mat& rgba, GameMode mode,
                                 const ProgressCallback& progress = nullptr) const;

    const DetectorConfig& getConfig() const;

   private:
    struct Impl;
    std::unique_ptr<Impl> pimpl;
};

typedef void (*ballscan_progress_fn)(double percent, const char* stage);

#ifdef __cplusplus
extern "C" {
#endif

// configJson may be null or empty for defaults. Returns null when the config is invalid.
__attribute__((visibility("default"))) __attribute__((used)) void* initialize_ball_finder(
    const char* configJson);

// channelFormat: 0 = BGRA, 1 = RGBA. progress may be null.
__attribute__((visibility("default"))) __attribute__((used)) const char* detect_balls_rgba(
    void* finderPtr, const unsigned char* imageBytes, int width, int height, int stride,
    int channelFormat, const char* gameMode, ballscan_progress_fn progress);

__attribute__((visibility("default"))) __attribute__((used)) const char* detect_balls_encoded(
    void* finderPtr, const unsigned char* encodedBytes, int length, const char* gameMode,
    ballscan_progress_fn progress);

__attribute__((visibility("default"))) __attribute__((used)) void release_ball_finder(
    void* finderPtr);

#ifdef __cplusplus
}
#endif

#endif  // BALLSCAN_HPP
