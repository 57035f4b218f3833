#pragma once

#include <opencv2/core.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace borestitch {

/* Detector implementation types. Auto probes SIFT, then ORB, then AKAZE. */
enum class DetectorType : std::uint8_t {
    Auto = 0,
    SIFT = 1,
    ORB = 2,
    AKAZE = 3
};

/* Keypoints of one frame with their descriptors (row i belongs to keypoint i). */
struct KeypointSet {
    std::vector<cv::KeyPoint> keypoints;
    cv::Mat descriptors;
    int normType{cv::NORM_L2};  // how descriptors compare: L2 (SIFT) or Hamming (ORB/AKAZE)

    [[nodiscard]] bool empty() const noexcept { return keypoints.empty() || descriptors.empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return keypoints.size(); }
};

struct FeatureOptions {
    DetectorType detector   = DetectorType::Auto;
    int    maxKeypoints     = 2000;   // strongest responses kept (1..8000)
    double claheClipLimit   = 3.0;    // contrast normalisation before detection
    int    claheTileGrid    = 8;      // tiles per axis
};

/*
  Feature detector interface.

  Implementations should provide:
    - detect(): keypoints + descriptors on an 8-bit grayscale image; an image
      without features yields an empty set, never an error.
    - name(): backend name for logs.
*/
class IFeatureDetector {
public:
    virtual ~IFeatureDetector() = default;

    [[nodiscard]] virtual KeypointSet detect(const cv::Mat& gray8) = 0;

    [[nodiscard]] virtual std::string name() const = 0;
};

/* Factory function for creating a detector of the requested type.
   Throws std::runtime_error if no backend can be constructed. */
std::unique_ptr<IFeatureDetector> makeDetector(DetectorType type, const FeatureOptions& opt = {});

/* Resolve Auto to the first backend that constructs on this OpenCV build. */
DetectorType resolveDetectorType(DetectorType type);

const char* detectorName(DetectorType type);

/* Case-insensitive "auto", "sift", "orb", "akaze"; nullopt for anything else. */
std::optional<DetectorType> detectorFromName(const std::string& name);

} // namespace borestitch
