#pragma once

#include "borestitch/features/FeatureDetector.hpp"

#include <opencv2/features2d.hpp>

namespace borestitch {

/*
  CPU detector backed by one of OpenCV's Feature2D implementations.

  Notes:
    - Input images are expected to be 8-bit grayscale.
    - One instance is not shared across threads; the extractor creates one
      per worker.
*/
class CpuFeatureDetector final : public IFeatureDetector {
public:
    // Throws cv::Exception if the backend is not available in this build.
    CpuFeatureDetector(DetectorType type, const FeatureOptions& opt);

    KeypointSet detect(const cv::Mat& gray8) override;

    std::string name() const override;

private:
    DetectorType type_;
    cv::Ptr<cv::Feature2D> impl_;
    int maxKeypoints_;
};

} // namespace borestitch
