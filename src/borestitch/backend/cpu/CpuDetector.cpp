#include "CpuDetector.hpp"

#include <algorithm>
#include <stdexcept>

namespace borestitch {

namespace {
constexpr int kMaxKeypointsCap = 8000;

cv::Ptr<cv::Feature2D> createImpl(DetectorType type, int nfeatures) {
    switch (type) {
        case DetectorType::SIFT:
            // low contrast threshold: borescope walls are weakly textured
            return cv::SIFT::create(nfeatures, 3, 0.02, 8.0);
        case DetectorType::ORB:
            return cv::ORB::create(nfeatures, 1.2f, 8);
        case DetectorType::AKAZE:
            return cv::AKAZE::create();
        case DetectorType::Auto:
        default:
            throw std::runtime_error("CpuFeatureDetector: Auto must be resolved before construction");
    }
}
} // namespace

CpuFeatureDetector::CpuFeatureDetector(DetectorType type, const FeatureOptions& opt)
    : type_(type)
    , impl_(createImpl(type, std::clamp(opt.maxKeypoints, 1, kMaxKeypointsCap)))
    , maxKeypoints_(std::clamp(opt.maxKeypoints, 1, kMaxKeypointsCap))
{
    if (impl_.empty()) {
        throw std::runtime_error(std::string("CpuFeatureDetector: failed to create ") + detectorName(type));
    }
}

/* Detect, keep the strongest responses, then describe only those.
   Describing after the cap keeps descriptor rows aligned with keypoints. */
KeypointSet CpuFeatureDetector::detect(const cv::Mat& gray8) {
    CV_Assert(gray8.type() == CV_8UC1);

    KeypointSet out;
    out.normType = (type_ == DetectorType::SIFT) ? cv::NORM_L2 : cv::NORM_HAMMING;
    if (gray8.empty()) return out;

    std::vector<cv::KeyPoint> kps;
    impl_->detect(gray8, kps);
    if (kps.empty()) return out;

    if ((int)kps.size() > maxKeypoints_) {
        cv::KeyPointsFilter::retainBest(kps, maxKeypoints_);
        // retainBest keeps ties at the threshold, trim to the exact cap
        if ((int)kps.size() > maxKeypoints_) kps.resize(maxKeypoints_);
    }

    cv::Mat desc;
    impl_->compute(gray8, kps, desc);
    if (kps.empty() || desc.empty()) return out;

    out.keypoints = std::move(kps);
    out.descriptors = desc;
    return out;
}

std::string CpuFeatureDetector::name() const {
    return detectorName(type_);
}

} // namespace borestitch
