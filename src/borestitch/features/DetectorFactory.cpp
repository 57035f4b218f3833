#include "borestitch/features/FeatureDetector.hpp"
#include "borestitch/core/Log.hpp"
#include "../backend/cpu/CpuDetector.hpp"

#include <algorithm>
#include <cctype>
#include <memory>
#include <stdexcept>

namespace borestitch {

const char* detectorName(DetectorType type) {
    switch (type) {
        case DetectorType::SIFT:  return "SIFT";
        case DetectorType::ORB:   return "ORB";
        case DetectorType::AKAZE: return "AKAZE";
        case DetectorType::Auto:
        default:                  return "auto";
    }
}

std::optional<DetectorType> detectorFromName(const std::string& name) {
    std::string n = name;
    std::transform(n.begin(), n.end(), n.begin(), [](unsigned char c) { return char(std::tolower(c)); });
    if (n == "auto")  return DetectorType::Auto;
    if (n == "sift")  return DetectorType::SIFT;
    if (n == "orb")   return DetectorType::ORB;
    if (n == "akaze") return DetectorType::AKAZE;
    return std::nullopt;
}

/* Probe the backends in order of robustness. A backend that is missing from
   the OpenCV build throws on creation and is skipped. */
DetectorType resolveDetectorType(DetectorType type) {
    if (type != DetectorType::Auto) return type;

    for (DetectorType t : {DetectorType::SIFT, DetectorType::ORB, DetectorType::AKAZE}) {
        try {
            CpuFeatureDetector probe(t, FeatureOptions{});
            return t;
        } catch (const cv::Exception& e) {
            logger()->debug("detector {} unavailable: {}", detectorName(t), e.what());
        }
    }
    throw std::runtime_error("no feature detector backend available");
}

std::unique_ptr<IFeatureDetector> makeDetector(DetectorType type, const FeatureOptions& opt)
{
    const DetectorType resolved = resolveDetectorType(type);
    return std::make_unique<CpuFeatureDetector>(resolved, opt);
}

} // namespace borestitch
