#include "borestitch/features/FeatureMatcher.hpp"

#include <opencv2/features2d.hpp>

namespace borestitch {

MatchSet matchFeatures(const KeypointSet& a, const KeypointSet& b, double ratio)
{
    MatchSet out;
    if (a.empty() || b.empty()) return out;
    if (a.descriptors.type() != b.descriptors.type() ||
        a.descriptors.cols != b.descriptors.cols ||
        a.normType != b.normType) {
        return out;
    }

    cv::BFMatcher matcher(a.normType, /*crossCheck=*/false);
    std::vector<std::vector<cv::DMatch>> knn;
    matcher.knnMatch(a.descriptors, b.descriptors, knn, 2);

    out.reserve(knn.size());
    for (const auto& pair : knn) {
        // a single candidate has no second best to compare with
        if (pair.size() < 2) continue;
        const cv::DMatch& m = pair[0];
        const cv::DMatch& n = pair[1];
        if (m.distance < ratio * n.distance) {
            out.push_back({a.keypoints[m.queryIdx].pt, b.keypoints[m.trainIdx].pt});
        }
    }
    return out;
}

} // namespace borestitch
