#pragma once
#include "borestitch/features/FeatureDetector.hpp"

#include <opencv2/core.hpp>
#include <vector>

namespace borestitch {

/** One correspondence: a point in frame A and the matching point in frame B. */
struct Correspondence {
    cv::Point2f a;
    cv::Point2f b;
};

using MatchSet = std::vector<Correspondence>;

/**
 * k=2 nearest neighbour matching A -> B followed by Lowe's ratio test:
 * a query keeps its best match only if best < ratio * second best.
 * Empty or incompatible inputs give an empty MatchSet.
 */
MatchSet matchFeatures(const KeypointSet& a, const KeypointSet& b, double ratio = 0.7);

} // namespace borestitch
