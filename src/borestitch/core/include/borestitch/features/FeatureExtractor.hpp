#pragma once
#include "borestitch/features/FeatureDetector.hpp"

#include <opencv2/core.hpp>
#include <stop_token>
#include <vector>

namespace borestitch {

/** Grayscale + CLAHE (bounded tile grid) applied before every detection. */
cv::Mat normalizeForDetection(const cv::Mat& bgr8, const FeatureOptions& opt = {});

/**
 * Keypoints and descriptors of one frame (CV_8UC3 or CV_8UC1).
 * A frame without features yields an empty set.
 */
KeypointSet extractFeatures(const cv::Mat& frame, IFeatureDetector& detector,
                            const FeatureOptions& opt = {});

/**
 * Extraction over a whole sequence. Frames are independent, so they are
 * spread over `workers` threads (0 = hardware concurrency), each with its
 * own detector. Results come back in frame order. Throws Cancelled if a
 * stop is requested before all frames are processed.
 */
std::vector<KeypointSet> extractAll(const std::vector<cv::Mat>& frames,
                                    const FeatureOptions& opt = {},
                                    std::size_t workers = 0,
                                    std::stop_token stop = {});

} // namespace borestitch
