#pragma once
#include "borestitch/align/Registration.hpp"
#include "borestitch/align/TemplateMatcher.hpp"
#include "borestitch/features/FeatureMatcher.hpp"

#include <opencv2/core.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>

namespace borestitch {

struct MotionOptions {
    double ratioTest            = 0.7;
    std::size_t minMatches      = 10;     // below this the RANSAC path is skipped

    // similarity fit
    double reprojThreshold      = 3.0;
    std::size_t affineIterations = 2000;
    double affineConfidence     = 0.99;
    double minAbsDy             = 0.1;    // exclusive
    double maxAbsDy             = 200.0;  // exclusive
    double scaleLo              = 0.8;
    double scaleHi              = 1.2;
    double minInlierRatio       = 0.3;    // exclusive

    // translation fit
    int    translationIterations = 1000;
    double translationTolerance = 5.0;    // px
    double translationMinShare  = 0.2;
    int    translationMinInliers = 3;

    // band correlation fallback
    TemplateOptions templ;
    double templateAcceptScore  = 0.15;
    double templateMinOffset    = 1.0;    // |offset| must exceed this

    // placement
    bool   invertVertical       = true;   // probe forward -> next frame lower on the canvas
    double motionThreshold      = 5.0;    // px, static vs moving
    std::size_t minSamples      = 5;      // relative offsets needed to classify
    bool   constantVelocity     = false;

    std::uint64_t seed          = 0x5eed;
};

/** What registerPair did for one pair. */
struct PairRegistration {
    RegistrationResult result{NoFit{}};
    bool ransacAttempted{false};
    bool templateAttempted{false};
};

/// RANSAC similarity (rotation + uniform scale + translation) fit A -> B,
/// returned only if it passes the plausibility gate.
std::optional<AffineFit> estimateSimilarity(const MatchSet& matches, const MotionOptions& opt = {});

/// One-point RANSAC translation fit A -> B, refined to the mean over inliers.
/// Deterministic for a given seed.
std::optional<TranslationFit> estimateTranslation(const MatchSet& matches, const MotionOptions& opt = {});

/**
 * Registration of consecutive frames A and B.
 *   - fewer than minMatches correspondences -> band correlation only;
 *   - otherwise similarity fit, then translation fit, then band correlation;
 *   - a correlation below templateAcceptScore or within templateMinOffset
 *     of zero gives NoFit.
 * Always returns a result; degraded pairs show up in the tag.
 */
PairRegistration registerPair(const cv::Mat& a, const cv::Mat& b,
                              const MatchSet& matches,
                              const MotionOptions& opt = {});

} // namespace borestitch
