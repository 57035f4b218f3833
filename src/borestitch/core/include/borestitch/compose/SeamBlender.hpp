#pragma once
#include <opencv2/core.hpp>

namespace borestitch {

struct BlendOptions {
    bool   matchHistograms = true;    // colour-match the incoming band to the existing one
    bool   gradientMask    = true;    // mix in the local gradient preference
    double curveShare      = 0.7;     // weight of the smooth curve vs the gradient mask
    int    gradientBlur    = 15;      // odd Gaussian kernel for the gradient mask
    int    pyramidLevels   = 4;
    double textureKnee     = 20.0;    // mean gradient at which both estimates mix 50/50
    double mixLo           = 0.15;    // clamp of the pyramid share
    double mixHi           = 0.85;
    bool   edgeSmoothing   = true;    // bilateral 5/35/35, mixed 0.7 / 0.3
};

struct BlendOutcome {
    cv::Mat band;                 // same size and type as the inputs
    bool    skipped{false};       // inputs unusable, band is a copy of incoming
    double  texture{0.0};         // mean gradient magnitude of both bands
    double  pyramidShare{0.0};
};

/**
 * Blend one overlap band. `existing` is what the canvas already holds,
 * `incoming` the same rows of the new frame. Accepts CV_8UC3 or CV_32FC3
 * (values in [0, 255]). With existingOnTop the existing content dominates the
 * first row and the incoming one the last row; otherwise the other way round.
 * Never throws on bad operands: a shape or type mismatch is reported as skipped.
 */
BlendOutcome blendBand(const cv::Mat& existing, const cv::Mat& incoming,
                       const BlendOptions& opt = {}, bool existingOnTop = true);

/// Per-channel CDF matching of an 8-bit image to a reference (same channel count).
cv::Mat matchHistograms(const cv::Mat& src8, const cv::Mat& ref8);

/// Weight of the existing band per row: smoothstep 1 -> 0 over `rows` (CV_32F, rows x 1).
cv::Mat smoothstepWeights(int rows, bool existingOnTop = true);

/// Mean Sobel gradient magnitude of the grey image (any 3-channel or 1-channel input).
double textureScore(const cv::Mat& img);

} // namespace borestitch
