#pragma once
#include <opencv2/core.hpp>

#include <cstdint>
#include <deque>

namespace borestitch {

enum class DefocusMethod : std::uint8_t {
    Wiener = 0,
    LucyRichardson = 1
};

const char* defocusMethodName(DefocusMethod m);

struct DeblurOptions {
    DefocusMethod method          = DefocusMethod::Wiener;
    int    lucyRichardsonIterations = 10;
    double wienerNoiseRatio       = 0.1;
    double minRadius              = 0.5;
    double maxRadius              = 10.0;
    std::size_t historyFrames     = 3;     // estimates averaged over recent frames
};

/// Blur radius (px) and a [0.1, 1] severity score.
struct DefocusEstimate {
    double radius{0.0};
    double strength{0.0};
};

/// Median of the edge-width, spectral-attenuation and gradient-sharpness estimates.
DefocusEstimate estimateDefocus(const cv::Mat& bgr8);

/// Gaussian-weighted disk PSF, CV_32F, sums to 1. Radius < 0.5 gives the identity.
cv::Mat defocusKernel(double radius);

/// Frequency-domain Wiener filter with a Laplacian regulariser. Channel in [0, 1], CV_32F.
cv::Mat wienerDeconvolve(const cv::Mat& channel, const cv::Mat& psf, double balance);

/// Lucy-Richardson iterations. Channel in [0, 1], CV_32F.
cv::Mat lucyRichardson(const cv::Mat& channel, const cv::Mat& psf, int iterations);

/*
  Optional defocus pre-stage. One instance per sequence: the blur estimate
  is smoothed over the last few frames.
*/
class Deblurrer {
public:
    explicit Deblurrer(DeblurOptions opt = {}) : opt_(opt) {}

    /// Restored copy of a CV_8UC3 frame.
    cv::Mat process(const cv::Mat& bgr8);

    const DefocusEstimate& lastEstimate() const { return last_; }

private:
    DeblurOptions opt_;
    std::deque<DefocusEstimate> history_;
    DefocusEstimate last_;
};

} // namespace borestitch
