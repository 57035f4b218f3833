#pragma once
#include <opencv2/core.hpp>
#include <vector>

namespace borestitch {

struct TemplateOptions {
    std::vector<double> scales{1.0, 0.75, 0.5};
    double bandFraction   = 0.6;   // central template band, share of A's height
    int    bandMaxRows    = 300;
    double retryBelow     = 0.3;   // best score under this -> try the edge bands
    double edgeFraction   = 0.4;   // top / bottom edge bands
    int    edgeMaxRows    = 150;
    int    edgeMinRows    = 50;    // edge bands must be strictly taller than this
};

/** Result of the band correlation. */
struct TemplateMatch {
    double offset{0.0};      // row of the band in B minus its row in A (sub-pixel)
    double confidence{-1.0}; // TM_CCOEFF_NORMED peak, -1 when nothing was evaluated
    double scale{1.0};
    bool   ok{false};
};

/**
 * 1D vertical offset between two frames (CV_8UC1 or CV_8UC3) by normalised
 * cross-correlation of a band of A against the whole of B.
 * Both frames are equalised and lightly smoothed first; the band is searched
 * at several pyramid scales and the strongest peak wins. The peak row is
 * refined with a 3-point parabola.
 */
TemplateMatch matchVerticalOffset(const cv::Mat& a, const cv::Mat& b,
                                  const TemplateOptions& opt = {});

} // namespace borestitch
