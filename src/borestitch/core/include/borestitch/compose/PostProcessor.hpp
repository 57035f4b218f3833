#pragma once
#include <opencv2/core.hpp>

namespace borestitch {

struct PostOptions {
    bool   crop            = true;
    int    nearBlack       = 8;      // grey <= this counts as empty canvas

    bool   removeSeams     = true;
    double seamSigma       = 2.5;    // Sobel response above this many std devs is an edge
    double minSeamFraction = 0.3;    // seam lines must span this share of the width
    int    seamBorder      = 10;     // rows this close to the top / bottom are left alone

    bool   sharpen         = true;
    double sharpenSigma    = 1.0;
    double sharpenAmount   = 0.25;

    bool   colorBalance    = true;

    bool   fillHoles       = true;
    int    holeThreshold   = 10;     // grey < this is inpainted
};

/// Bounding box of pixels whose grey value exceeds nearBlack (empty rect if none).
cv::Rect validBounds(const cv::Mat& bgr8, int nearBlack);

/// Copy of the image cropped to validBounds; unchanged copy when nothing qualifies.
cv::Mat cropValid(const cv::Mat& bgr8, int nearBlack);

/// Find long near-horizontal edge lines and re-interpolate the rows around them.
/// Works in place; returns the number of seam rows repaired.
int removeSeams(cv::Mat& bgr8, const PostOptions& opt = {});

/// Replace rows y-2..y+2 by a smooth curve between rows y-3 and y+3.
void repairSeamRow(cv::Mat& bgr8, int y);

cv::Mat sharpen(const cv::Mat& bgr8, double sigma, double amount);

/// Scale every channel so the channel means become equal.
cv::Mat colorBalance(const cv::Mat& bgr8);

/// Inpaint pixels with grey < threshold (Telea), then any still < threshold/2 (Navier-Stokes).
cv::Mat fillHoles(const cv::Mat& bgr8, int threshold);

/**
 * Final clean-up of a composed canvas (CV_8UC3): crop, seam repair,
 * sharpen, colour balance, hole filling. Each stage can be switched off.
 */
cv::Mat postProcess(const cv::Mat& bgr8, const PostOptions& opt = {});

} // namespace borestitch
