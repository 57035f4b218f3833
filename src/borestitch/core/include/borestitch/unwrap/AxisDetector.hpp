#pragma once
#include <opencv2/core.hpp>
#include <vector>

namespace borestitch {

/// Detected bore axis. Confidence 0 means "no plausible circle, geometric centre used".
struct AxisCenter {
    cv::Point2d center;
    double confidence{0.0};
};

/// One Hough pass: radius band as a share of min(w, h).
struct HoughPass {
    double minDist;
    double param1;
    double param2;
    double minRadius;
    double maxRadius;
    bool   centreCrop;     // search only the central half of the frame
};

struct AxisOptions {
    double claheClipLimit = 1.5;
    std::vector<HoughPass> passes{
        {100.0, 180.0, 80.0, 0.15, 0.35, false},   // bore wall
        { 80.0, 160.0, 70.0, 0.08, 0.20, false},   // pipe structure
        { 30.0, 140.0, 50.0, 0.03, 0.12, true },   // far end
    };
    int    borderMargin    = 5;      // circle must stay this far inside the frame
    double minRadiusShare  = 0.02;
    double maxRadiusShare  = 0.4;
    double minScore        = 0.4;    // exclusive
    std::size_t maxCandidates = 20;
};

struct CircleCandidate {
    cv::Point2d center;
    double radius{0.0};
    double score{0.0};
};

/// Canny (100, 200) coverage of the circumference, scaled so a third is full score.
double circleEdgeScore(const cv::Mat& gray8, cv::Point center, int radius);

/// Scored and filtered Hough candidates, best first.
std::vector<CircleCandidate> findAxisCandidates(const cv::Mat& bgr8, const AxisOptions& opt = {});

/**
 * Bore axis of a circular view. Among the candidates the one nearest the
 * frame centre while lying strictly below it wins (nearest overall if none
 * lies below). Confidence mixes the spread of the candidate centres with
 * how many there are. Without candidates the geometric centre is returned
 * with confidence 0.
 */
AxisCenter detectAxis(const cv::Mat& bgr8, const AxisOptions& opt = {});

} // namespace borestitch
