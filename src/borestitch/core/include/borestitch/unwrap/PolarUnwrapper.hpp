#pragma once
#include "borestitch/unwrap/AxisDetector.hpp"

#include <opencv2/core.hpp>
#include <cstddef>
#include <optional>
#include <vector>

namespace borestitch {

struct UnwrapOptions {
    AxisOptions axis;
    bool   cacheAxis       = true;
    double redetectBelow   = 0.5;   // cached axis weaker than this is re-detected
    double outerMargin     = 0.0;   // px kept free between the annulus and the frame edge
    double innerRatio      = 2.0;   // inner radius = outer / innerRatio
    int    outputHeight    = 0;     // 0 -> outer - inner rows
    bool   rotate180       = true;
    std::size_t calibrationFrames = 10;
};

struct UnwrapResult {
    cv::Mat    image;       // rows = radius (inner -> outer), cols = angle
    AxisCenter axis;
    double     outer{0.0};
    double     inner{0.0};
};

/*
  Axis cache for consecutive frames of one bore.

  axisFor() re-runs detection when nothing is cached, the cached axis is
  weaker than redetectBelow, or caching is off. After calibrate() the
  averaged axis is kept until reset().
*/
class UnwrapSession {
public:
    UnwrapSession() = default;

    AxisCenter axisFor(const cv::Mat& frame, const UnwrapOptions& opt);

    /// Average of the axes detected on the first n frames (n = 0 -> opt.calibrationFrames).
    AxisCenter calibrate(const std::vector<cv::Mat>& frames, const UnwrapOptions& opt, std::size_t n = 0);

    void reset();

    std::optional<AxisCenter> cached() const { return cached_; }
    bool calibrated() const { return locked_; }
    std::size_t detections() const { return detections_; }

private:
    std::optional<AxisCenter> cached_;
    bool        locked_{false};
    std::size_t detections_{0};
};

/// Annulus geometry for a frame of `size` around `center`.
void annulusRadii(cv::Size size, cv::Point2d center, const UnwrapOptions& opt,
                  double& outer, double& inner);

/**
 * Resample the annulus around `axis` into a rectangle: width ceil(2*pi*outer),
 * row v at radius inner + v/H*(outer - inner), column u at angle 2*pi*u/W,
 * bilinear. Optionally rotated by 180 degrees. Deterministic.
 * Throws InputError when the frame is too small to hold an annulus.
 */
UnwrapResult unwrapAround(const cv::Mat& frame, const AxisCenter& axis, const UnwrapOptions& opt = {});

/// Unwrap with the session's axis (detected or cached).
UnwrapResult unwrap(const cv::Mat& frame, UnwrapSession& session, const UnwrapOptions& opt = {});

/**
 * Inverse mapping of unwrapAround: paint the rectangle back into a frame of
 * `frameSize`. Pixels outside the annulus are black.
 */
cv::Mat rewrap(const cv::Mat& unwrapped, cv::Point2d center, double outer, double inner,
               cv::Size frameSize, bool rotated180 = true);

} // namespace borestitch
