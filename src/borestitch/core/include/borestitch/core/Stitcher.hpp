#pragma once
#include "borestitch/align/MotionPattern.hpp"
#include "borestitch/align/Registration.hpp"
#include "borestitch/compose/Canvas.hpp"
#include "borestitch/core/Config.hpp"
#include "borestitch/core/Frame.hpp"
#include "borestitch/unwrap/AxisDetector.hpp"

#include <opencv2/core.hpp>
#include <stop_token>
#include <vector>

namespace borestitch {

/// Everything one stitch job produced.
struct StitchResult {
    cv::Mat panorama;                          // CV_8UC3
    std::vector<int> offsets;                  // canvas row of every frame
    MotionProfile profile;
    std::vector<PairDiagnostics> pairs;        // consecutive pairs (i, i + 1)
    std::vector<PlacementReport> placements;
    std::vector<double> depthsMm;              // probe depth of every frame
    std::vector<AxisCenter> axes;              // per frame, only when frames were unwrapped
};

/*
  Sequential borescope stitcher:
    - copies the caller's frames into owned BGR matrices;
    - optional deblur and polar unwrap, frame by frame;
    - features of all frames in parallel, then pairwise registration;
    - motion classification decides where every frame lands on the canvas;
    - composition, post-processing and depth annotation.
  A stop request is honoured between frames and between pairs.
*/
class Stitcher {
public:
    /// Throws std::runtime_error if the configuration is out of range.
    explicit Stitcher(const Config& cfg);

    /// Throws InputError for an empty sequence or a malformed frame,
    /// Cancelled when `stop` is requested mid-way.
    StitchResult stitch(const std::vector<Frame>& frames, std::stop_token stop = {}) const;

    const Config& config() const { return cfg_; }

private:
    std::vector<cv::Mat> prepare(std::vector<cv::Mat> frames, StitchResult& res, std::stop_token stop) const;
    std::vector<double> registerSequence(const std::vector<cv::Mat>& frames, StitchResult& res,
                                         std::stop_token stop) const;
    void warnWeakOverlaps(const std::vector<cv::Mat>& frames, const std::vector<int>& offsets) const;

    Config cfg_;
};

} // namespace borestitch
