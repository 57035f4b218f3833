#pragma once
#include "borestitch/core/Frame.hpp"

#include <opencv2/core.hpp>
#include <optional>
#include <random>
#include <string>

namespace borestitch {

/**
 * Synthetic axial scan: a window slides down a master texture by a fixed
 * step per frame, as an unwrapped borescope view would while the probe
 * advances. The master comes from a file or is generated.
 *
 * Supports: jitter of the step, brightness flicker, and an optional
 * circular bore view (the window painted as an annulus around the centre).
 */
class ScanSimulator {
public:
    struct Options {
        int    frameW = 400, frameH = 300;   // unwrapped window size
        int    frames = 6;
        double step = 20.0;                  // px per frame, > 0 moves the content up
        double jitterSigma = 0.0;            // RMS of the per-frame step noise (px)
        double flickerAmp  = 0.0;            // relative brightness modulation (0..1)
        unsigned seed = 1;                   // RNG seed (0 = random)

        std::string masterPath{};            // load this image as the master if set
        std::string pattern = "texture";     // "texture", "grid", "rings", "checker"

        bool   boreView = false;             // emit circular frames instead of strips
        int    borePadding = 8;              // px between the annulus and the frame edge
    };

    explicit ScanSimulator(const Options& opt);
    ScanSimulator();

    /// Next frame as an owned CV_8UC3 image, nullopt after opt.frames frames.
    std::optional<cv::Mat> nextImage();

    /// Same frame as a view; valid until the next call.
    std::optional<Frame> next();

    /// Top row of the window in the master for the last frame.
    double lastPosition() const { return lastY_; }

    const cv::Mat& master() const { return master_; }

private:
    Options opt_;
    cv::Mat master_;                  // CV_8UC3
    cv::Mat scratch_;

    int    idx_ = 0;
    double y_ = 0.0;
    double lastY_ = 0.0;
    std::mt19937 rng_;
    std::normal_distribution<double> gauss_{0.0, 1.0};

    void ensureMasterReady();
    cv::Mat makePattern(int w, int h, const std::string& pat);
    cv::Mat toBoreView(const cv::Mat& strip) const;
};

} // namespace borestitch
