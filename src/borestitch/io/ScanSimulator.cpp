#include "borestitch/io/ScanSimulator.hpp"
#include "borestitch/unwrap/PolarUnwrapper.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <vector>

namespace borestitch {

namespace {
constexpr double kPI = 3.1415926535897932384626433832795;
} // namespace

ScanSimulator::ScanSimulator()
    : ScanSimulator(Options{}) {}

ScanSimulator::ScanSimulator(const Options& opt)
    : opt_(opt)
{
    if (opt_.frameW <= 0 || opt_.frameH <= 0 || opt_.frames <= 0)
        throw std::invalid_argument("ScanSimulator: frame size and count must be positive");
    const unsigned seed = opt_.seed ? opt_.seed : std::random_device{}();
    rng_.seed(seed);
    ensureMasterReady();

    // a retracting scan starts at the far end of the master
    const double travel = double(master_.rows - opt_.frameH);
    y_ = opt_.step < 0 ? travel : 0.0;
}

void ScanSimulator::ensureMasterReady()
{
    // rows the window travels, plus room for the jitter
    const int travel = int(std::ceil(std::abs(opt_.step) * (opt_.frames - 1) +
                                     6.0 * opt_.jitterSigma * std::sqrt(double(opt_.frames)))) + 2;
    const int needH = opt_.frameH + travel;

    if (!opt_.masterPath.empty()) {
        cv::Mat m = cv::imread(opt_.masterPath, cv::IMREAD_COLOR);
        if (m.empty())
            throw std::runtime_error("ScanSimulator: failed to load master image: " + opt_.masterPath);
        if (m.cols < opt_.frameW || m.rows < needH)
            throw std::runtime_error("ScanSimulator: master image " + opt_.masterPath + " is too small for the scan");
        master_ = m.colRange(0, opt_.frameW).clone();
        return;
    }

    master_ = makePattern(opt_.frameW, needH, opt_.pattern);
}

/* Pipe-wall-like texture: blurred noise with scattered blobs and scratches,
   tinted so the three channels differ. */
cv::Mat ScanSimulator::makePattern(int w, int h, const std::string& pat)
{
    cv::RNG rng(opt_.seed ? opt_.seed : 1);
    cv::Mat base(h, w, CV_8UC1);
    rng.fill(base, cv::RNG::NORMAL, 128, 40);
    cv::GaussianBlur(base, base, {0, 0}, 2.0);

    auto draw_blobs = [&](int count) {
        for (int i = 0; i < count; ++i) {
            const cv::Point c(rng.uniform(0, w), rng.uniform(0, h));
            const cv::Size ax(rng.uniform(3, 18), rng.uniform(3, 18));
            cv::ellipse(base, c, ax, rng.uniform(0.0, 180.0), 0, 360,
                        cv::Scalar(rng.uniform(20, 235)), cv::FILLED, cv::LINE_AA);
        }
    };
    auto draw_scratches = [&](int count) {
        for (int i = 0; i < count; ++i) {
            const cv::Point a(rng.uniform(0, w), rng.uniform(0, h));
            const cv::Point b(a.x + rng.uniform(-60, 60), a.y + rng.uniform(-60, 60));
            cv::line(base, a, b, cv::Scalar(rng.uniform(0, 60)), rng.uniform(1, 3), cv::LINE_AA);
        }
    };
    auto draw_grid = [&](int step, int val) {
        for (int y = 0; y < h; y += step) cv::line(base, {0, y}, {w - 1, y}, cv::Scalar(val), 1, cv::LINE_AA);
        for (int x = 0; x < w; x += step) cv::line(base, {x, 0}, {x, h - 1}, cv::Scalar(val), 1, cv::LINE_AA);
    };
    auto draw_rings = [&]() {
        for (int y = 60; y < h; y += 160) {
            for (int r = 10; r < 50; r += 12) cv::circle(base, {w / 2, y}, r, cv::Scalar(220), 2, cv::LINE_AA);
        }
    };
    auto draw_checker = [&]() {
        const int cs = 48;
        for (int y = 0; y < h; y += cs) {
            for (int x = 0; x < w; x += cs) {
                if (((x / cs) + (y / cs)) & 1)
                    cv::rectangle(base, {x, y}, {std::min(x + cs, w) - 1, std::min(y + cs, h) - 1},
                                  cv::Scalar(200), cv::FILLED);
            }
        }
    };

    const int density = std::max(1, w * h / 4000);
    if (pat == "grid") {
        draw_grid(96, 190);
        draw_blobs(density / 2);
    } else if (pat == "rings") {
        draw_rings();
        draw_blobs(density / 2);
    } else if (pat == "checker") {
        draw_checker();
        draw_blobs(density / 4);
    } else { // "texture" (default)
        draw_blobs(density);
        draw_scratches(density / 3);
    }
    cv::GaussianBlur(base, base, {0, 0}, 0.8);

    std::vector<cv::Mat> ch(3);
    base.convertTo(ch[0], CV_8U, 0.75, 20);
    base.convertTo(ch[1], CV_8U, 0.90, 10);
    base.convertTo(ch[2], CV_8U, 1.00, 0);
    cv::Mat bgr;
    cv::merge(ch, bgr);
    return bgr;
}

/* Paint the strip as the annulus a forward-looking camera would see:
   strip width is the outer circumference, inner radius half the outer one. */
cv::Mat ScanSimulator::toBoreView(const cv::Mat& strip) const
{
    const double outer = std::floor(strip.cols / (2.0 * kPI));
    const double inner = std::floor(outer / 2.0);
    const int side = int(2.0 * outer) + 2 * opt_.borePadding;
    const cv::Point2d center(side / 2, side / 2);
    return rewrap(strip, center, outer, inner, cv::Size(side, side), true);
}

std::optional<cv::Mat> ScanSimulator::nextImage()
{
    if (master_.empty() || idx_ >= opt_.frames) return std::nullopt;

    const int maxY = master_.rows - opt_.frameH;
    const int y = std::clamp(int(std::lround(y_)), 0, maxY);
    lastY_ = y;
    cv::Mat patch = master_(cv::Rect(0, y, opt_.frameW, opt_.frameH)).clone();

    // slow brightness modulation
    const double flick = 1.0 + opt_.flickerAmp * std::sin(2.0 * kPI * 0.35 * idx_);
    if (std::abs(flick - 1.0) > 1e-3) patch.convertTo(patch, CV_8U, flick);

    if (opt_.boreView) patch = toBoreView(patch);

    ++idx_;
    y_ += opt_.step + (opt_.jitterSigma > 0 ? opt_.jitterSigma * gauss_(rng_) : 0.0);
    return patch;
}

std::optional<Frame> ScanSimulator::next()
{
    std::optional<cv::Mat> img = nextImage();
    if (!img) return std::nullopt;
    scratch_ = *img;
    return frameView(scratch_);
}

} // namespace borestitch
