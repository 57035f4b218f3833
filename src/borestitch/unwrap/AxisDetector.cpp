#include "borestitch/unwrap/AxisDetector.hpp"
#include "borestitch/core/Log.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>

namespace borestitch {

static cv::Mat toGray8(const cv::Mat& m) {
    CV_Assert(m.depth() == CV_8U);
    if (m.channels() == 1) return m;
    cv::Mat g;
    cv::cvtColor(m, g, m.channels() == 4 ? cv::COLOR_BGRA2GRAY : cv::COLOR_BGR2GRAY);
    return g;
}

double circleEdgeScore(const cv::Mat& gray8, cv::Point center, int radius)
{
    if (radius <= 0) return 0.0;
    cv::Mat ring = cv::Mat::zeros(gray8.size(), CV_8U);
    cv::circle(ring, center, radius, cv::Scalar(255), 2);

    cv::Mat edges;
    cv::Canny(gray8, edges, 100, 200);
    cv::bitwise_and(edges, ring, edges);

    const double ratio = double(cv::countNonZero(edges)) / (2.0 * CV_PI * radius);
    return std::min(ratio * 3.0, 1.0);
}

/* Raw Hough circles of all passes, in full-frame coordinates. */
static std::vector<cv::Vec3f> houghCircles(const cv::Mat& processed, const AxisOptions& opt)
{
    const int w = processed.cols, h = processed.rows;
    const double s = std::min(w, h);
    std::vector<cv::Vec3f> all;

    for (const HoughPass& p : opt.passes) {
        cv::Mat img = processed;
        cv::Point2f shift(0.f, 0.f);
        if (p.centreCrop) {
            img = processed(cv::Range(h / 4, 3 * h / 4), cv::Range(w / 4, 3 * w / 4));
            shift = cv::Point2f(float(w / 4), float(h / 4));
        }
        if (img.rows < 8 || img.cols < 8) continue;

        std::vector<cv::Vec3f> found;
        cv::HoughCircles(img, found, cv::HOUGH_GRADIENT, 1, p.minDist, p.param1, p.param2,
                         int(s * p.minRadius), int(s * p.maxRadius));
        for (auto& c : found) {
            c[0] += shift.x;
            c[1] += shift.y;
            all.push_back(c);
        }
    }
    return all;
}

/*
  Candidate scoring:
    position 0.4 - closeness to the frame centre (rejected beyond s/4)
    radius   0.3 - closeness to the middle of the plausible radius band
    edge     0.3 - Canny coverage of the circumference
  Circles touching the border band or outside the radius band are rejected.
*/
std::vector<CircleCandidate> findAxisCandidates(const cv::Mat& bgr8, const AxisOptions& opt)
{
    std::vector<CircleCandidate> out;
    if (bgr8.empty()) return out;

    const cv::Mat gray = toGray8(bgr8);
    cv::Mat processed;
    cv::createCLAHE(opt.claheClipLimit, cv::Size(8, 8))->apply(gray, processed);
    cv::GaussianBlur(processed, processed, cv::Size(3, 3), 1.0);

    const std::vector<cv::Vec3f> raw = houghCircles(processed, opt);
    if (raw.empty()) return out;

    const int w = gray.cols, h = gray.rows;
    const cv::Point2d mid(w / 2, h / 2);
    const double maxDist = std::min(w, h) / 4;
    const double rMin = int(std::min(w, h) * opt.minRadiusShare);
    const double rMax = int(std::min(w, h) * opt.maxRadiusShare);
    const double rOpt = std::max(1.0, double(int((rMin + rMax) / 2)));

    for (const auto& c : raw) {
        const double cx = c[0], cy = c[1], r = c[2];

        const double d = std::hypot(cx - mid.x, cy - mid.y);
        if (d > maxDist) continue;
        double score = 0.4 * std::max(0.0, 1.0 - d / std::max(1.0, maxDist));

        const int m = opt.borderMargin;
        if (cx - r < m || cx + r >= w - m || cy - r < m || cy + r >= h - m) continue;

        if (r < rMin || r > rMax) continue;
        score += 0.3 * std::max(0.0, 1.0 - std::abs(r - rOpt) / rOpt);

        score += 0.3 * circleEdgeScore(gray, cv::Point(int(cx), int(cy)), int(r));

        if (score > opt.minScore) out.push_back({cv::Point2d(cx, cy), r, score});
    }

    std::stable_sort(out.begin(), out.end(),
                     [](const CircleCandidate& a, const CircleCandidate& b) { return a.score > b.score; });
    if (out.size() > opt.maxCandidates) out.resize(opt.maxCandidates);

    logger()->debug("axis: {} circles, {} kept", raw.size(), out.size());
    return out;
}

static double detectionConfidence(const std::vector<CircleCandidate>& c)
{
    if (c.empty()) return 0.0;

    double consistency = 0.5;
    if (c.size() > 1) {
        cv::Point2d mean(0, 0);
        for (const auto& k : c) mean += k.center;
        mean *= 1.0 / double(c.size());

        std::vector<double> dist;
        dist.reserve(c.size());
        double avg = 0.0;
        for (const auto& k : c) {
            dist.push_back(cv::norm(k.center - mean));
            avg += dist.back();
        }
        avg /= double(dist.size());
        double var = 0.0;
        for (double d : dist) var += (d - avg) * (d - avg);
        const double sd = std::sqrt(var / double(dist.size()));
        consistency = 1.0 / (1.0 + sd / 25.0);
    }
    const double countConfidence = std::min(double(c.size()) / 5.0, 1.0);
    return 0.7 * consistency + 0.3 * countConfidence;
}

AxisCenter detectAxis(const cv::Mat& bgr8, const AxisOptions& opt)
{
    AxisCenter out;
    out.center = cv::Point2d(bgr8.cols / 2, bgr8.rows / 2);
    out.confidence = 0.0;

    const std::vector<CircleCandidate> cands = findAxisCandidates(bgr8, opt);
    if (cands.empty()) {
        logger()->warn("axis detection: no plausible circle, using frame centre ({}, {})",
                       out.center.x, out.center.y);
        return out;
    }

    const cv::Point2d mid = out.center;
    const CircleCandidate* best = nullptr;
    double bestD = 0.0;
    for (bool belowOnly : {true, false}) {
        for (const auto& c : cands) {
            if (belowOnly && !(c.center.y > mid.y)) continue;
            const double d = cv::norm(c.center - mid);
            if (!best || d < bestD) { best = &c; bestD = d; }
        }
        if (best) break;
    }

    out.center = cv::Point2d(std::floor(best->center.x), std::floor(best->center.y));
    out.confidence = detectionConfidence(cands);
    logger()->debug("axis at ({}, {}), confidence {:.3f}", out.center.x, out.center.y, out.confidence);
    return out;
}

} // namespace borestitch
