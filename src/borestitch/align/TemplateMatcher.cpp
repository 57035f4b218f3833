#include "borestitch/align/TemplateMatcher.hpp"
#include "borestitch/core/Log.hpp"

#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>

namespace borestitch {

/* Grayscale + histogram equalisation + 3x3 Gaussian. */
static cv::Mat prepare(const cv::Mat& m) {
    CV_Assert(m.depth() == CV_8U);
    cv::Mat g;
    if (m.channels() == 1) g = m.clone();
    else cv::cvtColor(m, g, m.channels() == 4 ? cv::COLOR_BGRA2GRAY : cv::COLOR_BGR2GRAY);
    cv::equalizeHist(g, g);
    cv::GaussianBlur(g, g, cv::Size(3, 3), 0);
    return g;
}

/* Parabolic peak correction from f(-1), f(0), f(+1), clamped to [-1, 1]. */
static double subpixelOffset(double fm1, double f0, double fp1) {
    const double denom = fm1 - 2.0 * f0 + fp1;
    if (std::abs(denom) < 1e-12) return 0.0;
    const double delta = 0.5 * (fm1 - fp1) / denom;
    if (!std::isfinite(delta)) return 0.0;
    return std::clamp(delta, -1.0, 1.0);
}

/*
  Search the band a(rows [y0, y0+h)) over all of b.
  Returns the offset (row in b - y0) and the normalised correlation peak.
  Band and search must have the same width; b must be at least as tall.
*/
static bool searchBand(const cv::Mat& a, const cv::Mat& b, int y0, int h,
                       double& offset, double& score)
{
    if (h <= 0 || y0 < 0 || y0 + h > a.rows) return false;
    if (b.rows < h || b.cols < a.cols) return false;

    cv::Mat res;
    cv::matchTemplate(b, a.rowRange(y0, y0 + h), res, cv::TM_CCOEFF_NORMED);

    double maxVal = 0.0;
    cv::Point maxLoc;
    cv::minMaxLoc(res, nullptr, &maxVal, nullptr, &maxLoc);
    if (!std::isfinite(maxVal)) return false;

    double peak = maxLoc.y;
    if (maxLoc.y > 0 && maxLoc.y + 1 < res.rows) {
        peak += subpixelOffset(res.at<float>(maxLoc.y - 1, maxLoc.x),
                               res.at<float>(maxLoc.y, maxLoc.x),
                               res.at<float>(maxLoc.y + 1, maxLoc.x));
    }
    offset = peak - y0;
    score = maxVal;
    return true;
}

/*
  Band correlation fallback.

  Steps:
    1) For each scale: resize both frames, take the central band of A
       (bandFraction of the height, at most bandMaxRows) and correlate it
       against all of B. Keep the strongest peak, offset rescaled to full size.
    2) If the best peak is still below retryBelow, correlate the top and the
       bottom edge bands of A at full resolution and keep any improvement.
*/
TemplateMatch matchVerticalOffset(const cv::Mat& a, const cv::Mat& b, const TemplateOptions& opt)
{
    TemplateMatch best;
    if (a.empty() || b.empty()) return best;

    const cv::Mat ga = prepare(a);
    const cv::Mat gb = prepare(b);

    for (double s : opt.scales) {
        if (s <= 0.0) continue;
        cv::Mat sa = ga, sb = gb;
        if (s != 1.0) {
            cv::resize(ga, sa, cv::Size(), s, s, cv::INTER_AREA);
            cv::resize(gb, sb, cv::Size(), s, s, cv::INTER_AREA);
        }
        const int h = std::min(int(sa.rows * opt.bandFraction), opt.bandMaxRows);
        const int y0 = std::max(0, (sa.rows - h) / 2);

        double off = 0.0, score = 0.0;
        if (!searchBand(sa, sb, y0, h, off, score)) continue;

        logger()->debug("template scale={:.2f}: offset={:.2f} score={:.3f}", s, off / s, score);
        if (score > best.confidence) {
            best.offset = off / s;
            best.confidence = score;
            best.scale = s;
            best.ok = true;
        }
    }

    if (best.confidence < opt.retryBelow) {
        const int h = std::min(int(ga.rows * opt.edgeFraction), opt.edgeMaxRows);
        if (h > opt.edgeMinRows) {
            for (int y0 : {0, std::max(0, ga.rows - h)}) {
                double off = 0.0, score = 0.0;
                if (!searchBand(ga, gb, y0, h, off, score)) continue;
                if (score > best.confidence) {
                    logger()->debug("template edge band y0={}: offset={:.2f} score={:.3f}", y0, off, score);
                    best.offset = off;
                    best.confidence = score;
                    best.scale = 1.0;
                    best.ok = true;
                }
            }
        }
    }
    return best;
}

} // namespace borestitch
