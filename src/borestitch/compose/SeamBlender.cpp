#include "borestitch/compose/SeamBlender.hpp"
#include "borestitch/core/Log.hpp"

#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <array>
#include <vector>

namespace borestitch {

/* Normalised cumulative histogram of one 8-bit channel, in [0..255]. */
static std::array<double, 256> cdf256(const cv::Mat& ch8) {
    std::array<double, 256> h{};
    for (int y = 0; y < ch8.rows; ++y) {
        const uchar* p = ch8.ptr<uchar>(y);
        for (int x = 0; x < ch8.cols; ++x) h[p[x]] += 1.0;
    }
    double acc = 0.0;
    for (double& v : h) { acc += v; v = acc; }
    if (acc > 0.0) for (double& v : h) v = 255.0 * v / acc;
    return h;
}

cv::Mat matchHistograms(const cv::Mat& src8, const cv::Mat& ref8)
{
    CV_Assert(src8.depth() == CV_8U && ref8.depth() == CV_8U);
    CV_Assert(src8.channels() == ref8.channels());
    if (src8.empty() || ref8.empty()) return src8.clone();

    std::vector<cv::Mat> sc, rc;
    cv::split(src8, sc);
    cv::split(ref8, rc);

    for (std::size_t c = 0; c < sc.size(); ++c) {
        const auto cs = cdf256(sc[c]);
        const auto cr = cdf256(rc[c]);

        cv::Mat lut(1, 256, CV_8U);
        for (int v = 0; v < 256; ++v) {
            // invert the reference CDF at the source quantile (linear between levels)
            const double target = cs[v];
            const auto it = std::lower_bound(cr.begin(), cr.end(), target);
            double level;
            if (it == cr.begin()) {
                level = 0.0;
            } else if (it == cr.end()) {
                level = 255.0;
            } else {
                const int r = int(it - cr.begin());
                const double span = cr[r] - cr[r - 1];
                level = (span > 1e-12) ? (r - 1) + (target - cr[r - 1]) / span : double(r);
            }
            lut.at<uchar>(0, v) = cv::saturate_cast<uchar>(level);
        }
        cv::LUT(sc[c], lut, sc[c]);
    }

    cv::Mat out;
    cv::merge(sc, out);
    return out;
}

cv::Mat smoothstepWeights(int rows, bool existingOnTop)
{
    cv::Mat w(std::max(rows, 0), 1, CV_32F);
    for (int y = 0; y < rows; ++y) {
        const float t = rows > 1 ? float(y) / float(rows - 1) : 0.5f;
        const float s = t * t * (3.f - 2.f * t);
        w.at<float>(y, 0) = existingOnTop ? 1.f - s : s;
    }
    return w;
}

static cv::Mat gradientMagnitude(const cv::Mat& img) {
    cv::Mat g, f;
    if (img.channels() == 3) cv::cvtColor(img, g, cv::COLOR_BGR2GRAY);
    else g = img;
    g.convertTo(f, CV_32F);

    cv::Mat gx, gy, mag;
    cv::Sobel(f, gx, CV_32F, 1, 0, 3);
    cv::Sobel(f, gy, CV_32F, 0, 1, 3);
    cv::magnitude(gx, gy, mag);
    return mag;
}

double textureScore(const cv::Mat& img) {
    if (img.empty()) return 0.0;
    return cv::mean(gradientMagnitude(img))[0];
}

static cv::Mat oneMinus(const cv::Mat& w) {
    cv::Mat inv;
    cv::subtract(cv::Scalar::all(1.0), w, inv);
    return inv;
}

/* Laplacian pyramid blend: out = Σ lapA·w + lapB·(1 - w) per level. */
static cv::Mat pyramidBlend(const cv::Mat& a, const cv::Mat& b, const cv::Mat& w3, int levels)
{
    int L = std::max(1, levels);
    while (L > 1 && (std::min(a.rows, a.cols) >> (L - 1)) < 2) --L;

    std::vector<cv::Mat> ga{a}, gb{b}, gw{w3};
    for (int l = 1; l < L; ++l) {
        cv::Mat da, db, dw;
        cv::pyrDown(ga.back(), da);
        cv::pyrDown(gb.back(), db);
        cv::pyrDown(gw.back(), dw);
        ga.push_back(da); gb.push_back(db); gw.push_back(dw);
    }

    cv::Mat out = ga[L - 1].mul(gw[L - 1]) + gb[L - 1].mul(oneMinus(gw[L - 1]));
    for (int l = L - 2; l >= 0; --l) {
        const cv::Size sz = ga[l].size();
        cv::Mat upA, upB, up;
        cv::pyrUp(ga[l + 1], upA, sz);
        cv::pyrUp(gb[l + 1], upB, sz);
        cv::pyrUp(out, up, sz);

        const cv::Mat lapA = ga[l] - upA;
        const cv::Mat lapB = gb[l] - upB;
        out = up + lapA.mul(gw[l]) + lapB.mul(oneMinus(gw[l]));
    }
    return out;
}

/*
  Band blend.

  Steps:
    1) Promote both bands to float; optionally histogram-match incoming to existing.
    2) Weight of the existing band: smoothstep across the rows, mixed with a
       blurred "existing has the stronger gradient" mask.
    3) Two estimates: Laplacian pyramid and plain weighted sum.
    4) Mix them by texture: busy bands lean on the pyramid estimate.
    5) Optional light bilateral pass, clip to [0, 255], back to input type.
*/
BlendOutcome blendBand(const cv::Mat& existing, const cv::Mat& incoming,
                       const BlendOptions& opt, bool existingOnTop)
{
    BlendOutcome out;
    const bool typeOk = existing.type() == CV_8UC3 || existing.type() == CV_32FC3;
    if (existing.empty() || existing.size() != incoming.size() ||
        existing.type() != incoming.type() || !typeOk) {
        logger()->warn("blend skipped: band {}x{} vs {}x{}", existing.cols, existing.rows,
                       incoming.cols, incoming.rows);
        out.skipped = true;
        out.band = incoming.clone();
        return out;
    }

    const int outType = existing.type();
    cv::Mat E, I;
    existing.convertTo(E, CV_32F);
    incoming.convertTo(I, CV_32F);

    if (opt.matchHistograms) {
        cv::Mat e8, i8;
        E.convertTo(e8, CV_8U);
        I.convertTo(i8, CV_8U);
        matchHistograms(i8, e8).convertTo(I, CV_32F);
    }

    // existing-side weight, rows x cols
    cv::Mat w;
    cv::repeat(smoothstepWeights(E.rows, existingOnTop), 1, E.cols, w);
    if (opt.gradientMask) {
        cv::Mat pref8, pref;
        cv::compare(gradientMagnitude(E), gradientMagnitude(I), pref8, cv::CMP_GT);
        pref8.convertTo(pref, CV_32F, 1.0 / 255.0);
        const int k = std::max(1, opt.gradientBlur | 1);
        cv::GaussianBlur(pref, pref, cv::Size(k, k), 0);
        cv::addWeighted(w, opt.curveShare, pref, 1.0 - opt.curveShare, 0.0, w);
        cv::max(w, 0.0, w);
        cv::min(w, 1.0, w);
    }
    cv::Mat w3;
    cv::merge(std::vector<cv::Mat>{w, w, w}, w3);

    const cv::Mat pyr = pyramidBlend(E, I, w3, opt.pyramidLevels);
    const cv::Mat lin = E.mul(w3) + I.mul(oneMinus(w3));

    out.texture = 0.5 * (textureScore(E) + textureScore(I));
    const double denom = out.texture + opt.textureKnee;
    const double share = denom > 0.0 ? out.texture / denom : opt.mixLo;
    out.pyramidShare = std::clamp(share, opt.mixLo, opt.mixHi);

    cv::Mat mixed;
    cv::addWeighted(pyr, out.pyramidShare, lin, 1.0 - out.pyramidShare, 0.0, mixed);

    if (opt.edgeSmoothing) {
        cv::Mat filtered;
        cv::bilateralFilter(mixed, filtered, 5, 35, 35);
        cv::addWeighted(mixed, 0.7, filtered, 0.3, 0.0, mixed);
    }

    cv::max(mixed, 0.0, mixed);
    cv::min(mixed, 255.0, mixed);
    mixed.convertTo(out.band, outType);

    logger()->debug("blend {} rows: texture={:.2f} pyramid share={:.2f}",
                    E.rows, out.texture, out.pyramidShare);
    return out;
}

} // namespace borestitch
