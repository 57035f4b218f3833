#include "borestitch/align/MotionEstimator.hpp"
#include "borestitch/core/Log.hpp"

#include <opencv2/calib3d.hpp>
#include <algorithm>
#include <cmath>
#include <random>

namespace borestitch {

static void splitPoints(const MatchSet& matches,
                        std::vector<cv::Point2f>& src,
                        std::vector<cv::Point2f>& dst)
{
    src.clear(); dst.clear();
    src.reserve(matches.size());
    dst.reserve(matches.size());
    for (const auto& c : matches) {
        src.push_back(c.a);
        dst.push_back(c.b);
    }
}

std::optional<AffineFit> estimateSimilarity(const MatchSet& matches, const MotionOptions& opt)
{
    if (matches.size() < 2) return std::nullopt;

    std::vector<cv::Point2f> src, dst;
    splitPoints(matches, src, dst);

    std::vector<uchar> mask;
    cv::Mat a23 = cv::estimateAffinePartial2D(src, dst, mask, cv::RANSAC,
                                              opt.reprojThreshold,
                                              opt.affineIterations,
                                              opt.affineConfidence);
    if (a23.empty()) return std::nullopt;

    AffineFit fit;
    fit.transform = Transform2D::fromAffine(a23);
    fit.inliers = cv::countNonZero(mask);
    fit.inlierRatio = mask.empty() ? 0.0 : double(fit.inliers) / double(mask.size());

    const Transform2D& t = fit.transform;
    const double ady = std::abs(t.dy());
    logger()->debug("similarity: dy={:.2f} scale=({:.3f},{:.3f}) inliers={:.2f}",
                    t.dy(), t.scaleX(), t.scaleY(), fit.inlierRatio);

    if (!(ady > opt.minAbsDy && ady < opt.maxAbsDy)) return std::nullopt;
    if (!t.withinScaleGate(opt.scaleLo, opt.scaleHi)) return std::nullopt;
    if (!t.invertible()) return std::nullopt;
    if (!(fit.inlierRatio > opt.minInlierRatio)) return std::nullopt;
    return fit;
}

std::optional<TranslationFit> estimateTranslation(const MatchSet& matches, const MotionOptions& opt)
{
    const std::size_t n = matches.size();
    if (n < 3) return std::nullopt;

    std::mt19937_64 rng(opt.seed);
    std::uniform_int_distribution<std::size_t> pick(0, n - 1);
    const double tol2 = opt.translationTolerance * opt.translationTolerance;

    auto countInliers = [&](const cv::Point2f& t) {
        int k = 0;
        for (const auto& c : matches) {
            const cv::Point2f e = c.a + t - c.b;
            if (double(e.dot(e)) < tol2) ++k;
        }
        return k;
    };

    int bestInliers = 0;
    cv::Point2f best;
    for (int it = 0; it < opt.translationIterations; ++it) {
        const Correspondence& c = matches[pick(rng)];
        const cv::Point2f t = c.b - c.a;
        const int k = countInliers(t);
        if (k > bestInliers) { bestInliers = k; best = t; }
    }

    const double need = std::max(double(opt.translationMinInliers), opt.translationMinShare * double(n));
    if (double(bestInliers) < need) return std::nullopt;

    // refine: mean displacement over the consensus set
    cv::Point2d sum(0, 0);
    int k = 0;
    for (const auto& c : matches) {
        const cv::Point2f e = c.a + best - c.b;
        if (double(e.dot(e)) < tol2) {
            sum += cv::Point2d(c.b - c.a);
            ++k;
        }
    }
    if (k > 0) best = cv::Point2f(float(sum.x / k), float(sum.y / k));

    TranslationFit fit;
    fit.transform = Transform2D::translation(best.x, best.y);
    fit.inliers = bestInliers;
    fit.inlierRatio = double(bestInliers) / double(n);
    logger()->debug("translation: dx={:.2f} dy={:.2f} inliers={:.2f}", best.x, best.y, fit.inlierRatio);
    return fit;
}

static RegistrationResult templateFallback(const cv::Mat& a, const cv::Mat& b, const MotionOptions& opt)
{
    const TemplateMatch tm = matchVerticalOffset(a, b, opt.templ);
    if (tm.ok && tm.confidence >= opt.templateAcceptScore && std::abs(tm.offset) > opt.templateMinOffset) {
        return TemplateFit{tm.offset, tm.confidence, tm.scale};
    }
    if (tm.ok && tm.confidence >= opt.templateAcceptScore) {
        logger()->debug("template: no significant offset ({:.2f}px)", tm.offset);
    } else {
        logger()->warn("template: confidence {:.3f} too low, using zero offset", tm.confidence);
    }
    return NoFit{std::max(0.0, tm.confidence)};
}

PairRegistration registerPair(const cv::Mat& a, const cv::Mat& b,
                              const MatchSet& matches,
                              const MotionOptions& opt)
{
    PairRegistration out;

    if (matches.size() < opt.minMatches) {
        logger()->warn("only {} matches, falling back to band correlation", matches.size());
        out.templateAttempted = true;
        out.result = templateFallback(a, b, opt);
        return out;
    }

    out.ransacAttempted = true;
    if (auto fit = estimateSimilarity(matches, opt)) {
        out.result = *fit;
        return out;
    }
    if (auto fit = estimateTranslation(matches, opt)) {
        out.result = *fit;
        return out;
    }

    logger()->warn("both motion models rejected ({} matches), falling back to band correlation",
                   matches.size());
    out.templateAttempted = true;
    out.result = templateFallback(a, b, opt);
    return out;
}

} // namespace borestitch
