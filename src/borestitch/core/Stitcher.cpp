#include "borestitch/core/Stitcher.hpp"
#include "borestitch/align/DepthScale.hpp"
#include "borestitch/align/MotionEstimator.hpp"
#include "borestitch/compose/PostProcessor.hpp"
#include "borestitch/core/Errors.hpp"
#include "borestitch/core/Log.hpp"
#include "borestitch/deblur/Deblurrer.hpp"
#include "borestitch/features/FeatureExtractor.hpp"
#include "borestitch/features/FeatureMatcher.hpp"
#include "borestitch/unwrap/PolarUnwrapper.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <variant>

namespace borestitch {

Stitcher::Stitcher(const Config& cfg)
    : cfg_(cfg)
{
    validateConfig(cfg_);
}

static void checkStop(const std::stop_token& stop, const char* stage)
{
    if (stop.stop_requested()) throw Cancelled(std::string("stitch cancelled during ") + stage);
}

/* Optional per-frame stages that change what the frames look like:
   defocus restoration, then polar unwrap around the bore axis. */
std::vector<cv::Mat> Stitcher::prepare(std::vector<cv::Mat> frames, StitchResult& res,
                                       std::stop_token stop) const
{
    if (cfg_.enableDeblur) {
        Deblurrer deblur(deblurOptions(cfg_));
        for (auto& f : frames) {
            checkStop(stop, "deblur");
            f = deblur.process(f);
        }
        logger()->info("deblurred {} frames ({}), last radius {:.2f}", frames.size(),
                       defocusMethodName(cfg_.defocusMethod), deblur.lastEstimate().radius);
    }

    if (cfg_.unwrapFrames) {
        UnwrapSession session;
        if (cfg_.unwrap.calibrationFrames > 1) session.calibrate(frames, cfg_.unwrap);

        res.axes.reserve(frames.size());
        for (auto& f : frames) {
            checkStop(stop, "unwrap");
            UnwrapResult u = unwrap(f, session, cfg_.unwrap);
            res.axes.push_back(u.axis);
            f = u.image;
        }
        logger()->info("unwrapped {} frames, {} axis detections", frames.size(), session.detections());
    }
    return frames;
}

/* Steps:
   1) features of all frames (parallel);
   2) for every consecutive pair: ratio-test matches, then registration with
      its fallbacks;
   3) relative placement per frame, rel[0] = 0. */
std::vector<double> Stitcher::registerSequence(const std::vector<cv::Mat>& frames, StitchResult& res,
                                               std::stop_token stop) const
{
    const std::vector<KeypointSet> kps = extractAll(frames, cfg_.features, cfg_.workerThreads, stop);
    logger()->info("features extracted for {} frames ({})", frames.size(),
                   detectorName(resolveDetectorType(cfg_.features.detector)));

    const MotionOptions& mo = cfg_.motion;
    std::vector<double> rel(frames.size(), 0.0);
    res.pairs.reserve(frames.size() - 1);

    for (std::size_t i = 1; i < frames.size(); ++i) {
        checkStop(stop, "registration");

        const MatchSet matches = matchFeatures(kps[i - 1], kps[i], mo.ratioTest);
        const PairRegistration reg = registerPair(frames[i - 1], frames[i], matches, mo);

        PairDiagnostics d;
        d.index = i - 1;
        d.kind = kindName(reg.result);
        d.matches = matches.size();
        d.confidence = confidence(reg.result);
        d.relativeDy = placementDy(reg.result, mo.invertVertical);
        rel[i] = d.relativeDy;

        if (std::holds_alternative<NoFit>(reg.result)) {
            logger()->warn("pair {}-{}: no usable registration ({} matches), placed with zero offset",
                           i - 1, i, d.matches);
        } else if (std::holds_alternative<TemplateFit>(reg.result)) {
            logger()->warn("pair {}-{}: feature fit failed ({} matches), band correlation dy {:.2f} score {:.3f}",
                           i - 1, i, d.matches, d.relativeDy, d.confidence);
        } else {
            logger()->debug("pair {}-{}: {} dy {:.2f} confidence {:.3f} ({} matches)",
                            i - 1, i, d.kind, d.relativeDy, d.confidence, d.matches);
        }
        res.pairs.push_back(std::move(d));
    }
    return rel;
}

void Stitcher::warnWeakOverlaps(const std::vector<cv::Mat>& frames, const std::vector<int>& offsets) const
{
    for (std::size_t i = 1; i < frames.size(); ++i) {
        const int step = std::abs(offsets[i] - offsets[i - 1]);
        const int overlap = std::min(frames[i - 1].rows, frames[i].rows) - step;
        if (overlap < cfg_.minOverlapPx) {
            logger()->warn("frames {}-{}: overlap {} px below the {} px minimum",
                           i - 1, i, overlap, cfg_.minOverlapPx);
        }
    }
}

StitchResult Stitcher::stitch(const std::vector<Frame>& frames, std::stop_token stop) const
{
    if (frames.empty()) throw InputError("no frames to stitch");

    std::vector<cv::Mat> owned;
    owned.reserve(frames.size());
    for (const Frame& f : frames) owned.push_back(toBgr8(f));

    StitchResult res;
    if (owned.size() == 1) {
        res.panorama = owned.front();
        res.offsets = {0};
        res.profile.pattern = MotionPattern::InsufficientData;
        res.depthsMm = computeDepthPositions(res.offsets, cfg_.depth);
        logger()->info("single frame, returned unchanged");
        return res;
    }

    logger()->info("stitching {} frames{}", owned.size(),
                   cfg_.overlapHintPx > 0 ? fmt::format(", expected overlap {} px", cfg_.overlapHintPx)
                                          : std::string());

    owned = prepare(std::move(owned), res, stop);

    // 1) registration
    const std::vector<double> rel = registerSequence(owned, res, stop);

    // 2) placement
    res.profile = analyzeMotion(rel, cfg_.motion.motionThreshold, cfg_.motion.minSamples);
    res.offsets = resolveCanvasOffsets(cumulativeOffsets(rel), res.profile);
    if (cfg_.motion.constantVelocity)
        res.offsets = smoothConstantMotion(res.offsets, cfg_.motion.motionThreshold);
    logger()->info("motion {}: start {}, average {:.2f} px/frame", patternName(res.profile.pattern),
                   res.profile.motionStart, res.profile.avgMotion);
    warnWeakOverlaps(owned, res.offsets);

    // 3) composition
    std::vector<cv::Size> sizes;
    sizes.reserve(owned.size());
    for (const auto& m : owned) sizes.push_back(m.size());

    CanvasCompositor canvas(sizes, res.offsets, cfg_.compose, cfg_.blend);
    for (std::size_t i = 0; i < owned.size(); ++i) {
        checkStop(stop, "composition");
        canvas.place(i, owned[i]);
    }
    res.placements = canvas.reports();

    const auto skipped = std::count_if(res.placements.begin(), res.placements.end(),
                                       [](const PlacementReport& r) { return r.skipped; });
    if (skipped > 0) logger()->warn("{} of {} frames could not be placed", skipped, owned.size());

    // 4) clean-up and annotation
    res.panorama = postProcess(canvas.finalize(), cfg_.post);
    res.depthsMm = computeDepthPositions(res.offsets, cfg_.depth);

    logger()->info("panorama {}x{}", res.panorama.cols, res.panorama.rows);
    return res;
}

} // namespace borestitch
