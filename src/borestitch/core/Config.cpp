#include "borestitch/core/Config.hpp"
#include "borestitch/core/Errors.hpp"
#include "borestitch/core/Log.hpp"

#include <opencv2/core/persistence.hpp>

#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

namespace borestitch {

DeblurOptions deblurOptions(const Config& cfg)
{
    DeblurOptions d;
    d.method = cfg.defocusMethod;
    d.lucyRichardsonIterations = cfg.lucyRichardsonIterations;
    d.wienerNoiseRatio = cfg.wienerNoiseRatio;
    return d;
}

static void require(bool ok, const char* field)
{
    if (!ok) throw std::runtime_error(std::string("invalid config value: ") + field);
}

void validateConfig(const Config& cfg)
{
    require(cfg.minOverlapPx >= 0, "min_overlap_px");
    require(cfg.overlapHintPx >= 0, "overlap_hint_px");
    require(cfg.lucyRichardsonIterations >= 1, "lucy_richardson_iterations");
    require(cfg.wienerNoiseRatio > 0.0, "wiener_noise_ratio");

    const FeatureOptions& f = cfg.features;
    require(f.maxKeypoints >= 1 && f.maxKeypoints <= 8000, "features.max_keypoints");
    require(f.claheClipLimit > 0.0, "features.clahe_clip_limit");
    require(f.claheTileGrid >= 1, "features.clahe_tile_grid");

    const MotionOptions& m = cfg.motion;
    require(m.ratioTest > 0.0 && m.ratioTest < 1.0, "motion.ratio_test");
    require(m.minMatches >= 1, "motion.min_matches");
    require(m.reprojThreshold > 0.0, "motion.reproj_threshold");
    require(m.affineIterations >= 1, "motion.affine_iterations");
    require(m.affineConfidence > 0.0 && m.affineConfidence < 1.0, "motion.affine_confidence");
    require(m.minAbsDy >= 0.0 && m.minAbsDy < m.maxAbsDy, "motion.min_abs_dy / max_abs_dy");
    require(m.scaleLo > 0.0 && m.scaleLo < m.scaleHi, "motion.scale_lo / scale_hi");
    require(m.minInlierRatio >= 0.0 && m.minInlierRatio < 1.0, "motion.min_inlier_ratio");
    require(m.translationIterations >= 1, "motion.translation_iterations");
    require(m.translationTolerance > 0.0, "motion.translation_tolerance");
    require(m.translationMinInliers >= 1, "motion.translation_min_inliers");
    require(m.motionThreshold >= 0.0, "motion.motion_threshold");
    require(!m.templ.scales.empty(), "motion.template.scales");
    for (double s : m.templ.scales) require(s > 0.0 && s <= 1.0, "motion.template.scales");
    require(m.templ.bandFraction > 0.0 && m.templ.bandFraction <= 1.0, "motion.template.band_fraction");
    require(m.templ.edgeFraction > 0.0 && m.templ.edgeFraction <= 1.0, "motion.template.edge_fraction");

    const ComposeOptions& c = cfg.compose;
    require(c.marginRows >= 0, "compose.margin_rows");
    require(c.minBlendRows >= 0, "compose.min_blend_rows");
    require(c.transitionRows >= 0, "compose.transition_rows");

    const BlendOptions& b = cfg.blend;
    require(b.curveShare >= 0.0 && b.curveShare <= 1.0, "blend.curve_share");
    require(b.gradientBlur >= 1 && b.gradientBlur % 2 == 1, "blend.gradient_blur");
    require(b.pyramidLevels >= 1, "blend.pyramid_levels");
    require(b.textureKnee > 0.0, "blend.texture_knee");
    require(b.mixLo >= 0.0 && b.mixLo <= b.mixHi && b.mixHi <= 1.0, "blend.mix_lo / mix_hi");

    const PostOptions& p = cfg.post;
    require(p.nearBlack >= 0 && p.nearBlack < 255, "post.near_black");
    require(p.minSeamFraction > 0.0 && p.minSeamFraction <= 1.0, "post.min_seam_fraction");
    require(p.sharpenSigma > 0.0, "post.sharpen_sigma");
    require(p.holeThreshold >= 0, "post.hole_threshold");

    const UnwrapOptions& u = cfg.unwrap;
    require(u.innerRatio >= 1.0, "unwrap.inner_ratio");
    require(u.outerMargin >= 0.0, "unwrap.outer_margin");
    require(u.outputHeight >= 0, "unwrap.output_height");
    require(u.calibrationFrames >= 1, "unwrap.calibration_frames");
    require(!u.axis.passes.empty(), "unwrap.axis.passes");

    const DepthOptions& d = cfg.depth;
    require(d.totalPipeLengthMm >= d.initialDepthMm, "depth.total_pipe_length_mm");
    require(d.fallbackMmPerPixel > 0.0, "depth.fallback_mm_per_pixel");
}

// ---------------------------------------------------------------- reading

/* Numbers and booleans are stored as YAML/JSON numbers. Absent keys keep the default.
   A value the target type cannot hold is an InputError. */
template <typename T>
static void readNum(const cv::FileNode& n, const char* key, T& value)
{
    const cv::FileNode k = n[key];
    if (k.empty() || k.isNone()) return;
    if (!k.isInt() && !k.isReal())
        throw std::runtime_error(std::string("config key '") + key + "' is not a number");

    const double v = k.real();
    bool fits = std::isfinite(v);
    if constexpr (std::is_integral_v<T>) {
        // max() + 1 is a power of two, exact as a double
        fits = fits && v > double(std::numeric_limits<T>::lowest()) - 1.0 &&
               v < double(std::numeric_limits<T>::max()) + 1.0;
    }
    if (!fits)
        throw InputError(std::string("config key '") + key + "' is out of range: " + std::to_string(v));
    value = static_cast<T>(v);
}

static void readBool(const cv::FileNode& n, const char* key, bool& value)
{
    double v = value ? 1.0 : 0.0;
    readNum(n, key, v);
    value = v != 0.0;
}

static std::string readString(const cv::FileNode& n, const char* key, const std::string& def)
{
    const cv::FileNode k = n[key];
    if (k.empty() || k.isNone()) return def;
    if (!k.isString())
        throw std::runtime_error(std::string("config key '") + key + "' is not a string");
    return k.string();
}

static DefocusMethod parseDefocus(const std::string& s)
{
    if (s == "wiener") return DefocusMethod::Wiener;
    if (s == "lucy_richardson") return DefocusMethod::LucyRichardson;
    throw std::runtime_error("unknown defocus_method: " + s);
}

static void readFeatures(const cv::FileNode& n, FeatureOptions& f)
{
    if (n.empty()) return;
    const std::string det = readString(n, "detector", detectorName(f.detector));
    const auto t = detectorFromName(det);
    if (!t) throw std::runtime_error("unknown features.detector: " + det);
    f.detector = *t;
    readNum(n, "max_keypoints", f.maxKeypoints);
    readNum(n, "clahe_clip_limit", f.claheClipLimit);
    readNum(n, "clahe_tile_grid", f.claheTileGrid);
}

static void readTemplate(const cv::FileNode& n, TemplateOptions& t)
{
    if (n.empty()) return;
    const cv::FileNode s = n["scales"];
    if (!s.empty()) {
        if (!s.isSeq()) throw std::runtime_error("config key 'scales' is not a sequence");
        std::vector<double> scales;
        s >> scales;
        t.scales = scales;
    }
    readNum(n, "band_fraction", t.bandFraction);
    readNum(n, "band_max_rows", t.bandMaxRows);
    readNum(n, "retry_below", t.retryBelow);
    readNum(n, "edge_fraction", t.edgeFraction);
    readNum(n, "edge_max_rows", t.edgeMaxRows);
    readNum(n, "edge_min_rows", t.edgeMinRows);
}

static void readMotion(const cv::FileNode& n, MotionOptions& m)
{
    if (n.empty()) return;
    readNum(n, "ratio_test", m.ratioTest);
    readNum(n, "min_matches", m.minMatches);
    readNum(n, "reproj_threshold", m.reprojThreshold);
    readNum(n, "affine_iterations", m.affineIterations);
    readNum(n, "affine_confidence", m.affineConfidence);
    readNum(n, "min_abs_dy", m.minAbsDy);
    readNum(n, "max_abs_dy", m.maxAbsDy);
    readNum(n, "scale_lo", m.scaleLo);
    readNum(n, "scale_hi", m.scaleHi);
    readNum(n, "min_inlier_ratio", m.minInlierRatio);
    readNum(n, "translation_iterations", m.translationIterations);
    readNum(n, "translation_tolerance", m.translationTolerance);
    readNum(n, "translation_min_share", m.translationMinShare);
    readNum(n, "translation_min_inliers", m.translationMinInliers);
    readTemplate(n["template"], m.templ);
    readNum(n, "template_accept_score", m.templateAcceptScore);
    readNum(n, "template_min_offset", m.templateMinOffset);
    readBool(n, "invert_vertical", m.invertVertical);
    readNum(n, "motion_threshold", m.motionThreshold);
    readNum(n, "min_samples", m.minSamples);
    readBool(n, "constant_velocity", m.constantVelocity);
    // 64-bit seed kept as a decimal string; FileStorage integers are 32-bit
    const cv::FileNode seedNode = n["seed"];
    if (seedNode.isInt()) {
        const int seed = int(seedNode);
        if (seed < 0) throw InputError("config key 'seed' is negative: " + std::to_string(seed));
        m.seed = static_cast<std::uint64_t>(seed);
    } else {
        const std::string seed = readString(n, "seed", std::to_string(m.seed));
        try {
            m.seed = std::stoull(seed);
        } catch (const std::logic_error&) {
            throw std::runtime_error("config key 'seed' is not an unsigned integer: " + seed);
        }
    }
}

static void readCompose(const cv::FileNode& n, ComposeOptions& c)
{
    if (n.empty()) return;
    readNum(n, "margin_rows", c.marginRows);
    readNum(n, "min_blend_rows", c.minBlendRows);
    readNum(n, "transition_rows", c.transitionRows);
}

static void readBlend(const cv::FileNode& n, BlendOptions& b)
{
    if (n.empty()) return;
    readBool(n, "match_histograms", b.matchHistograms);
    readBool(n, "gradient_mask", b.gradientMask);
    readNum(n, "curve_share", b.curveShare);
    readNum(n, "gradient_blur", b.gradientBlur);
    readNum(n, "pyramid_levels", b.pyramidLevels);
    readNum(n, "texture_knee", b.textureKnee);
    readNum(n, "mix_lo", b.mixLo);
    readNum(n, "mix_hi", b.mixHi);
    readBool(n, "edge_smoothing", b.edgeSmoothing);
}

static void readPost(const cv::FileNode& n, PostOptions& p)
{
    if (n.empty()) return;
    readBool(n, "crop", p.crop);
    readNum(n, "near_black", p.nearBlack);
    readBool(n, "remove_seams", p.removeSeams);
    readNum(n, "seam_sigma", p.seamSigma);
    readNum(n, "min_seam_fraction", p.minSeamFraction);
    readNum(n, "seam_border", p.seamBorder);
    readBool(n, "sharpen", p.sharpen);
    readNum(n, "sharpen_sigma", p.sharpenSigma);
    readNum(n, "sharpen_amount", p.sharpenAmount);
    readBool(n, "color_balance", p.colorBalance);
    readBool(n, "fill_holes", p.fillHoles);
    readNum(n, "hole_threshold", p.holeThreshold);
}

static void readAxis(const cv::FileNode& n, AxisOptions& a)
{
    if (n.empty()) return;
    readNum(n, "clahe_clip_limit", a.claheClipLimit);
    const cv::FileNode passes = n["passes"];
    if (!passes.empty()) {
        if (!passes.isSeq()) throw std::runtime_error("config key 'passes' is not a sequence");
        std::vector<HoughPass> out;
        for (const auto& p : passes) {
            HoughPass h{0.0, 0.0, 0.0, 0.0, 0.0, false};
            readNum(p, "min_dist", h.minDist);
            readNum(p, "param1", h.param1);
            readNum(p, "param2", h.param2);
            readNum(p, "min_radius", h.minRadius);
            readNum(p, "max_radius", h.maxRadius);
            readBool(p, "centre_crop", h.centreCrop);
            out.push_back(h);
        }
        a.passes = out;
    }
    readNum(n, "border_margin", a.borderMargin);
    readNum(n, "min_radius_share", a.minRadiusShare);
    readNum(n, "max_radius_share", a.maxRadiusShare);
    readNum(n, "min_score", a.minScore);
    readNum(n, "max_candidates", a.maxCandidates);
}

static void readUnwrap(const cv::FileNode& n, UnwrapOptions& u)
{
    if (n.empty()) return;
    readAxis(n["axis"], u.axis);
    readBool(n, "cache_axis", u.cacheAxis);
    readNum(n, "redetect_below", u.redetectBelow);
    readNum(n, "outer_margin", u.outerMargin);
    readNum(n, "inner_ratio", u.innerRatio);
    readNum(n, "output_height", u.outputHeight);
    readBool(n, "rotate180", u.rotate180);
    readNum(n, "calibration_frames", u.calibrationFrames);
}

static void readDepth(const cv::FileNode& n, DepthOptions& d)
{
    if (n.empty()) return;
    readNum(n, "initial_depth_mm", d.initialDepthMm);
    readNum(n, "total_pipe_length_mm", d.totalPipeLengthMm);
    readNum(n, "fallback_mm_per_pixel", d.fallbackMmPerPixel);
}

Config loadConfig(const std::string& path)
{
    cv::FileStorage fs;
    try {
        fs.open(path, cv::FileStorage::READ);
    } catch (const cv::Exception& e) {
        throw std::runtime_error("cannot parse config " + path + ": " + e.what());
    }
    if (!fs.isOpened()) throw std::runtime_error("cannot open config " + path);

    Config cfg;
    const cv::FileNode root = fs.root();
    readNum(root, "overlap_hint_px", cfg.overlapHintPx);
    readNum(root, "min_overlap_px", cfg.minOverlapPx);
    readBool(root, "save_intermediate", cfg.saveIntermediate);
    readBool(root, "enable_deblur", cfg.enableDeblur);
    cfg.defocusMethod = parseDefocus(readString(root, "defocus_method", defocusMethodName(cfg.defocusMethod)));
    readNum(root, "lucy_richardson_iterations", cfg.lucyRichardsonIterations);
    readNum(root, "wiener_noise_ratio", cfg.wienerNoiseRatio);
    readBool(root, "unwrap_frames", cfg.unwrapFrames);
    readNum(root, "worker_threads", cfg.workerThreads);

    readFeatures(root["features"], cfg.features);
    readMotion(root["motion"], cfg.motion);
    readCompose(root["compose"], cfg.compose);
    readBlend(root["blend"], cfg.blend);
    readPost(root["post"], cfg.post);
    readUnwrap(root["unwrap"], cfg.unwrap);
    readDepth(root["depth"], cfg.depth);

    validateConfig(cfg);
    logger()->info("config loaded from {}", path);
    return cfg;
}

// ---------------------------------------------------------------- writing

void saveConfig(const std::string& path, const Config& cfg)
{
    cv::FileStorage fs;
    try {
        fs.open(path, cv::FileStorage::WRITE);
    } catch (const cv::Exception& e) {
        throw std::runtime_error("cannot write config " + path + ": " + e.what());
    }
    if (!fs.isOpened()) throw std::runtime_error("cannot write config " + path);

    fs << "overlap_hint_px" << cfg.overlapHintPx;
    fs << "min_overlap_px" << cfg.minOverlapPx;
    fs << "save_intermediate" << int(cfg.saveIntermediate);
    fs << "enable_deblur" << int(cfg.enableDeblur);
    fs << "defocus_method" << std::string(defocusMethodName(cfg.defocusMethod));
    fs << "lucy_richardson_iterations" << cfg.lucyRichardsonIterations;
    fs << "wiener_noise_ratio" << cfg.wienerNoiseRatio;
    fs << "unwrap_frames" << int(cfg.unwrapFrames);
    fs << "worker_threads" << int(cfg.workerThreads);

    const FeatureOptions& f = cfg.features;
    fs << "features" << "{"
       << "detector" << std::string(detectorName(f.detector))
       << "max_keypoints" << f.maxKeypoints
       << "clahe_clip_limit" << f.claheClipLimit
       << "clahe_tile_grid" << f.claheTileGrid
       << "}";

    const MotionOptions& m = cfg.motion;
    fs << "motion" << "{"
       << "ratio_test" << m.ratioTest
       << "min_matches" << int(m.minMatches)
       << "reproj_threshold" << m.reprojThreshold
       << "affine_iterations" << int(m.affineIterations)
       << "affine_confidence" << m.affineConfidence
       << "min_abs_dy" << m.minAbsDy
       << "max_abs_dy" << m.maxAbsDy
       << "scale_lo" << m.scaleLo
       << "scale_hi" << m.scaleHi
       << "min_inlier_ratio" << m.minInlierRatio
       << "translation_iterations" << m.translationIterations
       << "translation_tolerance" << m.translationTolerance
       << "translation_min_share" << m.translationMinShare
       << "translation_min_inliers" << m.translationMinInliers;
    fs << "template" << "{"
       << "scales" << m.templ.scales
       << "band_fraction" << m.templ.bandFraction
       << "band_max_rows" << m.templ.bandMaxRows
       << "retry_below" << m.templ.retryBelow
       << "edge_fraction" << m.templ.edgeFraction
       << "edge_max_rows" << m.templ.edgeMaxRows
       << "edge_min_rows" << m.templ.edgeMinRows
       << "}";
    fs << "template_accept_score" << m.templateAcceptScore
       << "template_min_offset" << m.templateMinOffset
       << "invert_vertical" << int(m.invertVertical)
       << "motion_threshold" << m.motionThreshold
       << "min_samples" << int(m.minSamples)
       << "constant_velocity" << int(m.constantVelocity)
       << "seed" << std::to_string(m.seed)
       << "}";

    const ComposeOptions& c = cfg.compose;
    fs << "compose" << "{"
       << "margin_rows" << c.marginRows
       << "min_blend_rows" << c.minBlendRows
       << "transition_rows" << c.transitionRows
       << "}";

    const BlendOptions& b = cfg.blend;
    fs << "blend" << "{"
       << "match_histograms" << int(b.matchHistograms)
       << "gradient_mask" << int(b.gradientMask)
       << "curve_share" << b.curveShare
       << "gradient_blur" << b.gradientBlur
       << "pyramid_levels" << b.pyramidLevels
       << "texture_knee" << b.textureKnee
       << "mix_lo" << b.mixLo
       << "mix_hi" << b.mixHi
       << "edge_smoothing" << int(b.edgeSmoothing)
       << "}";

    const PostOptions& p = cfg.post;
    fs << "post" << "{"
       << "crop" << int(p.crop)
       << "near_black" << p.nearBlack
       << "remove_seams" << int(p.removeSeams)
       << "seam_sigma" << p.seamSigma
       << "min_seam_fraction" << p.minSeamFraction
       << "seam_border" << p.seamBorder
       << "sharpen" << int(p.sharpen)
       << "sharpen_sigma" << p.sharpenSigma
       << "sharpen_amount" << p.sharpenAmount
       << "color_balance" << int(p.colorBalance)
       << "fill_holes" << int(p.fillHoles)
       << "hole_threshold" << p.holeThreshold
       << "}";

    const UnwrapOptions& u = cfg.unwrap;
    fs << "unwrap" << "{";
    fs << "axis" << "{"
       << "clahe_clip_limit" << u.axis.claheClipLimit
       << "passes" << "[";
    for (const HoughPass& h : u.axis.passes) {
        fs << "{"
           << "min_dist" << h.minDist
           << "param1" << h.param1
           << "param2" << h.param2
           << "min_radius" << h.minRadius
           << "max_radius" << h.maxRadius
           << "centre_crop" << int(h.centreCrop)
           << "}";
    }
    fs << "]"
       << "border_margin" << u.axis.borderMargin
       << "min_radius_share" << u.axis.minRadiusShare
       << "max_radius_share" << u.axis.maxRadiusShare
       << "min_score" << u.axis.minScore
       << "max_candidates" << int(u.axis.maxCandidates)
       << "}";
    fs << "cache_axis" << int(u.cacheAxis)
       << "redetect_below" << u.redetectBelow
       << "outer_margin" << u.outerMargin
       << "inner_ratio" << u.innerRatio
       << "output_height" << u.outputHeight
       << "rotate180" << int(u.rotate180)
       << "calibration_frames" << int(u.calibrationFrames)
       << "}";

    const DepthOptions& d = cfg.depth;
    fs << "depth" << "{"
       << "initial_depth_mm" << d.initialDepthMm
       << "total_pipe_length_mm" << d.totalPipeLengthMm
       << "fallback_mm_per_pixel" << d.fallbackMmPerPixel
       << "}";

    fs.release();
    logger()->debug("config written to {}", path);
}

} // namespace borestitch
