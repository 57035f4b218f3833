#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

namespace borestitch {

enum class MotionPattern : std::uint8_t {
    Static = 0,
    Penetrating,
    Retracting,
    Mixed,
    InsufficientData
};

/// Classification of a whole sequence from its relative offsets.
struct MotionProfile {
    MotionPattern pattern{MotionPattern::InsufficientData};
    std::size_t motionStart{0};    // first index with |rel| > threshold (N if none)
    double avgMotion{0.0};         // mean of rel[motionStart..]
    std::size_t staticFrames{0};
    std::size_t motionFrames{0};

    bool operator==(const MotionProfile&) const = default;
};

/// "static", "static_then_penetrating", "static_then_retracting", "mixed",
/// "insufficient_data".
const char* patternName(MotionPattern p);

/**
 * Classify relative offsets (rel[0] == 0 for the first frame).
 * Fewer than minSamples values -> InsufficientData. Pure.
 */
MotionProfile analyzeMotion(const std::vector<double>& rel,
                            double threshold = 5.0,
                            std::size_t minSamples = 5);

/// Prefix sum of the relative offsets; cum[0] = rel[0].
std::vector<double> cumulativeOffsets(const std::vector<double>& rel);

/**
 * Non-negative canvas rows from cumulative offsets.
 *   Static      -> all 0
 *   Retracting  -> round(max - c), the last frame anchors the top
 *   otherwise   -> round(c - min), the first frame anchors the top
 */
std::vector<int> resolveCanvasOffsets(const std::vector<double>& cumulative,
                                      const MotionProfile& profile);

/**
 * Constant probe speed model: from the first step whose magnitude reaches
 * staticThreshold, every step is replaced by the median step. Offsets that
 * never move are returned unchanged. Output is shifted back to be >= 0.
 */
std::vector<int> smoothConstantMotion(const std::vector<int>& offsets,
                                      double staticThreshold = 5.0);

} // namespace borestitch
