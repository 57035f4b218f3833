#include "borestitch/align/MotionPattern.hpp"

#include <algorithm>
#include <cmath>

namespace borestitch {

const char* patternName(MotionPattern p) {
    switch (p) {
        case MotionPattern::Static:           return "static";
        case MotionPattern::Penetrating:      return "static_then_penetrating";
        case MotionPattern::Retracting:       return "static_then_retracting";
        case MotionPattern::Mixed:            return "mixed";
        case MotionPattern::InsufficientData:
        default:                              return "insufficient_data";
    }
}

MotionProfile analyzeMotion(const std::vector<double>& rel, double threshold, std::size_t minSamples)
{
    MotionProfile p;
    const std::size_t n = rel.size();
    if (n < minSamples) {
        p.pattern = MotionPattern::InsufficientData;
        return p;
    }

    std::size_t start = n;
    for (std::size_t i = 0; i < n; ++i) {
        if (std::abs(rel[i]) > threshold) { start = i; break; }
    }

    p.motionStart = start;
    p.staticFrames = start;
    p.motionFrames = n - start;
    if (start == n) {
        p.pattern = MotionPattern::Static;
        return p;
    }

    double sum = 0.0;
    for (std::size_t i = start; i < n; ++i) sum += rel[i];
    p.avgMotion = sum / double(n - start);

    if (p.avgMotion > threshold)       p.pattern = MotionPattern::Penetrating;
    else if (p.avgMotion < -threshold) p.pattern = MotionPattern::Retracting;
    else                               p.pattern = MotionPattern::Mixed;
    return p;
}

std::vector<double> cumulativeOffsets(const std::vector<double>& rel)
{
    std::vector<double> cum(rel.size());
    double acc = 0.0;
    for (std::size_t i = 0; i < rel.size(); ++i) {
        acc += rel[i];
        cum[i] = acc;
    }
    return cum;
}

std::vector<int> resolveCanvasOffsets(const std::vector<double>& cumulative, const MotionProfile& profile)
{
    std::vector<int> out(cumulative.size(), 0);
    if (cumulative.empty() || profile.pattern == MotionPattern::Static) return out;

    const auto [lo, hi] = std::minmax_element(cumulative.begin(), cumulative.end());
    for (std::size_t i = 0; i < cumulative.size(); ++i) {
        const double v = (profile.pattern == MotionPattern::Retracting) ? (*hi - cumulative[i])
                                                                        : (cumulative[i] - *lo);
        out[i] = int(std::lround(v));
    }
    return out;
}

std::vector<int> smoothConstantMotion(const std::vector<int>& offsets, double staticThreshold)
{
    if (offsets.size() <= 2) return offsets;

    std::vector<int> deltas(offsets.size() - 1);
    for (std::size_t i = 1; i < offsets.size(); ++i) deltas[i - 1] = offsets[i] - offsets[i - 1];

    std::size_t start = deltas.size();
    for (std::size_t i = 0; i < deltas.size(); ++i) {
        if (std::abs(deltas[i]) >= staticThreshold) { start = i; break; }
    }
    if (start == deltas.size()) return offsets;

    std::vector<int> moving(deltas.begin() + std::ptrdiff_t(start), deltas.end());
    std::sort(moving.begin(), moving.end());
    const std::size_t m = moving.size();
    const double median = (m % 2) ? moving[m / 2] : 0.5 * (moving[m / 2 - 1] + moving[m / 2]);

    std::vector<int> out(offsets);
    for (std::size_t i = start + 1; i < out.size(); ++i) {
        out[i] = int(std::lround(out[start] + median * double(i - start)));
    }

    const int lo = *std::min_element(out.begin(), out.end());
    if (lo < 0) {
        for (int& v : out) v -= lo;
    }
    return out;
}

} // namespace borestitch
