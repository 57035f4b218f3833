#include "borestitch/align/DepthScale.hpp"
#include "borestitch/core/Log.hpp"

#include <algorithm>

namespace borestitch {

double mmPerPixel(const std::vector<int>& offsets, const DepthOptions& opt)
{
    const int top = offsets.empty() ? 0 : *std::max_element(offsets.begin(), offsets.end());
    if (top <= 0) {
        logger()->warn("no axial travel, using {} mm/px", opt.fallbackMmPerPixel);
        return opt.fallbackMmPerPixel;
    }
    return (opt.totalPipeLengthMm - opt.initialDepthMm) / double(top);
}

std::vector<double> computeDepthPositions(const std::vector<int>& offsets, const DepthOptions& opt)
{
    std::vector<double> out;
    if (offsets.empty()) return out;

    const double scale = mmPerPixel(offsets, opt);
    out.reserve(offsets.size());
    for (int o : offsets) out.push_back(opt.initialDepthMm + double(o) * scale);

    logger()->debug("depth scale {:.4f} mm/px, {:.1f}..{:.1f} mm", scale,
                    *std::min_element(out.begin(), out.end()),
                    *std::max_element(out.begin(), out.end()));
    return out;
}

} // namespace borestitch
