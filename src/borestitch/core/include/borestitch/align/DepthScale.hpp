#pragma once
#include <vector>

namespace borestitch {

struct DepthOptions {
    double initialDepthMm      = 10.0;    // probe depth at the first frame
    double totalPipeLengthMm   = 910.0;   // depth reached at the largest offset
    double fallbackMmPerPixel  = 0.1;     // used when all offsets are 0
};

/// mm per canvas row implied by the offsets and the bore length.
double mmPerPixel(const std::vector<int>& offsets, const DepthOptions& opt = {});

/// Depth of every frame: initialDepthMm + offset * mmPerPixel.
std::vector<double> computeDepthPositions(const std::vector<int>& offsets, const DepthOptions& opt = {});

} // namespace borestitch
