#pragma once
#include "borestitch/align/Transform.hpp"

#include <cstddef>
#include <string>
#include <variant>

namespace borestitch {

/// Similarity fit that passed the plausibility gate.
struct AffineFit {
    Transform2D transform;
    double inlierRatio{0.0};
    int    inliers{0};
};

/// Translation-only RANSAC fit.
struct TranslationFit {
    Transform2D transform;
    double inlierRatio{0.0};
    int    inliers{0};
};

/// Vertical offset recovered by band correlation (position in B - position in A).
struct TemplateFit {
    double dy{0.0};
    double score{0.0};  // normalised cross-correlation peak
    double scale{1.0};  // pyramid scale the peak was found at
};

/// Nothing usable: the pair is placed with zero relative offset.
struct NoFit {
    double bestScore{0.0};
};

using RegistrationResult = std::variant<AffineFit, TranslationFit, TemplateFit, NoFit>;

/// Raw vertical displacement of the A -> B fit (0 for NoFit).
double rawDy(const RegistrationResult& r);

/// Relative vertical canvas placement of B with respect to A.
/// With invertVertical the raw displacement is negated.
double placementDy(const RegistrationResult& r, bool invertVertical = true);

/// Inlier ratio or correlation score, depending on the alternative.
double confidence(const RegistrationResult& r);

const char* kindName(const RegistrationResult& r);

/// One line per consecutive pair, reported in StitchResult.
struct PairDiagnostics {
    std::size_t index{0};      // pair (index, index + 1)
    std::string kind;
    std::size_t matches{0};
    double confidence{0.0};
    double relativeDy{0.0};    // after sign correction
};

} // namespace borestitch
