#include "borestitch/align/DepthScale.hpp"
#include "borestitch/align/MotionPattern.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <vector>

using namespace borestitch;

TEST(MotionPattern, TooFewSamplesIsInsufficient) {
    const MotionProfile p = analyzeMotion({0, 20, 20, 20});
    EXPECT_EQ(p.pattern, MotionPattern::InsufficientData);
    EXPECT_STREQ(patternName(p.pattern), "insufficient_data");
}

TEST(MotionPattern, SmallStepsAreStatic) {
    const std::vector<double> rel{0, 1, -2, 4.9, -5, 0.5};
    const MotionProfile p = analyzeMotion(rel);
    EXPECT_EQ(p.pattern, MotionPattern::Static);
    EXPECT_EQ(p.motionStart, rel.size());

    const auto off = resolveCanvasOffsets(cumulativeOffsets(rel), p);
    EXPECT_EQ(off, std::vector<int>(rel.size(), 0));
}

TEST(MotionPattern, StaticThenPenetrating) {
    const std::vector<double> rel{0, 0.5, 0, 20, 20, 20};
    const MotionProfile p = analyzeMotion(rel);
    EXPECT_EQ(p.pattern, MotionPattern::Penetrating);
    EXPECT_EQ(p.motionStart, 3u);
    EXPECT_EQ(p.staticFrames, 3u);
    EXPECT_EQ(p.motionFrames, 3u);
    EXPECT_DOUBLE_EQ(p.avgMotion, 20.0);
    EXPECT_STREQ(patternName(p.pattern), "static_then_penetrating");

    const auto off = resolveCanvasOffsets(cumulativeOffsets(rel), p);
    EXPECT_EQ(off, (std::vector<int>{0, 1, 1, 21, 41, 61}));
}

TEST(MotionPattern, RetractingAnchorsTheLastFrameAtTheTop) {
    const std::vector<double> rel{0, -20, -20, -20, -20};
    const MotionProfile p = analyzeMotion(rel);
    EXPECT_EQ(p.pattern, MotionPattern::Retracting);
    EXPECT_STREQ(patternName(p.pattern), "static_then_retracting");

    const auto off = resolveCanvasOffsets(cumulativeOffsets(rel), p);
    EXPECT_EQ(off, (std::vector<int>{0, 20, 40, 60, 80}));
}

TEST(MotionPattern, BackAndForthIsMixed) {
    const std::vector<double> rel{0, 20, -20, 20, -20, 10};
    const MotionProfile p = analyzeMotion(rel);
    EXPECT_EQ(p.pattern, MotionPattern::Mixed);

    const auto off = resolveCanvasOffsets(cumulativeOffsets(rel), p);
    EXPECT_EQ(off, (std::vector<int>{0, 20, 0, 20, 0, 10}));
}

TEST(MotionPattern, OffsetsAreNeverNegative) {
    const std::vector<double> rel{0, -7.4, 3.2, -30.6, 12.1, -8.8, 40.2};
    for (MotionPattern pat : {MotionPattern::Static, MotionPattern::Penetrating, MotionPattern::Retracting,
                              MotionPattern::Mixed, MotionPattern::InsufficientData}) {
        MotionProfile p;
        p.pattern = pat;
        const auto off = resolveCanvasOffsets(cumulativeOffsets(rel), p);
        ASSERT_EQ(off.size(), rel.size());
        EXPECT_GE(*std::min_element(off.begin(), off.end()), 0) << patternName(pat);
    }
}

TEST(MotionPattern, AnalysisIsDeterministic) {
    const std::vector<double> rel{0, 3, 8, 12.5, 19, 22, 25};
    EXPECT_EQ(analyzeMotion(rel), analyzeMotion(rel));
    EXPECT_EQ(resolveCanvasOffsets(cumulativeOffsets(rel), analyzeMotion(rel)),
              resolveCanvasOffsets(cumulativeOffsets(rel), analyzeMotion(rel)));
}

TEST(MotionPattern, ConstantMotionUsesTheMedianStep) {
    EXPECT_EQ(smoothConstantMotion({0, 0, 21, 40, 61, 80}), (std::vector<int>{0, 0, 20, 40, 60, 80}));
    // nothing moves: unchanged
    EXPECT_EQ(smoothConstantMotion({0, 1, 2, 1}), (std::vector<int>{0, 1, 2, 1}));
    // retracting steps are shifted back to start at 0
    EXPECT_EQ(smoothConstantMotion({40, 30, 20, 10}), (std::vector<int>{40, 30, 20, 10}));
}

TEST(DepthScale, OffsetsSpanTheBoreLength) {
    const auto d = computeDepthPositions({0, 50, 100});
    ASSERT_EQ(d.size(), 3u);
    EXPECT_DOUBLE_EQ(d[0], 10.0);
    EXPECT_DOUBLE_EQ(d[1], 460.0);
    EXPECT_DOUBLE_EQ(d[2], 910.0);
}

TEST(DepthScale, NoTravelUsesFallbackScale) {
    EXPECT_DOUBLE_EQ(mmPerPixel({0, 0, 0}), 0.1);
    const auto d = computeDepthPositions({0, 0});
    EXPECT_DOUBLE_EQ(d[1], 10.0);
    EXPECT_TRUE(computeDepthPositions({}).empty());
}
