#include "borestitch/core/Errors.hpp"
#include "borestitch/features/FeatureExtractor.hpp"
#include "borestitch/features/FeatureMatcher.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <stop_token>

using namespace borestitch;
using testing_support::scan;
using testing_support::texture;

TEST(Features, TexturedFrameHasKeypointsWithDescriptors) {
    auto det = makeDetector(DetectorType::Auto);
    const KeypointSet k = extractFeatures(texture(320, 240), *det);
    EXPECT_GT(k.size(), 20u);
    EXPECT_EQ(k.descriptors.rows, int(k.size()));
}

TEST(Features, KeypointCountIsCapped) {
    FeatureOptions opt;
    opt.maxKeypoints = 50;
    auto det = makeDetector(DetectorType::Auto, opt);
    const KeypointSet k = extractFeatures(texture(400, 300), *det, opt);
    EXPECT_LE(k.size(), 50u);
    EXPECT_EQ(k.descriptors.rows, int(k.size()));
}

TEST(Features, FeaturelessFrameGivesEmptySet) {
    auto det = makeDetector(DetectorType::Auto);
    const cv::Mat flat(200, 200, CV_8UC3, cv::Scalar(90, 90, 90));
    const KeypointSet k = extractFeatures(flat, *det);
    EXPECT_TRUE(k.empty());
}

TEST(Features, ExtractAllKeepsFrameOrder) {
    const auto frames = scan(4, 25.0, 320, 240);
    FeatureOptions opt;
    const auto all = extractAll(frames, opt, 3);
    ASSERT_EQ(all.size(), frames.size());

    auto det = makeDetector(opt.detector, opt);
    for (std::size_t i = 0; i < frames.size(); ++i) {
        EXPECT_EQ(all[i].size(), extractFeatures(frames[i], *det, opt).size()) << "frame " << i;
    }
}

TEST(Features, ExtractAllHonoursStopRequest) {
    const auto frames = scan(3, 20.0, 200, 160);
    std::stop_source src;
    src.request_stop();
    EXPECT_THROW(extractAll(frames, {}, 2, src.get_token()), Cancelled);
}

TEST(Features, DetectorNamesParse) {
    EXPECT_EQ(detectorFromName("SIFT"), DetectorType::SIFT);
    EXPECT_EQ(detectorFromName("orb"), DetectorType::ORB);
    EXPECT_EQ(detectorFromName("Akaze"), DetectorType::AKAZE);
    EXPECT_EQ(detectorFromName("auto"), DetectorType::Auto);
    EXPECT_FALSE(detectorFromName("surf").has_value());
    EXPECT_NE(resolveDetectorType(DetectorType::Auto), DetectorType::Auto);
}

TEST(Matcher, ShiftedFramesMatchWithTheShift) {
    const auto frames = scan(2, 20.0);
    auto det = makeDetector(DetectorType::Auto);
    const KeypointSet a = extractFeatures(frames[0], *det);
    const KeypointSet b = extractFeatures(frames[1], *det);

    const MatchSet m = matchFeatures(a, b);
    ASSERT_GE(m.size(), 10u);

    // content moves up by the step
    std::size_t consistent = 0;
    for (const auto& c : m) {
        if (std::abs((c.b.y - c.a.y) + 20.f) < 2.f && std::abs(c.b.x - c.a.x) < 2.f) ++consistent;
    }
    EXPECT_GT(double(consistent) / double(m.size()), 0.8);
}

TEST(Matcher, EmptyOrIncompatibleInputGivesNoMatches) {
    auto det = makeDetector(DetectorType::Auto);
    const KeypointSet a = extractFeatures(texture(200, 200), *det);
    EXPECT_TRUE(matchFeatures(a, KeypointSet{}).empty());
    EXPECT_TRUE(matchFeatures(KeypointSet{}, a).empty());

    KeypointSet other = a;
    other.normType = (a.normType == cv::NORM_L2) ? cv::NORM_HAMMING : cv::NORM_L2;
    EXPECT_TRUE(matchFeatures(a, other).empty());
}
