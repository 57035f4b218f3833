#include "borestitch/align/MotionEstimator.hpp"
#include "borestitch/align/TemplateMatcher.hpp"
#include "borestitch/features/FeatureExtractor.hpp"
#include "borestitch/features/FeatureMatcher.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <opencv2/imgproc.hpp>

#include <variant>

using namespace borestitch;
using testing_support::scan;

namespace {

/* Correspondences on a grid mapped by b = s * a + t. */
MatchSet gridMatches(double s, cv::Point2f t, int n = 40)
{
    MatchSet m;
    cv::RNG rng(3);
    for (int i = 0; i < n; ++i) {
        const cv::Point2f a(float(rng.uniform(10.0, 390.0)), float(rng.uniform(10.0, 290.0)));
        m.push_back({a, cv::Point2f(float(s) * a.x + t.x, float(s) * a.y + t.y)});
    }
    return m;
}

} // namespace

TEST(Transform, HelpersReadTheMatrix) {
    const Transform2D t = Transform2D::translation(3.0, -7.5);
    EXPECT_DOUBLE_EQ(t.dx(), 3.0);
    EXPECT_DOUBLE_EQ(t.dy(), -7.5);
    EXPECT_DOUBLE_EQ(t.scaleX(), 1.0);
    EXPECT_TRUE(t.invertible());
    EXPECT_TRUE(t.withinScaleGate());

    const cv::Mat a23 = (cv::Mat_<double>(2, 3) << 1.5, 0, 0, 0, 1.5, 10);
    EXPECT_FALSE(Transform2D::fromAffine(a23).withinScaleGate());
}

TEST(Motion, SimilarityAcceptsPlausibleShift) {
    const auto fit = estimateSimilarity(gridMatches(1.0, {0.f, 15.f}));
    ASSERT_TRUE(fit.has_value());
    EXPECT_NEAR(fit->transform.dy(), 15.0, 0.05);
    EXPECT_GT(fit->inlierRatio, 0.9);
}

TEST(Motion, ScaleGateRejectsZoom) {
    EXPECT_FALSE(estimateSimilarity(gridMatches(1.5, {0.f, 30.f})).has_value());
    EXPECT_FALSE(estimateSimilarity(gridMatches(0.7, {0.f, 30.f})).has_value());
}

TEST(Motion, SimilarityRejectsNegligibleAndHugeDy) {
    EXPECT_FALSE(estimateSimilarity(gridMatches(1.0, {6.f, 0.f})).has_value());
    EXPECT_FALSE(estimateSimilarity(gridMatches(1.0, {0.f, 250.f})).has_value());
}

TEST(Motion, TranslationIsDeterministicAndRobust) {
    MatchSet m = gridMatches(1.0, {3.f, -12.f}, 30);
    cv::RNG rng(9);
    for (int i = 0; i < 15; ++i) {
        const cv::Point2f a(float(rng.uniform(0.0, 400.0)), float(rng.uniform(0.0, 300.0)));
        m.push_back({a, cv::Point2f(float(rng.uniform(0.0, 400.0)), float(rng.uniform(0.0, 300.0)))});
    }

    const auto f1 = estimateTranslation(m);
    const auto f2 = estimateTranslation(m);
    ASSERT_TRUE(f1.has_value());
    ASSERT_TRUE(f2.has_value());
    EXPECT_TRUE(f1->transform.m == f2->transform.m);
    EXPECT_EQ(f1->inliers, f2->inliers);
    EXPECT_NEAR(f1->transform.dy(), -12.0, 0.5);
    EXPECT_NEAR(f1->transform.dx(), 3.0, 0.5);
}

TEST(Motion, HorizontalOnlyMotionFallsToTranslation) {
    const PairRegistration r = registerPair(cv::Mat(), cv::Mat(), gridMatches(1.0, {6.f, 0.f}));
    EXPECT_TRUE(r.ransacAttempted);
    EXPECT_FALSE(r.templateAttempted);
    ASSERT_TRUE(std::holds_alternative<TranslationFit>(r.result));
    EXPECT_EQ(placementDy(r.result), 0.0);
    EXPECT_STREQ(kindName(r.result), "translation");
}

TEST(Motion, FewMatchesGoStraightToTemplate) {
    const auto frames = scan(2, 20.0);
    const MatchSet grid = gridMatches(1.0, {0.f, -20.f});
    const MatchSet four(grid.begin(), grid.begin() + 4);
    ASSERT_EQ(four.size(), 4u);

    const PairRegistration r = registerPair(frames[0], frames[1], four);
    EXPECT_FALSE(r.ransacAttempted);
    EXPECT_TRUE(r.templateAttempted);
    ASSERT_TRUE(std::holds_alternative<TemplateFit>(r.result));
    EXPECT_NEAR(placementDy(r.result), 20.0, 1.5);
    EXPECT_GT(confidence(r.result), 0.5);
}

TEST(Motion, UnrelatedFramesGiveNoFit) {
    const cv::Mat a = testing_support::texture(300, 240, 11);
    const cv::Mat b = testing_support::texture(300, 240, 12);
    const PairRegistration r = registerPair(a, b, {});
    EXPECT_TRUE(r.templateAttempted);
    ASSERT_TRUE(std::holds_alternative<NoFit>(r.result));
    EXPECT_EQ(placementDy(r.result), 0.0);
    EXPECT_STREQ(kindName(r.result), "none");
}

TEST(Motion, PlacementSignIsConfigurable) {
    const RegistrationResult r = TemplateFit{-20.0, 0.9, 1.0};
    EXPECT_DOUBLE_EQ(placementDy(r, true), 20.0);
    EXPECT_DOUBLE_EQ(placementDy(r, false), -20.0);
    EXPECT_DOUBLE_EQ(rawDy(r), -20.0);
}

TEST(TemplateMatcher, RecoversVerticalOffset) {
    const auto frames = scan(2, 33.0);
    const TemplateMatch tm = matchVerticalOffset(frames[0], frames[1]);
    ASSERT_TRUE(tm.ok);
    EXPECT_NEAR(tm.offset, -33.0, 1.0);
    EXPECT_GT(tm.confidence, 0.8);
}

TEST(Motion, FitMapsEarlierFrameOntoLater) {
    // content moves up by 20 rows from frame 0 to frame 1
    const auto frames = scan(2, 20.0);
    const auto kps = extractAll(frames);
    const MatchSet m = matchFeatures(kps[0], kps[1]);
    const PairRegistration r = registerPair(frames[0], frames[1], m);

    ASSERT_TRUE(std::holds_alternative<AffineFit>(r.result));
    const Transform2D& t = std::get<AffineFit>(r.result).transform;
    EXPECT_NEAR(t.dy(), -20.0, 1.5);
    EXPECT_NEAR(rawDy(r.result), -20.0, 1.5);
    EXPECT_NEAR(placementDy(r.result), 20.0, 1.5);
}

TEST(TemplateMatcher, FlatCentreFallsBackToEdgeBands) {
    // rows 80..280 of the scene are featureless
    cv::Mat scene = testing_support::texture(200, 340, 5);
    scene.rowRange(80, 280).setTo(cv::Scalar::all(128));

    // b sees the scene 30 rows higher: a's row y is b's row y + 30
    const cv::Mat a = scene.rowRange(30, 330).clone();
    const cv::Mat b = scene.rowRange(0, 300).clone();

    TemplateOptions centreOnly;
    centreOnly.retryBelow = -2.0;
    const TemplateMatch flat = matchVerticalOffset(a, b, centreOnly);
    EXPECT_LT(flat.confidence, 0.3);

    const TemplateMatch tm = matchVerticalOffset(a, b);
    ASSERT_TRUE(tm.ok);
    EXPECT_DOUBLE_EQ(tm.scale, 1.0);
    EXPECT_GT(tm.confidence, 0.7);
    EXPECT_NEAR(tm.offset, 30.0, 1.0);
}
