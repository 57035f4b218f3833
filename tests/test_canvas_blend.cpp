#include "borestitch/compose/Canvas.hpp"
#include "borestitch/compose/SeamBlender.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <stdexcept>
#include <vector>

using namespace borestitch;
using testing_support::meanAbsDiff;
using testing_support::texture;

TEST(SeamBlender, ShapeMismatchFallsBackToIncoming) {
    const cv::Mat a = texture(50, 20, 1);
    const cv::Mat b = texture(40, 20, 2);
    const BlendOutcome r = blendBand(a, b);
    EXPECT_TRUE(r.skipped);
    ASSERT_EQ(r.band.size(), b.size());
    EXPECT_EQ(cv::norm(r.band, b, cv::NORM_INF), 0.0);
}

TEST(SeamBlender, TypeMismatchFallsBackToIncoming) {
    const cv::Mat a = texture(40, 20, 1);
    cv::Mat b;
    texture(40, 20, 2).convertTo(b, CV_32F);
    const BlendOutcome r = blendBand(a, b);
    EXPECT_TRUE(r.skipped);
    EXPECT_EQ(r.band.type(), CV_32FC3);
}

TEST(SeamBlender, OutputKeepsShapeTypeAndRange) {
    cv::Mat a(40, 64, CV_32FC3), b(40, 64, CV_32FC3);
    cv::RNG rng(5);
    rng.fill(a, cv::RNG::UNIFORM, 0.0, 255.0);
    rng.fill(b, cv::RNG::UNIFORM, 0.0, 255.0);

    const BlendOutcome r = blendBand(a, b);
    ASSERT_FALSE(r.skipped);
    EXPECT_EQ(r.band.size(), a.size());
    EXPECT_EQ(r.band.type(), CV_32FC3);

    double mn = 0.0, mx = 0.0;
    cv::minMaxLoc(r.band.reshape(1), &mn, &mx);
    EXPECT_GE(mn, 0.0);
    EXPECT_LE(mx, 255.0);
    EXPECT_GE(r.pyramidShare, 0.15);
    EXPECT_LE(r.pyramidShare, 0.85);
}

TEST(SeamBlender, IdenticalBandsStayClose) {
    const cv::Mat a = texture(120, 60, 3);
    const BlendOutcome r = blendBand(a, a);
    ASSERT_FALSE(r.skipped);
    EXPECT_EQ(r.band.type(), CV_8UC3);
    EXPECT_LT(meanAbsDiff(r.band, a), 6.0);
}

TEST(SeamBlender, SmoothstepRunsFromExistingToIncoming) {
    const cv::Mat w = smoothstepWeights(11);
    EXPECT_FLOAT_EQ(w.at<float>(0, 0), 1.f);
    EXPECT_FLOAT_EQ(w.at<float>(10, 0), 0.f);
    EXPECT_FLOAT_EQ(w.at<float>(5, 0), 0.5f);
    for (int y = 1; y < w.rows; ++y) EXPECT_LE(w.at<float>(y, 0), w.at<float>(y - 1, 0));

    const cv::Mat r = smoothstepWeights(11, false);
    EXPECT_FLOAT_EQ(r.at<float>(0, 0), 0.f);
    EXPECT_FLOAT_EQ(r.at<float>(10, 0), 1.f);
}

TEST(SeamBlender, HistogramMatchingMovesTowardsReference) {
    const cv::Mat ref = texture(80, 80, 4);
    cv::Mat dark;
    ref.convertTo(dark, CV_8U, 0.6, 0);
    const cv::Mat m = matchHistograms(dark, ref);
    EXPECT_LT(std::abs(cv::mean(m)[0] - cv::mean(ref)[0]), 4.0);
}

TEST(Canvas, SizedFromOffsetsAndMargin) {
    CanvasCompositor c({cv::Size(100, 50), cv::Size(80, 50)}, {0, 30});
    EXPECT_EQ(c.canvasSize(), cv::Size(100, 80 + 200));
    EXPECT_EQ(c.filledEnd(), 0);
    EXPECT_TRUE(c.finalize().empty());
}

TEST(Canvas, RejectsInconsistentInput) {
    EXPECT_THROW(CanvasCompositor({cv::Size(10, 10)}, {0, 5}), std::invalid_argument);
    EXPECT_THROW(CanvasCompositor({}, {}), std::invalid_argument);

    CanvasCompositor c({cv::Size(10, 10)}, {0});
    EXPECT_THROW(c.place(1, texture(10, 10)), std::out_of_range);
}

TEST(Canvas, DisjointFramesAreCopiedWithoutBlending) {
    const cv::Mat a = texture(120, 60, 1);
    const cv::Mat b = texture(120, 60, 2);
    CanvasCompositor c({a.size(), b.size()}, {0, 60});

    const PlacementReport ra = c.place(0, a);
    const PlacementReport rb = c.place(1, b);
    EXPECT_FALSE(ra.blended);
    EXPECT_FALSE(rb.blended);
    EXPECT_EQ(rb.overlapRows, 0);
    EXPECT_EQ(c.filledEnd(), 120);

    const cv::Mat out = c.finalize();
    ASSERT_EQ(out.size(), cv::Size(120, 120));
    EXPECT_EQ(cv::norm(out.rowRange(0, 60), a, cv::NORM_INF), 0.0);
    EXPECT_EQ(cv::norm(out.rowRange(60, 120), b, cv::NORM_INF), 0.0);
}

TEST(Canvas, OverlappingScanFramesBlendIntoTheScene) {
    borestitch::ScanSimulator::Options o;
    o.frames = 3;
    o.step = 100.0;
    borestitch::ScanSimulator sim(o);
    std::vector<cv::Mat> frames;
    while (auto f = sim.nextImage()) frames.push_back(*f);

    CanvasCompositor c({frames[0].size(), frames[1].size(), frames[2].size()}, {0, 100, 200});
    for (std::size_t i = 0; i < frames.size(); ++i) c.place(i, frames[i]);

    const auto& rep = c.reports();
    ASSERT_EQ(rep.size(), 3u);
    EXPECT_FALSE(rep[0].blended);
    EXPECT_TRUE(rep[1].blended);
    EXPECT_EQ(rep[1].overlapRows, 200);
    EXPECT_TRUE(rep[2].blended);

    const cv::Mat out = c.finalize();
    ASSERT_EQ(out.rows, 500);
    EXPECT_LT(meanAbsDiff(out, sim.master().rowRange(0, 500)), 6.0);
}

TEST(Canvas, FramesOutsideTheCanvasAreSkipped) {
    const cv::Mat a = texture(60, 40, 1);
    CanvasCompositor c({a.size(), a.size()}, {0, 20});
    c.place(0, a);

    const PlacementReport r = c.place(1, texture(70, 40, 2));   // not the declared size
    EXPECT_TRUE(r.skipped);
    EXPECT_FALSE(r.blended);
    EXPECT_EQ(c.filledEnd(), 40);
}

TEST(Canvas, ShortOverlapIsOverwritten) {
    const cv::Mat a = texture(60, 40, 1);
    const cv::Mat b = texture(60, 40, 2);
    CanvasCompositor c({a.size(), b.size()}, {0, 32});   // 8 shared rows
    c.place(0, a);
    const PlacementReport r = c.place(1, b);
    EXPECT_EQ(r.overlapRows, 8);
    EXPECT_FALSE(r.blended);
    EXPECT_EQ(cv::norm(c.finalize().rowRange(32, 72), b, cv::NORM_INF), 0.0);
}

TEST(Canvas, GapRowsAreNotBlendedAgainstEmptyCanvas) {
    const cv::Mat a = texture(80, 100, 1);
    const cv::Mat b = texture(80, 100, 2);
    const cv::Mat c3 = texture(80, 100, 3);
    // rows 100..120 stay empty until the third frame covers them
    CanvasCompositor c({a.size(), b.size(), c3.size()}, {0, 120, 40});
    c.place(0, a);
    c.place(1, b);
    const PlacementReport r = c.place(2, c3);

    EXPECT_EQ(r.overlapRows, 60);   // rows 40..100, not the whole 40..140 span
    EXPECT_TRUE(r.blended);

    // past the fade the gap and the rest of the frame are plain copies
    const cv::Mat out = c.finalize();
    ASSERT_EQ(out.rows, 220);
    EXPECT_EQ(cv::norm(out.rowRange(110, 140), c3.rowRange(70, 100), cv::NORM_INF), 0.0);
}
