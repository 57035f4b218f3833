#include "borestitch/compose/PostProcessor.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <opencv2/imgproc.hpp>

#include <cmath>

using namespace borestitch;
using testing_support::meanAbsDiff;

namespace {

/* Smooth pipe-wall-like image: heavily blurred noise around mid grey. */
cv::Mat smoothWall(int w, int h)
{
    cv::Mat g(h, w, CV_8UC1);
    cv::RNG rng(21);
    rng.fill(g, cv::RNG::NORMAL, 128, 60);
    cv::GaussianBlur(g, g, {0, 0}, 4.0);
    cv::Mat bgr;
    cv::cvtColor(g, bgr, cv::COLOR_GRAY2BGR);
    return bgr;
}

} // namespace

TEST(PostProcess, EmptyInEmptyOut) {
    EXPECT_TRUE(postProcess(cv::Mat()).empty());
}

TEST(PostProcess, CropsNearBlackBorder) {
    cv::Mat img = cv::Mat::zeros(120, 90, CV_8UC3);
    smoothWall(60, 80).copyTo(img(cv::Rect(10, 20, 60, 80)));

    EXPECT_EQ(validBounds(img, 8), cv::Rect(10, 20, 60, 80));
    EXPECT_EQ(cropValid(img, 8).size(), cv::Size(60, 80));

    // nothing above the threshold: unchanged copy
    const cv::Mat black = cv::Mat::zeros(30, 30, CV_8UC3);
    EXPECT_EQ(cropValid(black, 8).size(), black.size());
}

TEST(PostProcess, SecondPassChangesLittle) {
    const cv::Mat once = postProcess(smoothWall(320, 240));
    const cv::Mat twice = postProcess(once);
    ASSERT_EQ(once.size(), twice.size());
    EXPECT_LT(meanAbsDiff(once, twice), 3.0);
}

TEST(PostProcess, HorizontalSeamIsRepaired) {
    cv::Mat img(100, 200, CV_8UC3, cv::Scalar(100, 100, 100));
    cv::line(img, {0, 50}, {199, 50}, cv::Scalar(250, 250, 250), 1);

    PostOptions opt;
    const int repaired = removeSeams(img, opt);
    EXPECT_GE(repaired, 1);
    EXPECT_LT(std::abs(img.at<cv::Vec3b>(50, 100)[0] - 100), 30);
}

TEST(PostProcess, SeamRowInterpolatesBetweenNeighbours) {
    cv::Mat img(20, 10, CV_8UC3, cv::Scalar(0, 0, 0));
    img.rowRange(0, 8).setTo(cv::Scalar(40, 40, 40));
    img.rowRange(8, 20).setTo(cv::Scalar(200, 200, 200));
    repairSeamRow(img, 10);   // rows 8..12 from row 7 (40) to row 13 (200)

    EXPECT_EQ(img.at<cv::Vec3b>(8, 5)[1], 40);
    EXPECT_EQ(img.at<cv::Vec3b>(10, 5)[1], 120);
    EXPECT_EQ(img.at<cv::Vec3b>(12, 5)[1], 200);
    EXPECT_LT(img.at<cv::Vec3b>(9, 5)[1], img.at<cv::Vec3b>(10, 5)[1]);

    // too close to the border: untouched
    cv::Mat edge = img.clone();
    repairSeamRow(edge, 1);
    EXPECT_EQ(cv::norm(edge, img, cv::NORM_INF), 0.0);
}

TEST(PostProcess, ColorBalanceEqualisesChannelMeans) {
    cv::Mat img = smoothWall(64, 64);
    cv::Mat tinted;
    cv::multiply(img, cv::Scalar(0.8, 1.0, 1.2), tinted);
    const cv::Scalar m = cv::mean(colorBalance(tinted));
    EXPECT_NEAR(m[0], m[1], 2.0);
    EXPECT_NEAR(m[1], m[2], 2.0);
}

TEST(PostProcess, HolesAreInpainted) {
    cv::Mat img = smoothWall(80, 80);
    img(cv::Rect(30, 30, 6, 6)).setTo(cv::Scalar::all(0));

    const cv::Mat out = fillHoles(img, 10);
    cv::Mat gray;
    cv::cvtColor(out(cv::Rect(30, 30, 6, 6)), gray, cv::COLOR_BGR2GRAY);
    double mn = 0.0;
    cv::minMaxLoc(gray, &mn);
    EXPECT_GE(mn, 10.0);
}
