#include "borestitch/deblur/Deblurrer.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <opencv2/imgproc.hpp>

#include <string>

using namespace borestitch;

TEST(DefocusKernel, NormalisedDisk) {
    for (double r : {0.8, 2.0, 4.5}) {
        const cv::Mat k = defocusKernel(r);
        EXPECT_EQ(k.type(), CV_32FC1);
        EXPECT_EQ(k.rows % 2, 1);
        EXPECT_NEAR(cv::sum(k)[0], 1.0, 1e-5) << "radius " << r;
        // peak at the centre
        double mx = 0.0;
        cv::minMaxLoc(k, nullptr, &mx);
        EXPECT_FLOAT_EQ(k.at<float>(k.rows / 2, k.cols / 2), float(mx));
    }
}

TEST(DefocusKernel, TinyRadiusIsIdentity) {
    const cv::Mat k = defocusKernel(0.3);
    ASSERT_EQ(k.size(), cv::Size(1, 1));
    EXPECT_FLOAT_EQ(k.at<float>(0, 0), 1.f);
}

TEST(Deconvolution, IdentityKernelKeepsChannel) {
    cv::Mat g;
    cv::cvtColor(testing_support::texture(64, 48), g, cv::COLOR_BGR2GRAY);
    cv::Mat f;
    g.convertTo(f, CV_32F, 1.0 / 255.0);
    const cv::Mat id = defocusKernel(0.0);

    EXPECT_LT(cv::norm(lucyRichardson(f, id, 5), f, cv::NORM_INF), 1e-4);
    EXPECT_LT(cv::norm(wienerDeconvolve(f, id, 0.0), f, cv::NORM_INF), 1e-3);
}

TEST(Deconvolution, WienerSharpensBlurredEdge) {
    cv::Mat f = cv::Mat::zeros(64, 64, CV_32F);
    f.colRange(32, 64).setTo(0.8);
    const cv::Mat psf = defocusKernel(3.0);
    cv::Mat blurred;
    cv::filter2D(f, blurred, CV_32F, psf, cv::Point(-1, -1), 0, cv::BORDER_REFLECT);

    const cv::Mat restored = wienerDeconvolve(blurred, psf, 0.01);
    ASSERT_EQ(restored.size(), f.size());
    // error against the sharp edge, away from the wrap-around columns
    const cv::Rect mid(16, 16, 32, 32);
    EXPECT_LT(cv::norm(restored(mid), f(mid), cv::NORM_L1),
              cv::norm(blurred(mid), f(mid), cv::NORM_L1));
}

TEST(Deblurrer, KeepsShapeForBothMethods) {
    cv::Mat img = testing_support::texture(120, 90);
    cv::GaussianBlur(img, img, {0, 0}, 2.0);

    for (DefocusMethod m : {DefocusMethod::Wiener, DefocusMethod::LucyRichardson}) {
        DeblurOptions opt;
        opt.method = m;
        opt.lucyRichardsonIterations = 4;
        Deblurrer d(opt);
        const cv::Mat out = d.process(img);
        EXPECT_EQ(out.size(), img.size()) << defocusMethodName(m);
        EXPECT_EQ(out.type(), CV_8UC3);
        EXPECT_GE(d.lastEstimate().radius, opt.minRadius);
        EXPECT_LE(d.lastEstimate().radius, opt.maxRadius);
        EXPECT_GE(d.lastEstimate().strength, 0.1);
        EXPECT_LE(d.lastEstimate().strength, 1.0);
    }
}

TEST(Deblurrer, MethodNames) {
    EXPECT_EQ(std::string(defocusMethodName(DefocusMethod::Wiener)), "wiener");
    EXPECT_EQ(std::string(defocusMethodName(DefocusMethod::LucyRichardson)), "lucy_richardson");
}
