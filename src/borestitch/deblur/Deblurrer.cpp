#include "borestitch/deblur/Deblurrer.hpp"
#include "borestitch/core/Log.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>
#include <vector>

namespace borestitch {

const char* defocusMethodName(DefocusMethod m) {
    return m == DefocusMethod::LucyRichardson ? "lucy_richardson" : "wiener";
}

static cv::Mat toGray8(const cv::Mat& m) {
    if (m.channels() == 1) return m;
    cv::Mat g;
    cv::cvtColor(m, g, cv::COLOR_BGR2GRAY);
    return g;
}

static double median3(double a, double b, double c) {
    return std::max(std::min(a, b), std::min(std::max(a, b), c));
}

/* Edges: Laplacian zero crossings widened by a 3x3 dilation; wide edges mean blur. */
static DefocusEstimate edgeEstimate(const cv::Mat& gray)
{
    cv::Mat canny;
    cv::Canny(gray, canny, 50, 150);
    const double density = double(cv::countNonZero(canny)) / double(canny.total());

    cv::Mat lap;
    cv::Laplacian(gray, lap, CV_32F);
    const int h = lap.rows, w = lap.cols;
    cv::Mat zc = cv::Mat::zeros(lap.size(), CV_8U);
    if (h > 2 && w > 2) {
        const cv::Mat c = lap(cv::Range(1, h - 1), cv::Range(1, w - 1));
        const cv::Mat down = lap(cv::Range(2, h), cv::Range(1, w - 1));
        const cv::Mat right = lap(cv::Range(1, h - 1), cv::Range(2, w));
        cv::Mat cross = (c.mul(down) < 0) | (c.mul(right) < 0);
        cross.copyTo(zc(cv::Range(1, h - 1), cv::Range(1, w - 1)));
    }

    double width = 3.0;
    const int n = cv::countNonZero(zc);
    if (n > 0) {
        cv::Mat dil;
        cv::dilate(zc, dil, cv::Mat::ones(3, 3, CV_8U));
        width = std::min(double(cv::countNonZero(dil)) / double(n), 10.0);
    }
    return {std::max(1.0, width / 2.0), 1.0 - std::min(density * 10.0, 1.0)};
}

/* Spectrum: radial power falls off faster at high frequencies when defocused. */
static DefocusEstimate spectralEstimate(const cv::Mat& gray)
{
    cv::Mat f;
    gray.convertTo(f, CV_32F);
    cv::Mat spec;
    cv::dft(f, spec, cv::DFT_COMPLEX_OUTPUT);
    std::vector<cv::Mat> planes;
    cv::split(spec, planes);
    cv::Mat mag;
    cv::magnitude(planes[0], planes[1], mag);

    // radial profile around the zero frequency (no shift needed: fold the indices)
    const int h = mag.rows, w = mag.cols;
    const int maxR = std::min(w / 2, h / 2);
    if (maxR - 1 <= 10) return {3.0, 0.5};

    std::vector<double> sum(maxR, 0.0);
    std::vector<int> cnt(maxR, 0);
    for (int y = 0; y < h; ++y) {
        const int fy = y <= h / 2 ? y : y - h;
        const float* p = mag.ptr<float>(y);
        for (int x = 0; x < w; ++x) {
            const int fx = x <= w / 2 ? x : x - w;
            const int r = int(std::lround(std::sqrt(double(fx * fx + fy * fy))));
            if (r >= 1 && r < maxR) { sum[r] += p[x]; ++cnt[r]; }
        }
    }
    std::vector<double> profile;
    for (int r = 1; r < maxR; ++r) profile.push_back(cnt[r] ? sum[r] / cnt[r] : 0.0);

    const std::size_t n = profile.size();
    double high = 0.0, low = 0.0;
    for (std::size_t i = n / 3; i < n; ++i) high += profile[i];
    for (std::size_t i = 0; i < n / 4; ++i) low += profile[i];
    high /= double(n - n / 3);
    low /= double(std::max<std::size_t>(1, n / 4));
    if (low <= 0.0) return {3.0, 0.5};

    const double att = high / low;
    return {std::max(1.0, 5.0 * (1.0 - att)), att};
}

/* Gradients: Brenner and Tenengrad sharpness normalised by the peak gradient. */
static DefocusEstimate gradientEstimate(const cv::Mat& gray)
{
    cv::Mat gx, gy, mag;
    cv::Sobel(gray, gx, CV_64F, 1, 0, 3);
    cv::Sobel(gray, gy, CV_64F, 0, 1, 3);
    cv::magnitude(gx, gy, mag);

    double gmax = 0.0;
    cv::minMaxLoc(mag, nullptr, &gmax);
    const double area = double(gray.total());

    double brenner = 0.0;
    if (gray.rows > 2) {
        const cv::Mat d = gx.rowRange(0, gx.rows - 2) - gx.rowRange(2, gx.rows);
        brenner += cv::sum(d.mul(d))[0];
    }
    if (gray.cols > 2) {
        const cv::Mat d = gy.colRange(0, gy.cols - 2) - gy.colRange(2, gy.cols);
        brenner += cv::sum(d.mul(d))[0];
    }
    brenner /= area;
    const double tenengrad = cv::sum(mag.mul(mag))[0] / area;

    const double sharp = 0.5 * (brenner / (gmax + 1e-6) + tenengrad / (gmax * gmax + 1e-6));
    return {std::max(1.0, 8.0 * (1.0 - std::min(sharp, 1.0))), 1.0 - std::min(sharp * 2.0, 1.0)};
}

DefocusEstimate estimateDefocus(const cv::Mat& bgr8)
{
    CV_Assert(!bgr8.empty() && bgr8.depth() == CV_8U);
    const cv::Mat gray = toGray8(bgr8);

    const DefocusEstimate e = edgeEstimate(gray);
    const DefocusEstimate s = spectralEstimate(gray);
    const DefocusEstimate g = gradientEstimate(gray);
    return {median3(e.radius, s.radius, g.radius), median3(e.strength, s.strength, g.strength)};
}

cv::Mat defocusKernel(double radius)
{
    if (radius < 0.5) return cv::Mat::ones(1, 1, CV_32F);

    int size = int(2 * radius) + 1;
    if (size % 2 == 0) ++size;
    const int c = size / 2;
    const double sigma = radius / 3.0;

    cv::Mat k = cv::Mat::zeros(size, size, CV_32F);
    for (int y = 0; y < size; ++y) {
        for (int x = 0; x < size; ++x) {
            const double d = std::hypot(double(x - c), double(y - c));
            if (d <= radius) k.at<float>(y, x) = float(std::exp(-(d * d) / (2.0 * sigma * sigma)));
        }
    }
    const double s = cv::sum(k)[0];
    if (s > 0) k /= s;
    else k.at<float>(c, c) = 1.f;
    return k;
}

/* Zero-pad a small kernel to `size` with its centre moved to (0, 0). */
static cv::Mat padCentred(const cv::Mat& k, cv::Size size)
{
    cv::Mat big = cv::Mat::zeros(size, CV_32F);
    const int cy = k.rows / 2, cx = k.cols / 2;
    for (int y = 0; y < k.rows; ++y) {
        for (int x = 0; x < k.cols; ++x) {
            const int yy = ((y - cy) % size.height + size.height) % size.height;
            const int xx = ((x - cx) % size.width + size.width) % size.width;
            big.at<float>(yy, xx) += k.at<float>(y, x);
        }
    }
    return big;
}

cv::Mat wienerDeconvolve(const cv::Mat& channel, const cv::Mat& psf, double balance)
{
    CV_Assert(channel.type() == CV_32FC1 && psf.type() == CV_32FC1);
    const cv::Size sz = channel.size();

    const cv::Mat lapK = (cv::Mat_<float>(3, 3) << 0, -1, 0, -1, 4, -1, 0, -1, 0);
    cv::Mat Y, H, R;
    cv::dft(channel, Y, cv::DFT_COMPLEX_OUTPUT);
    cv::dft(padCentred(psf, sz), H, cv::DFT_COMPLEX_OUTPUT);
    cv::dft(padCentred(lapK, sz), R, cv::DFT_COMPLEX_OUTPUT);

    // X = Y * conj(H) / (|H|^2 + balance * |R|^2)
    cv::Mat num;
    cv::mulSpectrums(Y, H, num, 0, /*conjB=*/true);

    std::vector<cv::Mat> h2, r2, n2;
    cv::split(H, h2);
    cv::split(R, r2);
    cv::Mat habs, rabs;
    cv::magnitude(h2[0], h2[1], habs);
    cv::magnitude(r2[0], r2[1], rabs);
    cv::Mat denom = habs.mul(habs) + balance * rabs.mul(rabs);
    cv::max(denom, 1e-12, denom);

    cv::split(num, n2);
    cv::divide(n2[0], denom, n2[0]);
    cv::divide(n2[1], denom, n2[1]);
    cv::merge(n2, num);

    cv::Mat out;
    cv::dft(num, out, cv::DFT_INVERSE | cv::DFT_REAL_OUTPUT | cv::DFT_SCALE);
    cv::max(out, -1.0, out);
    cv::min(out, 1.0, out);
    return out;
}

cv::Mat lucyRichardson(const cv::Mat& channel, const cv::Mat& psf, int iterations)
{
    CV_Assert(channel.type() == CV_32FC1 && psf.type() == CV_32FC1);
    cv::Mat mirror;
    cv::flip(psf, mirror, -1);

    cv::Mat est(channel.size(), CV_32F, cv::Scalar(0.5));
    cv::Mat conv, ratio, corr;
    for (int i = 0; i < iterations; ++i) {
        cv::filter2D(est, conv, CV_32F, mirror, cv::Point(-1, -1), 0, cv::BORDER_REFLECT);
        cv::max(conv, 1e-6, conv);
        cv::divide(channel, conv, ratio);
        cv::filter2D(ratio, corr, CV_32F, psf, cv::Point(-1, -1), 0, cv::BORDER_REFLECT);
        est = est.mul(corr);
    }
    cv::max(est, -1.0, est);
    cv::min(est, 1.0, est);
    return est;
}

cv::Mat Deblurrer::process(const cv::Mat& bgr8)
{
    CV_Assert(bgr8.type() == CV_8UC3);

    const DefocusEstimate e = estimateDefocus(bgr8);
    history_.push_back(e);
    while (history_.size() > std::max<std::size_t>(1, opt_.historyFrames)) history_.pop_front();

    DefocusEstimate avg;
    for (const auto& h : history_) { avg.radius += h.radius; avg.strength += h.strength; }
    avg.radius = std::clamp(avg.radius / double(history_.size()), opt_.minRadius, opt_.maxRadius);
    avg.strength = std::clamp(avg.strength / double(history_.size()), 0.1, 1.0);
    last_ = avg;

    const cv::Mat psf = defocusKernel(avg.radius);
    logger()->debug("deblur: radius {:.2f} strength {:.2f} ({})", avg.radius, avg.strength,
                    defocusMethodName(opt_.method));

    cv::Mat f;
    bgr8.convertTo(f, CV_32F, 1.0 / 255.0);
    std::vector<cv::Mat> ch;
    cv::split(f, ch);
    for (auto& c : ch) {
        c = (opt_.method == DefocusMethod::LucyRichardson)
                ? lucyRichardson(c, psf, std::max(1, opt_.lucyRichardsonIterations))
                : wienerDeconvolve(c, psf, opt_.wienerNoiseRatio);
    }
    cv::merge(ch, f);

    cv::Mat out;
    f.convertTo(out, CV_8U, 255.0);
    return out;
}

} // namespace borestitch
