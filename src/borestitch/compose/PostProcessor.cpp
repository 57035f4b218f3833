#include "borestitch/compose/PostProcessor.hpp"
#include "borestitch/core/Log.hpp"

#include <opencv2/imgproc.hpp>
#include <opencv2/photo.hpp>

#include <cmath>
#include <set>

namespace borestitch {

static cv::Mat toGray(const cv::Mat& bgr8) {
    cv::Mat g;
    cv::cvtColor(bgr8, g, cv::COLOR_BGR2GRAY);
    return g;
}

cv::Rect validBounds(const cv::Mat& bgr8, int nearBlack)
{
    if (bgr8.empty()) return {};
    cv::Mat mask;
    cv::compare(toGray(bgr8), nearBlack, mask, cv::CMP_GT);
    std::vector<cv::Point> pts;
    cv::findNonZero(mask, pts);
    if (pts.empty()) return {};
    return cv::boundingRect(pts);
}

cv::Mat cropValid(const cv::Mat& bgr8, int nearBlack)
{
    const cv::Rect r = validBounds(bgr8, nearBlack);
    if (r.empty()) return bgr8.clone();
    return bgr8(r).clone();
}

void repairSeamRow(cv::Mat& bgr8, int y)
{
    if (y - 3 < 0 || y + 3 >= bgr8.rows) return;

    cv::Mat start, end;
    bgr8.row(y - 3).convertTo(start, CV_32F);
    bgr8.row(y + 3).convertTo(end, CV_32F);

    // five rows, t in [-1, 1]: f = (1+t)/2 * (1 + sin(pi t)/2)
    for (int i = 0; i < 5; ++i) {
        const double t = -1.0 + 0.5 * i;
        const double f = 0.5 * (1.0 + t) * (1.0 + 0.5 * std::sin(CV_PI * t));
        cv::Mat row;
        cv::addWeighted(start, 1.0 - f, end, f, 0.0, row);
        cv::Mat dst = bgr8.row(y - 2 + i);
        row.convertTo(dst, CV_8U);
    }
}

/* |Sobel_y| above seamSigma standard deviations of its own response. */
static cv::Mat strongVerticalGradient(const cv::Mat& gray, int ksize, double sigma)
{
    cv::Mat e, a;
    cv::Sobel(gray, e, CV_32F, 0, 1, ksize);
    a = cv::abs(e);
    cv::Scalar mean, sd;
    cv::meanStdDev(e, mean, sd);
    cv::Mat mask = cv::Mat::zeros(gray.size(), CV_8U);
    if (sd[0] > 1e-3) cv::compare(a, sigma * sd[0], mask, cv::CMP_GT);
    return mask;
}

int removeSeams(cv::Mat& bgr8, const PostOptions& opt)
{
    if (bgr8.rows < 2 * opt.seamBorder + 1 || bgr8.cols < 8) return 0;

    const cv::Mat gray = toGray(bgr8);
    cv::Mat canny;
    cv::Canny(gray, canny, 30, 100);

    cv::Mat strong = strongVerticalGradient(gray, 3, opt.seamSigma)
                   | strongVerticalGradient(gray, 5, opt.seamSigma)
                   | canny;
    const cv::Mat kernel = cv::getStructuringElement(cv::MORPH_RECT, cv::Size(1, 7));
    cv::morphologyEx(strong, strong, cv::MORPH_CLOSE, kernel);

    std::vector<cv::Vec4i> lines;
    cv::HoughLinesP(strong, lines, 1, CV_PI / 180, 30, 50, 15);

    const double minLen = opt.minSeamFraction * bgr8.cols;
    std::set<int> rows;
    for (const auto& l : lines) {
        if (std::abs(l[3] - l[1]) >= 3) continue;
        if (std::abs(l[2] - l[0]) < minLen) continue;
        const int y = (l[1] + l[3]) / 2;
        if (y < opt.seamBorder || y >= bgr8.rows - opt.seamBorder) continue;
        rows.insert(y);
    }

    for (int y : rows) repairSeamRow(bgr8, y);
    if (!rows.empty()) logger()->debug("seam repair: {} rows", rows.size());
    return int(rows.size());
}

cv::Mat sharpen(const cv::Mat& bgr8, double sigma, double amount)
{
    cv::Mat blur, out;
    cv::GaussianBlur(bgr8, blur, cv::Size(0, 0), sigma);
    cv::addWeighted(bgr8, 1.0 + amount, blur, -amount, 0.0, out);
    return out;
}

cv::Mat colorBalance(const cv::Mat& bgr8)
{
    const cv::Scalar m = cv::mean(bgr8);
    const int cn = bgr8.channels();
    double target = 0.0;
    for (int c = 0; c < cn; ++c) target += m[c];
    target /= cn;

    cv::Scalar gain = cv::Scalar::all(1.0);
    for (int c = 0; c < cn; ++c) gain[c] = target / (m[c] + 1e-6);

    cv::Mat out;
    cv::multiply(bgr8, gain, out);
    return out;
}

cv::Mat fillHoles(const cv::Mat& bgr8, int threshold)
{
    cv::Mat mask;
    cv::compare(toGray(bgr8), threshold, mask, cv::CMP_LT);
    if (cv::countNonZero(mask) == 0) return bgr8.clone();

    cv::Mat out;
    cv::inpaint(bgr8, mask, out, 5, cv::INPAINT_TELEA);

    cv::compare(toGray(out), threshold / 2, mask, cv::CMP_LT);
    if (cv::countNonZero(mask) > 0) {
        cv::Mat again;
        cv::inpaint(out, mask, again, 3, cv::INPAINT_NS);
        out = again;
    }
    return out;
}

cv::Mat postProcess(const cv::Mat& bgr8, const PostOptions& opt)
{
    if (bgr8.empty()) return {};
    CV_Assert(bgr8.type() == CV_8UC3);

    cv::Mat img = opt.crop ? cropValid(bgr8, opt.nearBlack) : bgr8.clone();
    if (opt.removeSeams) removeSeams(img, opt);
    if (opt.sharpen)     img = sharpen(img, opt.sharpenSigma, opt.sharpenAmount);
    if (opt.colorBalance) img = colorBalance(img);
    if (opt.fillHoles)   img = fillHoles(img, opt.holeThreshold);
    return img;
}

} // namespace borestitch
