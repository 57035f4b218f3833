#include "borestitch/unwrap/PolarUnwrapper.hpp"
#include "borestitch/core/Errors.hpp"
#include "borestitch/core/Log.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>

namespace borestitch {

AxisCenter UnwrapSession::axisFor(const cv::Mat& frame, const UnwrapOptions& opt)
{
    if (locked_ && cached_) return *cached_;
    if (opt.cacheAxis && cached_ && cached_->confidence >= opt.redetectBelow) return *cached_;

    AxisCenter a = detectAxis(frame, opt.axis);
    ++detections_;
    if (opt.cacheAxis) cached_ = a;
    return a;
}

AxisCenter UnwrapSession::calibrate(const std::vector<cv::Mat>& frames, const UnwrapOptions& opt, std::size_t n)
{
    if (frames.empty()) throw InputError("axis calibration needs at least one frame");
    if (n == 0) n = opt.calibrationFrames;
    n = std::min(std::max<std::size_t>(n, 1), frames.size());

    cv::Point2d sum(0, 0);
    double conf = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        const AxisCenter a = detectAxis(frames[i], opt.axis);
        ++detections_;
        sum += a.center;
        conf += a.confidence;
    }

    AxisCenter avg;
    avg.center = cv::Point2d(std::floor(sum.x / double(n)), std::floor(sum.y / double(n)));
    avg.confidence = conf / double(n);
    cached_ = avg;
    locked_ = true;

    logger()->info("axis calibrated on {} frames: ({}, {}), confidence {:.3f}",
                   n, avg.center.x, avg.center.y, avg.confidence);
    return avg;
}

void UnwrapSession::reset()
{
    cached_.reset();
    locked_ = false;
}

void annulusRadii(cv::Size size, cv::Point2d center, const UnwrapOptions& opt,
                  double& outer, double& inner)
{
    const double toEdge = std::min({center.x, double(size.width) - center.x,
                                    center.y, double(size.height) - center.y});
    outer = std::floor(toEdge - opt.outerMargin);
    inner = std::floor(outer / std::max(1.0, opt.innerRatio));
}

/* Build sampling maps as outer products: column vector of radii times row
   vector of cos / sin of the angles. */
UnwrapResult unwrapAround(const cv::Mat& frame, const AxisCenter& axis, const UnwrapOptions& opt)
{
    if (frame.empty()) throw InputError("cannot unwrap an empty frame");

    UnwrapResult out;
    out.axis = axis;
    annulusRadii(frame.size(), axis.center, opt, out.outer, out.inner);
    if (out.outer < 2.0 || out.outer - out.inner < 1.0)
        throw InputError("frame too small to unwrap around the detected axis");

    const int W = int(std::ceil(2.0 * CV_PI * out.outer));
    const int H = opt.outputHeight > 0 ? opt.outputHeight : int(std::ceil(out.outer - out.inner));

    cv::Mat cosT(1, W, CV_32F), sinT(1, W, CV_32F), rad(H, 1, CV_32F);
    for (int u = 0; u < W; ++u) {
        const double t = 2.0 * CV_PI * u / W;
        cosT.at<float>(0, u) = float(std::cos(t));
        sinT.at<float>(0, u) = float(std::sin(t));
    }
    for (int v = 0; v < H; ++v)
        rad.at<float>(v, 0) = float(out.inner + double(v) / H * (out.outer - out.inner));

    cv::Mat mapX = rad * cosT + axis.center.x;
    cv::Mat mapY = rad * sinT + axis.center.y;
    cv::max(mapX, 0.0, mapX);
    cv::min(mapX, double(frame.cols - 1), mapX);
    cv::max(mapY, 0.0, mapY);
    cv::min(mapY, double(frame.rows - 1), mapY);

    cv::remap(frame, out.image, mapX, mapY, cv::INTER_LINEAR, cv::BORDER_REPLICATE);
    if (opt.rotate180) cv::rotate(out.image, out.image, cv::ROTATE_180);
    return out;
}

UnwrapResult unwrap(const cv::Mat& frame, UnwrapSession& session, const UnwrapOptions& opt)
{
    return unwrapAround(frame, session.axisFor(frame, opt), opt);
}

cv::Mat rewrap(const cv::Mat& unwrapped, cv::Point2d center, double outer, double inner,
               cv::Size frameSize, bool rotated180)
{
    CV_Assert(!unwrapped.empty() && outer > inner);

    cv::Mat upright;
    if (rotated180) cv::rotate(unwrapped, upright, cv::ROTATE_180);
    else upright = unwrapped;
    const int W = upright.cols, H = upright.rows;
    // repeat column 0 after the last one so angles close the circle
    cv::Mat src;
    cv::hconcat(upright, upright.col(0), src);

    cv::Mat xs(1, frameSize.width, CV_32F), ys(frameSize.height, 1, CV_32F);
    for (int x = 0; x < frameSize.width; ++x) xs.at<float>(0, x) = float(x - center.x);
    for (int y = 0; y < frameSize.height; ++y) ys.at<float>(y, 0) = float(y - center.y);
    cv::Mat dx, dy;
    cv::repeat(xs, frameSize.height, 1, dx);
    cv::repeat(ys, 1, frameSize.width, dy);

    cv::Mat r, theta;
    cv::cartToPolar(dx, dy, r, theta);   // theta in [0, 2*pi)

    cv::Mat mapX = theta * (W / (2.0 * CV_PI));
    cv::Mat mapY = (r - inner) * (H / (outer - inner));

    cv::Mat out;
    cv::remap(src, out, mapX, mapY, cv::INTER_LINEAR, cv::BORDER_CONSTANT, cv::Scalar::all(0));

    cv::Mat inside = (r >= inner) & (r < outer);
    cv::Mat result = cv::Mat::zeros(out.size(), out.type());
    out.copyTo(result, inside);
    return result;
}

} // namespace borestitch
